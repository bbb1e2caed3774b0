#include <uidkit/uuid.hpp>
#include <uidkit/log.hpp>

namespace uidkit {

uint64_t timestamp_ms(TimePoint t) {
    return static_cast<uint64_t>(t.time_since_epoch().count());
}

uint64_t timestamp_ms(std::chrono::system_clock::time_point t) {
    return timestamp_ms(std::chrono::time_point_cast<std::chrono::milliseconds>(t));
}

TimePoint time_from_ms(uint64_t ms) {
    return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(ms)));
}

uint64_t max_time_ms() {
    // Highest timestamp bytes with valid version and variant nibbles
    static const uint64_t max_ms = [] {
        auto ref = Uuid::from_string("ffffffff-ffff-1000-a000-000000000000");
        return timestamp_ms(ref.value().time_uuid_to_time().value());
    }();
    return max_ms;
}

Uuid Uuid::v4() {
    return v4(system_random());
}

Uuid Uuid::v4(RandomSource& rng) {
    UuidBytes b{};
    fill_random_or_die(rng, b.data(), b.size());
    return stamp_v4(b);
}

Uuid Uuid::new_time(TimePoint t) {
    return new_time(t, system_random());
}

Uuid Uuid::new_time(TimePoint t, RandomSource& rng) {
    UuidBytes b{};
    fill_random_or_die(rng, b.data() + 6, b.size() - 6);

    uint64_t ms = timestamp_ms(t);
    if (ms > max_time_ms()) {
        log::error("timestamp %llu ms does not fit a time uuid",
                   static_cast<unsigned long long>(ms));
        throw FatalError(UidError{UidError::Range,
            "time too big: " + std::to_string(ms) + " ms",
            "time uuids hold at most " + std::to_string(max_time_ms()) + " ms"});
    }

    for (int i = 0; i < 6; ++i) {
        b[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));
    }
    return stamp_v4(b);
}

Result<TimePoint> Uuid::time_uuid_to_time() const {
    auto b = bytes();
    if (b.is_err()) return std::move(b).error();

    uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | b.value()[i];
    }
    return Result<TimePoint>::ok(time_from_ms(ms));
}

} // namespace uidkit
