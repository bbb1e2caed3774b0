#pragma once

#include <uidkit/codec.hpp>
#include <uidkit/random.hpp>
#include <uidkit/result.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace uidkit {

// Millisecond resolution: a nanosecond system_clock point cannot hold the
// full 48-bit millisecond range of a time-ordered UUID.
using TimePoint = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

// Immutable UUID value, held as its lowercase canonical string.
// The nil UUID is the empty string.
class Uuid {
public:
    Uuid() = default;

    // Canonical form, either case. "" and the all-zero UUID give nil.
    static Result<Uuid> from_string(const std::string& s);

    // 32 hex digits without hyphens. "" and 32 zeros give nil.
    static Result<Uuid> from_hash_like(const std::string& s);

    // Wraps s without any validation. Operations that decode the bytes
    // report InvalidFormat if s turns out to be malformed.
    static Uuid unchecked(std::string s);

    // Random version 4 UUID. A failing random source raises FatalError.
    static Uuid v4();
    static Uuid v4(RandomSource& rng);

    // Time-ordered UUID: 48-bit big-endian millisecond timestamp in bytes
    // 0-5, random bytes 6-15, version nibble 4 and RFC 4122 variant.
    // Bytes 6 and 8 keep only their untagged bits of randomness, so these
    // collide more easily than v4 values generated in the same millisecond.
    // Raises FatalError for timestamps above max_time_ms().
    static Uuid new_time(TimePoint t);
    static Uuid new_time(TimePoint t, RandomSource& rng);

    bool is_nil() const { return value_.empty(); }
    const std::string& to_string() const { return value_; }
    std::string hash_like() const;

    Result<UuidBytes> bytes() const;

    // Reads the timestamp back out of a time-ordered UUID. Only meaningful
    // for values made by new_time(): any other UUID yields an arbitrary
    // but well-formed instant.
    Result<TimePoint> time_uuid_to_time() const;

    // Deterministic successor. The version and variant bytes are carried
    // over from this value. nil -> nil.
    Result<Uuid> next() const;

    // Bytewise XOR, re-stamped as version 4 / RFC 4122. nil if either side
    // is nil.
    Result<Uuid> xor_with(const Uuid& other) const;

    bool operator==(const Uuid& other) const { return value_ == other.value_; }
    bool operator!=(const Uuid& other) const { return value_ != other.value_; }

private:
    explicit Uuid(std::string canonical) : value_(std::move(canonical)) {}

    static Uuid stamp_v4(UuidBytes bytes);

    std::string value_;
};

// Milliseconds since the Unix epoch, truncated.
uint64_t timestamp_ms(TimePoint t);
uint64_t timestamp_ms(std::chrono::system_clock::time_point t);

// Inverse of timestamp_ms.
TimePoint time_from_ms(uint64_t ms);

// Largest timestamp a time-ordered UUID can carry; computed once.
uint64_t max_time_ms();

} // namespace uidkit
