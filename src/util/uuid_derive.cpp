#include <uidkit/uuid.hpp>

namespace uidkit {

static constexpr size_t PAYLOAD_LEN = 14;

// 908070605040302010203040506070809, a 14-byte odd constant. Any odd
// addend walks the whole payload space; this one is fixed so successors
// are identical everywhere.
static constexpr uint8_t NEXT_ADDEND[PAYLOAD_LEN] = {
    0x2c, 0xc5, 0x76, 0x5f, 0x51, 0x92, 0x18,
    0x38, 0x27, 0x8e, 0xaa, 0xf6, 0x47, 0x19,
};
static_assert(NEXT_ADDEND[0] != 0, "addend must use all 14 bytes");
static_assert(NEXT_ADDEND[PAYLOAD_LEN - 1] & 1, "addend must be odd");

// Big-endian add-with-carry. The final carry is dropped, which truncates
// the sum to its low-order 14 bytes.
static void add_in_place(uint8_t* num, const uint8_t* addend, size_t len) {
    unsigned carry = 0;
    for (size_t i = len; i-- > 0; ) {
        unsigned sum = static_cast<unsigned>(num[i]) + addend[i] + carry;
        num[i] = static_cast<uint8_t>(sum & 0xFF);
        carry = sum >> 8;
    }
}

Result<Uuid> Uuid::next() const {
    if (is_nil()) {
        return Result<Uuid>::ok(Uuid());
    }

    auto decoded = bytes();
    if (decoded.is_err()) {
        return UidError{UidError::InvalidFormat, "invalid uuid: " + value_};
    }
    const UuidBytes& b = decoded.value();

    // Bytes 6 and 8 carry the version and variant bits, leave them out
    uint8_t payload[PAYLOAD_LEN];
    size_t n = 0;
    for (size_t i = 0; i < UUID_SIZE; ++i) {
        if (i == 6 || i == 8) continue;
        payload[n++] = b[i];
    }

    add_in_place(payload, NEXT_ADDEND, PAYLOAD_LEN);

    UuidBytes out{};
    n = 0;
    for (size_t i = 0; i < UUID_SIZE; ++i) {
        out[i] = (i == 6 || i == 8) ? b[i] : payload[n++];
    }
    return Result<Uuid>::ok(Uuid(codec::encode(out)));
}

Result<Uuid> Uuid::xor_with(const Uuid& other) const {
    if (is_nil() || other.is_nil()) {
        return Result<Uuid>::ok(Uuid());
    }

    auto lhs = bytes();
    if (lhs.is_err()) {
        return UidError{UidError::InvalidFormat,
            "invalid left side parameter: " + value_};
    }
    auto rhs = other.bytes();
    if (rhs.is_err()) {
        return UidError{UidError::InvalidFormat,
            "invalid right side parameter: " + other.value_};
    }

    UuidBytes out{};
    for (size_t i = 0; i < UUID_SIZE; ++i) {
        out[i] = static_cast<uint8_t>(lhs.value()[i] ^ rhs.value()[i]);
    }
    return Result<Uuid>::ok(stamp_v4(out));
}

} // namespace uidkit
