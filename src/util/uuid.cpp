#include <uidkit/uuid.hpp>
#include <uidkit/validate.hpp>
#include <algorithm>
#include <cctype>

namespace uidkit {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    return s;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.empty() || s == NIL_CANONICAL) {
        return Result<Uuid>::ok(Uuid());
    }

    if (!is_valid_uuid(s)) {
        return UidError{UidError::InvalidFormat,
            "invalid uuid: " + s,
            "expected xxxxxxxx-xxxx-Mxxx-Nxxx-xxxxxxxxxxxx with M in 1-5 and N in 8,9,a,b"};
    }

    return Result<Uuid>::ok(Uuid(to_lower(s)));
}

Result<Uuid> Uuid::from_hash_like(const std::string& s) {
    if (s.empty() || s == NIL_HASH_LIKE) {
        return Result<Uuid>::ok(Uuid());
    }

    if (s.size() != 32) {
        return UidError{UidError::InvalidFormat,
            "invalid uuid: " + s,
            "hash-like form is 32 hex digits, got " +
            std::to_string(s.size()) + " characters"};
    }

    std::string canonical = codec::hash_to_canonical(s);
    if (!is_valid_uuid(canonical)) {
        return UidError{UidError::InvalidFormat, "invalid uuid: " + s};
    }

    return Result<Uuid>::ok(Uuid(to_lower(std::move(canonical))));
}

Uuid Uuid::unchecked(std::string s) {
    return Uuid(std::move(s));
}

std::string Uuid::hash_like() const {
    return codec::to_hash_like(value_);
}

Result<UuidBytes> Uuid::bytes() const {
    return codec::decode_canonical(value_);
}

Uuid Uuid::stamp_v4(UuidBytes b) {
    // version 4 in the high nibble of byte 6
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    // RFC 4122 variant: top two bits of byte 8 are 10
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
    return Uuid(codec::encode(b));
}

} // namespace uidkit
