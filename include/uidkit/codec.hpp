#pragma once

#include <uidkit/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uidkit {

inline constexpr size_t UUID_SIZE = 16;

using UuidBytes = std::array<uint8_t, UUID_SIZE>;

namespace codec {

// Lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx from 4-2-2-2-6 byte groups.
std::string encode(const UuidBytes& bytes);

// Drops the four hyphens of a canonical string. Returns "" for "" and
// leaves strings that are not 36 characters long untouched, so that a
// later decode_hex reports them.
std::string to_hash_like(const std::string& canonical);

// Inserts hyphens into a 32-character string at 8, 12, 16 and 20.
// Anything past the 32nd character is dropped.
std::string hash_to_canonical(const std::string& hash);

// 32 hex digits (either case) to bytes.
Result<UuidBytes> decode_hex(const std::string& hash);

// Canonical string to bytes. Hyphen placement is checked before any
// group is decoded.
Result<UuidBytes> decode_canonical(const std::string& canonical);

} // namespace codec
} // namespace uidkit
