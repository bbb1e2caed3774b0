#pragma once

#include <string>

namespace uidkit {

inline const char NIL_CANONICAL[] = "00000000-0000-0000-0000-000000000000";
inline const char NIL_HASH_LIKE[] = "00000000000000000000000000000000";

// Case-insensitive match of
//   [0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}
// i.e. shape, hex digits, version 1-5 and the RFC 4122 variant together.
bool is_valid_uuid(const std::string& s);

bool is_hex_digit(char c);

} // namespace uidkit
