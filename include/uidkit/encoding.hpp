#pragma once

#include <uidkit/result.hpp>
#include <uidkit/uuid.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace uidkit {

// Text, JSON and binary adapters. The unmarshal functions write the
// decoded value into `out` only on success.

std::string marshal_text(const Uuid& u);
Status unmarshal_text(const std::string& text, Uuid& out);

// Quoted canonical string; nil is "".
std::string marshal_json(const Uuid& u);

// Accepts a JSON string literal or null. null leaves `out` unchanged.
Status unmarshal_json(const std::string& json, Uuid& out);

// Same payload as the text form, not the packed 16 bytes.
std::vector<uint8_t> marshal_binary(const Uuid& u);
Status unmarshal_binary(const std::vector<uint8_t>& data, Uuid& out);

} // namespace uidkit
