#include <uidkit/codec.hpp>

namespace uidkit::codec {

static const char hex_chars[] = "0123456789abcdef";

// Hex digits per group of the canonical form
static constexpr size_t GROUPS[] = {8, 4, 4, 4, 12};

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static UidError invalid(const std::string& input, std::string hint) {
    return UidError(UidError::InvalidFormat, "invalid uuid: " + input,
                    std::move(hint));
}

std::string encode(const UuidBytes& bytes) {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < UUID_SIZE; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

std::string to_hash_like(const std::string& canonical) {
    if (canonical.size() != 36) return canonical;
    return canonical.substr(0, 8) + canonical.substr(9, 4) +
           canonical.substr(14, 4) + canonical.substr(19, 4) +
           canonical.substr(24);
}

std::string hash_to_canonical(const std::string& hash) {
    std::string out;
    out.reserve(hash.size() + 4);
    size_t pos = 0;
    for (size_t g = 0; g < 5 && pos < hash.size(); ++g) {
        if (g > 0) out += '-';
        out += hash.substr(pos, GROUPS[g]);
        pos += GROUPS[g];
    }
    return out;
}

Result<UuidBytes> decode_hex(const std::string& hash) {
    if (hash.size() != 2 * UUID_SIZE) {
        return invalid(hash, "expected 32 hex digits, got " +
                             std::to_string(hash.size()) + " characters");
    }
    UuidBytes out{};
    for (size_t i = 0; i < UUID_SIZE; ++i) {
        int hi = hex_val(hash[2 * i]);
        int lo = hex_val(hash[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return invalid(hash, "invalid hex character near position " +
                                 std::to_string(2 * i));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<UuidBytes>::ok(out);
}

Result<UuidBytes> decode_canonical(const std::string& canonical) {
    if (canonical.size() != 36 ||
        canonical[8] != '-' || canonical[13] != '-' ||
        canonical[18] != '-' || canonical[23] != '-') {
        return invalid(canonical, "expected hyphens at positions 8, 13, 18, 23");
    }

    UuidBytes out{};
    size_t src = 0;
    size_t dst = 0;
    for (size_t g = 0; g < 5; ++g) {
        if (g > 0) ++src;  // skip hyphen
        for (size_t k = 0; k < GROUPS[g]; k += 2) {
            int hi = hex_val(canonical[src + k]);
            int lo = hex_val(canonical[src + k + 1]);
            if (hi < 0 || lo < 0) {
                return invalid(canonical, "invalid hex character at position " +
                                          std::to_string(src + k));
            }
            out[dst++] = static_cast<uint8_t>((hi << 4) | lo);
        }
        src += GROUPS[g];
    }
    return Result<UuidBytes>::ok(out);
}

} // namespace uidkit::codec
