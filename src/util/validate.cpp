#include <uidkit/validate.hpp>

namespace uidkit {

bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') ||
           (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

bool is_valid_uuid(const std::string& s) {
    if (s.size() != 36) return false;

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (i) {
            case 8: case 13: case 18: case 23:
                if (c != '-') return false;
                break;
            case 14:
                // version
                if (c < '1' || c > '5') return false;
                break;
            case 19:
                // variant 10xx
                if (c != '8' && c != '9' &&
                    c != 'a' && c != 'A' && c != 'b' && c != 'B') {
                    return false;
                }
                break;
            default:
                if (!is_hex_digit(c)) return false;
        }
    }
    return true;
}

} // namespace uidkit
