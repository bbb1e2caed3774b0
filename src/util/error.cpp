#include <uidkit/error.hpp>

namespace uidkit {

const char* UidError::code_name(Code c) {
    switch (c) {
        case InvalidFormat:   return "InvalidFormat";
        case UnsupportedType: return "UnsupportedType";
        case Random:          return "Random";
        case Range:           return "Range";
        case IO:              return "IO";
        case Parse:           return "Parse";
        case Database:        return "Database";
    }
    return "Unknown";
}

std::string UidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace uidkit
