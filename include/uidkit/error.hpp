#pragma once

#include <stdexcept>
#include <string>

namespace uidkit {

struct UidError {
    enum Code {
        InvalidFormat,
        UnsupportedType,
        Random,
        Range,
        IO,
        Parse,
        Database
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    UidError() = default;
    UidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    UidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

// Raised for environment faults that have no recovery path: a broken
// secure random source, or a timestamp that does not fit a time UUID.
class FatalError : public std::runtime_error {
public:
    explicit FatalError(UidError err)
        : std::runtime_error(err.format()), error_(std::move(err)) {}

    const UidError& error() const { return error_; }

private:
    UidError error_;
};

} // namespace uidkit
