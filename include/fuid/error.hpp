#pragma once

#include <string>

namespace fuid {

struct FuidError {
    enum Code {
        InvalidCharacter,
        EmptyInput,
        Overflow,
        OutOfRange,
        InvalidFormat,
        RandomSourceError,
        InvalidArg,
        IO,
        Config,
        Parse
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    FuidError() = default;
    FuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    FuidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace fuid
