#include <fuid/error.hpp>

namespace fuid {

const char* FuidError::code_name(Code c) {
    switch (c) {
        case InvalidCharacter:  return "InvalidCharacter";
        case EmptyInput:        return "EmptyInput";
        case Overflow:          return "Overflow";
        case OutOfRange:        return "OutOfRange";
        case InvalidFormat:     return "InvalidFormat";
        case RandomSourceError: return "RandomSourceError";
        case InvalidArg:        return "InvalidArg";
        case IO:                return "IO";
        case Config:            return "Config";
        case Parse:             return "Parse";
    }
    return "Unknown";
}

std::string FuidError::format() const {
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

} // namespace fuid
