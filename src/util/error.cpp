#include <vernum/error.hpp>

namespace vernum {

const char* VernumError::code_name(Code c) {
    switch (c) {
        case MalformedVersion: return "MalformedVersion";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case Toolbox:          return "Toolbox";
        case NotFound:         return "NotFound";
        case IO:               return "IO";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

std::string VernumError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!subject.empty()) {
        result += " ('";
        result += subject;
        result += "')";
    }

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

} // namespace vernum
