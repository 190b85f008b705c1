#pragma once

#include <string>

namespace vernum {

struct VernumError {
    enum Code {
        MalformedVersion,
        Parse,
        Config,
        Toolbox,
        NotFound,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string subject;  // offending input or field name
    std::string hint;
    std::string file;
    int line = 0;

    VernumError() = default;
    VernumError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VernumError(Code c, std::string msg, std::string subj)
        : code(c), message(std::move(msg)), subject(std::move(subj)) {}
    VernumError(Code c, std::string msg, std::string subj, std::string h)
        : code(c), message(std::move(msg)), subject(std::move(subj)),
          hint(std::move(h)) {}

    VernumError& at(std::string f, int l) {
        file = std::move(f);
        line = l;
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace vernum
