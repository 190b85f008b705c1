#include <vernum/name.hpp>

namespace vernum {

static bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool is_ascii_alnum(char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

Result<ToolboxName> ToolboxName::parse(const std::string& raw) {
    if (raw.empty()) {
        return VernumError{VernumError::Toolbox, "empty toolbox name"};
    }

    if (!is_ascii_alpha(raw[0])) {
        return VernumError{VernumError::Toolbox,
            "invalid toolbox name", raw,
            "toolbox names must start with a letter"};
    }

    if (raw.size() > kMaxLength) {
        return VernumError{VernumError::Toolbox,
            "toolbox name is too long", raw,
            "at most " + std::to_string(kMaxLength) + " characters"};
    }

    for (size_t i = 1; i < raw.size(); ++i) {
        char c = raw[i];
        if (!is_ascii_alnum(c) && c != '_') {
            return VernumError{VernumError::Toolbox,
                "invalid character '" + std::string(1, c) + "' in toolbox name",
                raw, "allowed: [a-zA-Z0-9_]"};
        }
    }

    ToolboxName name;
    name.raw_ = raw;
    return Result<ToolboxName>::ok(std::move(name));
}

} // namespace vernum
