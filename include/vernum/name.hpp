#pragma once

#include <vernum/result.hpp>
#include <string>

namespace vernum {

// Toolbox name: [a-zA-Z][a-zA-Z0-9_]*, at most kMaxLength characters.
// Names double as file and variable names, so they are case-sensitive and
// never normalized.
class ToolboxName {
public:
    static constexpr size_t kMaxLength = 63;

    static Result<ToolboxName> parse(const std::string& raw);

    const std::string& str() const { return raw_; }

    bool operator==(const ToolboxName& o) const { return raw_ == o.raw_; }
    bool operator!=(const ToolboxName& o) const { return raw_ != o.raw_; }

private:
    std::string raw_;
};

} // namespace vernum
