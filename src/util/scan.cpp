#include <vernum/scan.hpp>
#include <vernum/log.hpp>
#include <sstream>

namespace vernum {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_candidate_char(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           c == '-' || c == '.' || c == '+';
}

static bool is_separator(char c) {
    return c == '-' || c == '.' || c == '+';
}

// Trailing separators belong to the surrounding prose ("see 1.2.3.")
static std::string trim_separators(std::string s) {
    while (!s.empty() && is_separator(s.back())) s.pop_back();
    return s;
}

static Result<Version> scan_line(const std::string& line, int line_no) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (!is_digit(line[i])) continue;
        if (i > 0 && (is_digit(line[i - 1]) || line[i - 1] == '.')) continue;

        size_t end = i;
        while (end < line.size() && is_candidate_char(line[end])) ++end;

        std::string candidate = trim_separators(line.substr(i, end - i));
        auto v = Version::parse(candidate);
        if (v.is_ok()) return v;

        log::debug("line %d: skipping '%s': %s", line_no, candidate.c_str(),
                   v.error().message.c_str());
    }
    return VernumError{VernumError::NotFound, "no semantic version on line"};
}

Result<Version> find_first_version(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        auto v = scan_line(line, line_no);
        if (v.is_ok()) return v;
    }

    return VernumError{VernumError::NotFound,
        "no semantic version found in text", "",
        "expected MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD] somewhere in the input"};
}

} // namespace vernum
