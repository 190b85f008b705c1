#pragma once

#include <vernum/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vernum {

enum class Ordering { Less = -1, Equal = 0, Greater = 1 };

// Semantic Versioning 2.0 value: MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD]
//
// A Version is always valid and never changes after construction; obtain one
// through parse() or from_parts(). The relational operators and compare()
// implement semver precedence, which ignores build metadata. operator== is
// full value identity and does look at build metadata, so "1.0.0+a" and
// "1.0.0+b" are precedence_equal() but not ==.
class Version {
public:
    using Identifiers = std::vector<std::string>;

    Version() = default;  // 0.0.0

    // The whole string must match the grammar and render back unchanged.
    static Result<Version> parse(const std::string& s);

    // Empty identifier lists mean "no prerelease" / "no build metadata".
    // Errors name the offending field in VernumError::subject.
    static Result<Version> from_parts(uint64_t major, uint64_t minor,
                                      uint64_t patch,
                                      Identifiers prerelease = {},
                                      Identifiers build = {});

    uint64_t major() const { return major_; }
    uint64_t minor() const { return minor_; }
    uint64_t patch() const { return patch_; }
    const Identifiers& prerelease() const { return prerelease_; }
    const Identifiers& build() const { return build_; }

    bool is_prerelease() const { return !prerelease_.empty(); }

    std::string prerelease_string() const;
    std::string build_string() const;

    // Canonical form; exact inverse of parse()
    std::string to_string() const;

    // Bumps clear prerelease and build metadata. They fail only when the
    // bumped component is already at its maximum.
    Result<Version> next_major() const;
    Result<Version> next_minor() const;
    Result<Version> next_patch() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;

private:
    uint64_t major_ = 0;
    uint64_t minor_ = 0;
    uint64_t patch_ = 0;
    Identifiers prerelease_;
    Identifiers build_;
};

// Semver precedence; build metadata is never consulted.
Ordering compare(const Version& a, const Version& b);

// Equal precedence, i.e. compare(a, b) == Ordering::Equal
bool precedence_equal(const Version& a, const Version& b);

// Stable: versions of equal precedence keep their input order.
std::vector<Version> sort_ascending(std::vector<Version> versions);

} // namespace vernum
