#include <vernum/version.hpp>
#include <algorithm>
#include <limits>
#include <string_view>
#include <variant>

namespace vernum {

static const char* const kTooFewComponents =
    "fewer than three numeric components";
static const char* const kPrereleaseChars =
    "prerelease identifier contains disallowed characters";
static const char* const kPrereleaseLeadingZero =
    "prerelease numeric identifier has a leading zero";
static const char* const kBuildChars =
    "build identifier contains disallowed characters";
static const char* const kNoRoundTrip =
    "input did not round-trip to the same canonical string";

// ---------------------------------------------------------------------------
// Lexical helpers
// ---------------------------------------------------------------------------

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// [0-9A-Za-z-], ASCII only regardless of locale
static bool is_identifier_char(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           c == '-';
}

static bool is_numeric(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), is_digit);
}

static bool is_identifier(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), is_identifier_char);
}

// Reads a run of decimal digits at pos. Returns false if there is none.
// `overflow` is set when the run does not fit in 64 bits.
static bool read_number(const std::string& s, size_t& pos, uint64_t& out,
                        bool& overflow) {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    size_t start = pos;
    out = 0;
    while (pos < s.size() && is_digit(s[pos])) {
        uint64_t d = static_cast<uint64_t>(s[pos] - '0');
        if (out > (kMax - d) / 10) {
            overflow = true;
        } else {
            out = out * 10 + d;
        }
        ++pos;
    }
    return pos > start;
}

// Splits on '.', keeping empty pieces so that "a..b" and "" are rejected
static Version::Identifiers split_identifiers(const std::string& s) {
    Version::Identifiers ids;
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        if (dot == std::string::npos) {
            ids.push_back(s.substr(start));
            break;
        }
        ids.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
    return ids;
}

static std::string join_identifiers(const Version::Identifiers& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += '.';
        out += ids[i];
    }
    return out;
}

static Status check_prerelease(const Version::Identifiers& ids,
                               const std::string& subject) {
    for (const auto& id : ids) {
        if (!is_identifier(id)) {
            return VernumError{VernumError::MalformedVersion, kPrereleaseChars,
                subject, "identifiers must be non-empty and match [0-9A-Za-z-]"};
        }
        if (is_numeric(id) && id.size() > 1 && id[0] == '0') {
            return VernumError{VernumError::MalformedVersion,
                kPrereleaseLeadingZero, subject,
                "offending identifier '" + id + "'"};
        }
    }
    return ok_status();
}

static Status check_build(const Version::Identifiers& ids,
                          const std::string& subject) {
    for (const auto& id : ids) {
        if (!is_identifier(id)) {
            return VernumError{VernumError::MalformedVersion, kBuildChars,
                subject, "identifiers must be non-empty and match [0-9A-Za-z-]"};
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    Version v;
    size_t pos = 0;
    bool overflow = false;

    uint64_t* fields[] = {&v.major_, &v.minor_, &v.patch_};
    for (int i = 0; i < 3; ++i) {
        if (i > 0) {
            if (pos >= s.size() || s[pos] != '.') {
                return VernumError{VernumError::MalformedVersion,
                    kTooFewComponents, s,
                    "expected format: MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD]"};
            }
            ++pos;
        }
        if (!read_number(s, pos, *fields[i], overflow)) {
            return VernumError{VernumError::MalformedVersion,
                kTooFewComponents, s,
                "expected format: MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD]"};
        }
    }
    if (overflow) {
        return VernumError{VernumError::MalformedVersion, kNoRoundTrip, s,
            "numeric components must fit in 64 bits"};
    }

    if (pos < s.size() && s[pos] == '-') {
        size_t plus = s.find('+', pos + 1);
        size_t end = plus == std::string::npos ? s.size() : plus;
        v.prerelease_ = split_identifiers(s.substr(pos + 1, end - pos - 1));
        VERNUM_TRY(check_prerelease(v.prerelease_, s));
        pos = end;
    }

    if (pos < s.size() && s[pos] == '+') {
        v.build_ = split_identifiers(s.substr(pos + 1));
        VERNUM_TRY(check_build(v.build_, s));
        pos = s.size();
    }

    // Catches leading zeros in the core, trailing text and other permutations
    // the tokenizer lets through.
    if (v.to_string() != s) {
        return VernumError{VernumError::MalformedVersion, kNoRoundTrip, s,
            "canonical form is '" + v.to_string() + "'"};
    }

    return Result<Version>::ok(std::move(v));
}

Result<Version> Version::from_parts(uint64_t major, uint64_t minor,
                                    uint64_t patch, Identifiers prerelease,
                                    Identifiers build) {
    VERNUM_TRY(check_prerelease(prerelease, "prerelease"));
    VERNUM_TRY(check_build(build, "build"));

    Version v;
    v.major_ = major;
    v.minor_ = minor;
    v.patch_ = patch;
    v.prerelease_ = std::move(prerelease);
    v.build_ = std::move(build);
    return Result<Version>::ok(std::move(v));
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string Version::prerelease_string() const {
    return join_identifiers(prerelease_);
}

std::string Version::build_string() const {
    return join_identifiers(build_);
}

std::string Version::to_string() const {
    std::string s = std::to_string(major_) + "." +
                    std::to_string(minor_) + "." +
                    std::to_string(patch_);
    if (!prerelease_.empty()) {
        s += "-" + prerelease_string();
    }
    if (!build_.empty()) {
        s += "+" + build_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// Bumps
// ---------------------------------------------------------------------------

static VernumError bump_overflow(const char* field, const Version& v) {
    return VernumError{VernumError::InvalidArg,
        std::string(field) + " version is already at its maximum",
        v.to_string()};
}

Result<Version> Version::next_major() const {
    if (major_ == std::numeric_limits<uint64_t>::max()) {
        return bump_overflow("major", *this);
    }
    return from_parts(major_ + 1, 0, 0);
}

Result<Version> Version::next_minor() const {
    if (minor_ == std::numeric_limits<uint64_t>::max()) {
        return bump_overflow("minor", *this);
    }
    return from_parts(major_, minor_ + 1, 0);
}

Result<Version> Version::next_patch() const {
    if (patch_ == std::numeric_limits<uint64_t>::max()) {
        return bump_overflow("patch", *this);
    }
    return from_parts(major_, minor_, patch_ + 1);
}

// ---------------------------------------------------------------------------
// Precedence
// ---------------------------------------------------------------------------

namespace {

struct NumericId {
    std::string_view digits;  // no leading zeros, so length orders first
};

using TaggedId = std::variant<NumericId, std::string_view>;

TaggedId classify(const std::string& id) {
    if (is_numeric(id)) return NumericId{id};
    return std::string_view(id);
}

template <typename T>
Ordering three_way(const T& a, const T& b) {
    if (a < b) return Ordering::Less;
    if (b < a) return Ordering::Greater;
    return Ordering::Equal;
}

Ordering compare_ids(const TaggedId& a, const TaggedId& b) {
    const auto* na = std::get_if<NumericId>(&a);
    const auto* nb = std::get_if<NumericId>(&b);
    if (na && nb) {
        if (na->digits.size() != nb->digits.size()) {
            return three_way(na->digits.size(), nb->digits.size());
        }
        return three_way(na->digits, nb->digits);
    }
    // Numeric identifiers always have lower precedence than alphanumeric ones
    if (na) return Ordering::Less;
    if (nb) return Ordering::Greater;
    return three_way(std::get<std::string_view>(a),
                     std::get<std::string_view>(b));
}

Ordering compare_prerelease(const Version::Identifiers& a,
                            const Version::Identifiers& b) {
    // A release outranks any prerelease of the same core version
    if (a.empty() || b.empty()) {
        return three_way(b.size(), a.size());
    }

    std::vector<TaggedId> ta, tb;
    ta.reserve(a.size());
    tb.reserve(b.size());
    for (const auto& id : a) ta.push_back(classify(id));
    for (const auto& id : b) tb.push_back(classify(id));

    size_t n = std::min(ta.size(), tb.size());
    for (size_t i = 0; i < n; ++i) {
        Ordering o = compare_ids(ta[i], tb[i]);
        if (o != Ordering::Equal) return o;
    }
    return three_way(ta.size(), tb.size());
}

} // namespace

Ordering compare(const Version& a, const Version& b) {
    if (a.major() != b.major()) return three_way(a.major(), b.major());
    if (a.minor() != b.minor()) return three_way(a.minor(), b.minor());
    if (a.patch() != b.patch()) return three_way(a.patch(), b.patch());
    return compare_prerelease(a.prerelease(), b.prerelease());
}

bool precedence_equal(const Version& a, const Version& b) {
    return compare(a, b) == Ordering::Equal;
}

bool Version::operator==(const Version& o) const {
    return major_ == o.major_ && minor_ == o.minor_ && patch_ == o.patch_ &&
           prerelease_ == o.prerelease_ && build_ == o.build_;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    return compare(*this, o) == Ordering::Less;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

std::vector<Version> sort_ascending(std::vector<Version> versions) {
    std::stable_sort(versions.begin(), versions.end());
    return versions;
}

} // namespace vernum
