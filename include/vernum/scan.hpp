#pragma once

#include <vernum/version.hpp>
#include <string>

namespace vernum {

// Returns the first semantic version found in `text`, scanning line by line.
// A candidate starts at a digit that does not continue a number or a dotted
// run ("v1.2.3" and "version: 1.2.3" both yield 1.2.3) and extends over
// [0-9A-Za-z.+-]. Candidates that fail Version::parse are skipped.
// NotFound when no line holds a valid version.
Result<Version> find_first_version(const std::string& text);

} // namespace vernum
