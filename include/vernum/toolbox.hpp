#pragma once

#include <vernum/config.hpp>
#include <vernum/name.hpp>
#include <vernum/result.hpp>
#include <vernum/uuid.hpp>
#include <vernum/version.hpp>
#include <string>
#include <vector>

namespace vernum {

// Metadata describing a distributable toolbox. Serialized as a JSON object
// whose "version" member is the canonical version string.
struct ToolboxInfo {
    ToolboxName name;
    std::string title;              // shorter than kMaxTitleLength
    Version version;
    std::vector<std::string> paths; // sub-paths added on install
    std::vector<std::string> deps;  // toolboxes this one relies on
    std::string url;                // git remote, may be empty
    std::string branch;
    std::vector<std::string> exclude;

    static constexpr size_t kMaxTitleLength = 70;

    // New record with a fresh uuid and the configured default version/branch
    static Result<ToolboxInfo> create(const std::string& name,
                                      const std::string& title,
                                      const Config& cfg);

    // Required: name, title, version, url, branch.
    // Optional: uuid, deps, paths, exclude (string or array of strings).
    // Unknown keys are ignored.
    static Result<ToolboxInfo> parse(const std::string& json_text);

    // Pretty-printed with 4-space indentation
    std::string to_json() const;

    // kind is "major", "minor", "patch", or a complete version string
    Result<ToolboxInfo> bump_version(const std::string& kind) const;

    const Uuid& uuid() const { return uuid_; }

private:
    Uuid uuid_;
};

// Accepts https://, ssh://, git:// remotes and scp-style user@host:path
bool is_git_url(const std::string& url);

} // namespace vernum
