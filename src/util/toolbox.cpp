#include <vernum/toolbox.hpp>
#include <vernum/log.hpp>
#include <nlohmann/json.hpp>
#include <regex>

using json = nlohmann::json;

namespace vernum {

// ---------------------------------------------------------------------------
// Field validation
// ---------------------------------------------------------------------------

bool is_git_url(const std::string& url) {
    static const std::regex with_scheme(
        R"(^(git|ssh|https)://([\w.+\-:]+@)?[^/]+/.+$)");
    static const std::regex scp_like(
        R"(^([\w.+\-]+@)?[^/:@]+:[^/].*$)");
    return std::regex_match(url, with_scheme) || std::regex_match(url, scp_like);
}

static Result<std::string> string_field(const json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_string()) {
        return VernumError{VernumError::Toolbox,
            std::string("field '") + key + "' must be a string", v.dump()};
    }
    return Result<std::string>::ok(v.get<std::string>());
}

// A lone string is shorthand for a one-element list; "" means no entries
static Result<std::vector<std::string>> list_field(const json& doc,
                                                   const char* key) {
    std::vector<std::string> out;
    const auto& v = doc.at(key);
    if (v.is_string()) {
        if (!v.get<std::string>().empty()) out.push_back(v.get<std::string>());
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    if (!v.is_array()) {
        return VernumError{VernumError::Toolbox,
            std::string("field '") + key + "' must be a string or an array of strings",
            v.dump()};
    }
    for (const auto& elem : v) {
        if (!elem.is_string()) {
            return VernumError{VernumError::Toolbox,
                std::string("field '") + key + "' must contain only strings",
                elem.dump()};
        }
        if (!elem.get<std::string>().empty()) {
            out.push_back(elem.get<std::string>());
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Status check_title(const std::string& title) {
    if (title.size() >= ToolboxInfo::kMaxTitleLength) {
        return VernumError{VernumError::Toolbox,
            "title must be shorter than " +
                std::to_string(ToolboxInfo::kMaxTitleLength) + " characters",
            title};
    }
    return ok_status();
}

static Status check_url(const std::string& url) {
    if (!url.empty() && !is_git_url(url)) {
        return VernumError{VernumError::Toolbox,
            "url is not a git remote", url,
            "expected https://host/path.git or user@host:path.git"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// ToolboxInfo
// ---------------------------------------------------------------------------

Result<ToolboxInfo> ToolboxInfo::create(const std::string& name,
                                        const std::string& title,
                                        const Config& cfg) {
    auto n = ToolboxName::parse(name);
    if (n.is_err()) return std::move(n).error();
    VERNUM_TRY(check_title(title));

    ToolboxInfo info;
    info.name = std::move(n).value();
    info.title = title;
    info.version = cfg.toolbox.version;
    info.branch = cfg.toolbox.branch;
    info.uuid_ = Uuid::v4();
    return Result<ToolboxInfo>::ok(std::move(info));
}

Result<ToolboxInfo> ToolboxInfo::parse(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return VernumError{VernumError::Parse,
            std::string("toolbox JSON parse error: ") + e.what()};
    }
    if (!doc.is_object()) {
        return VernumError{VernumError::Toolbox,
            "toolbox document must be a JSON object"};
    }

    static const char* const required[] = {"name", "title", "version", "url", "branch"};
    std::string missing;
    for (const char* key : required) {
        if (doc.contains(key)) continue;
        if (!missing.empty()) missing += ", ";
        missing += key;
    }
    if (!missing.empty()) {
        return VernumError{VernumError::Toolbox,
            "missing required fields", missing};
    }

    ToolboxInfo info;

    auto name = string_field(doc, "name");
    if (name.is_err()) return std::move(name).error();
    auto parsed_name = ToolboxName::parse(name.value());
    if (parsed_name.is_err()) return std::move(parsed_name).error();
    info.name = std::move(parsed_name).value();

    auto title = string_field(doc, "title");
    if (title.is_err()) return std::move(title).error();
    VERNUM_TRY(check_title(title.value()));
    info.title = std::move(title).value();

    auto vstr = string_field(doc, "version");
    if (vstr.is_err()) return std::move(vstr).error();
    auto version = Version::parse(vstr.value());
    if (version.is_err()) return std::move(version).error();
    info.version = std::move(version).value();

    auto url = string_field(doc, "url");
    if (url.is_err()) return std::move(url).error();
    VERNUM_TRY(check_url(url.value()));
    info.url = std::move(url).value();

    auto branch = string_field(doc, "branch");
    if (branch.is_err()) return std::move(branch).error();
    info.branch = std::move(branch).value();

    std::vector<std::string>* lists[] = {&info.paths, &info.deps, &info.exclude};
    const char* list_keys[] = {"paths", "deps", "exclude"};
    for (size_t i = 0; i < 3; ++i) {
        if (!doc.contains(list_keys[i])) continue;
        auto items = list_field(doc, list_keys[i]);
        if (items.is_err()) return std::move(items).error();
        *lists[i] = std::move(items).value();
    }

    if (doc.contains("uuid")) {
        auto ustr = string_field(doc, "uuid");
        if (ustr.is_err()) return std::move(ustr).error();
        auto uuid = Uuid::from_string(ustr.value());
        if (uuid.is_err()) {
            VernumError err = std::move(uuid).error();
            return VernumError{VernumError::Toolbox,
                "invalid uuid: " + err.message, err.subject, err.hint};
        }
        info.uuid_ = uuid.value();
    } else {
        info.uuid_ = Uuid::v4();
        log::debug("toolbox '%s' has no uuid, generated %s",
                   info.name.str().c_str(), info.uuid_.to_string().c_str());
    }

    for (const auto& item : doc.items()) {
        static const char* const known[] = {"name", "title", "version", "paths",
            "deps", "url", "branch", "exclude", "uuid"};
        bool is_known = false;
        for (const char* k : known) {
            if (item.key() == k) is_known = true;
        }
        if (!is_known) {
            log::debug("toolbox '%s': ignoring unknown field '%s'",
                       info.name.str().c_str(), item.key().c_str());
        }
    }

    return Result<ToolboxInfo>::ok(std::move(info));
}

std::string ToolboxInfo::to_json() const {
    nlohmann::ordered_json doc;
    doc["name"] = name.str();
    doc["title"] = title;
    doc["version"] = version.to_string();
    doc["paths"] = paths;
    doc["deps"] = deps;
    doc["url"] = url;
    doc["branch"] = branch;
    doc["exclude"] = exclude;
    doc["uuid"] = uuid_.to_string();
    return doc.dump(4);
}

Result<ToolboxInfo> ToolboxInfo::bump_version(const std::string& kind) const {
    Result<Version> next = kind == "major" ? version.next_major()
                         : kind == "minor" ? version.next_minor()
                         : kind == "patch" ? version.next_patch()
                         : Version::parse(kind);
    if (next.is_err()) return std::move(next).error();

    ToolboxInfo bumped = *this;
    bumped.version = std::move(next).value();
    log::info("%s: version %s -> %s", name.str().c_str(),
              version.to_string().c_str(), bumped.version.to_string().c_str());
    return Result<ToolboxInfo>::ok(std::move(bumped));
}

} // namespace vernum
