#pragma once

#include <vernum/log.hpp>
#include <vernum/result.hpp>
#include <vernum/version.hpp>
#include <optional>
#include <string>

namespace vernum {

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// [toolbox] section: defaults for newly created toolbox records
struct ToolboxDefaults {
    Version version = Version::parse("0.0.1").value();
    std::string branch = "master";
};

// Layered configuration: global < local
struct Config {
    LogConfig logging;
    ToolboxDefaults toolbox;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool toolbox_version_set = false;
    bool toolbox_branch_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Explicitly-set fields of `other` override this
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Pushes the [log] settings into vernum::log. Color is only forced when
    // the file sets it; otherwise terminal detection stays in charge.
    void apply_logging() const;
};

// ~/.vernum/config.toml, or empty when no home directory is known
std::string global_config_path();

} // namespace vernum
