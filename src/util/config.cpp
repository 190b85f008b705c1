#include <vernum/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vernum {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VernumError{VernumError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    if (auto tbx = doc["toolbox"].as_table()) {
        if (auto v = (*tbx)["version"].value<std::string>()) {
            auto ver = Version::parse(*v);
            if (ver.is_err()) {
                VernumError err = std::move(ver).error();
                return VernumError{VernumError::Config,
                    "invalid default toolbox version: " + err.message,
                    err.subject, "[toolbox] version"};
            }
            cfg.toolbox.version = std::move(ver).value();
            cfg.toolbox_version_set = true;
        }
        if (auto v = (*tbx)["branch"].value<std::string>()) {
            cfg.toolbox.branch = *v;
            cfg.toolbox_branch_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VernumError{VernumError::IO, "cannot open config file", path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        return std::move(cfg.error().at(path, 0));
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.toolbox_version_set) {
        toolbox.version = other.toolbox.version;
        toolbox_version_set = true;
    }
    if (other.toolbox_branch_set) {
        toolbox.branch = other.toolbox.branch;
        toolbox_branch_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.vernum/config.toml";
}

} // namespace vernum
