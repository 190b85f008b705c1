// demo_versions.cpp
//
// Parses the versions given on the command line, reports the ones that are
// malformed, and prints the rest in ascending precedence order:
//
//     ./vernum_demo 1.0.0 1.0.0-rc.1 1.0.0-alpha.beta 1.02.3
//
// Logging follows ~/.vernum/config.toml and ./vernum.toml when present.

#include <vernum/config.hpp>
#include <vernum/log.hpp>
#include <vernum/version.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace vernum;

// A config layer is optional; a broken one is reported and skipped.
static std::optional<Config> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) return std::nullopt;
    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return std::nullopt;
    }
    log::debug("loaded config %s", path.c_str());
    return std::move(cfg).value();
}

int main(int argc, char** argv) {
    auto cfg = Config::effective(load_layer(global_config_path()),
                                 load_layer("vernum.toml"));
    cfg.apply_logging();

    if (argc < 2) {
        VernumError err{VernumError::InvalidArg, "no versions given", "",
            "usage: vernum_demo <version>..."};
        std::cerr << err.format() << "\n";
        return 2;
    }

    std::vector<Version> versions;
    int rejected = 0;
    for (int i = 1; i < argc; ++i) {
        auto v = Version::parse(argv[i]);
        if (v.is_err()) {
            std::cerr << v.error().format() << "\n";
            ++rejected;
            continue;
        }
        versions.push_back(std::move(v).value());
    }

    log::info("%zu accepted, %d rejected", versions.size(), rejected);

    for (const auto& v : sort_ascending(std::move(versions))) {
        std::cout << v.to_string() << "\n";
    }
    return rejected == 0 ? 0 : 1;
}
