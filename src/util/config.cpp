#include <uidkit/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace uidkit {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UidError{UidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto v = (*section)["level"].value<std::string>()) {
            auto lvl = log::level_from_name(*v);
            if (!lvl) {
                return UidError{UidError::Parse,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log.level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*section)["color"].value<bool>()) {
            cfg.log.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [random] section
    if (auto section = doc["random"].as_table()) {
        if (auto v = (*section)["device"].value<std::string>()) {
            if (v->empty()) {
                return UidError{UidError::Parse, "random.device must not be empty"};
            }
            cfg.random.device = *v;
            cfg.random_device_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UidError{UidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log.color = other.log.color;
        log_color_set = true;
    }
    if (other.random_device_set) {
        random.device = other.random.device;
        random_device_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.uidkit/config.toml";
}

void apply(const Config& cfg) {
    log::set_level(cfg.log.level);
    if (cfg.log_color_set) {
        log::set_color_enabled(cfg.log.color);
    }
    log::debug("log level %s, random device %s",
               log::level_name(cfg.log.level), cfg.random.device.c_str());
}

std::unique_ptr<RandomSource> make_random_source(const Config& cfg) {
    return std::make_unique<DeviceRandom>(cfg.random.device);
}

} // namespace uidkit
