#pragma once

#include <uidkit/log.hpp>
#include <uidkit/random.hpp>
#include <uidkit/result.hpp>
#include <memory>
#include <optional>
#include <string>

namespace uidkit {

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

struct RandomConfig {
    std::string device = "/dev/urandom";
};

// Layered configuration: global < local (local wins)
struct Config {
    LogConfig log;
    RandomConfig random;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool random_device_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.uidkit/config.toml
std::string global_config_path();

// Push the [log] settings into the logger.
void apply(const Config& cfg);

// Random source reading the configured device.
std::unique_ptr<RandomSource> make_random_source(const Config& cfg);

} // namespace uidkit
