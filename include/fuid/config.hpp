#pragma once

#include <fuid/log.hpp>
#include <fuid/random.hpp>
#include <fuid/result.hpp>
#include <memory>
#include <optional>
#include <string>

namespace fuid {

enum class OutputFormat { Base62, Uuid, Both };

const char* output_format_name(OutputFormat f);

// Layered configuration: global > local.
// Only keys present in a layer override the layer below it.
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    std::string random_device = DeviceRandomSource::default_device();
    OutputFormat output_format = OutputFormat::Base62;

    bool log_level_set = false;
    bool log_color_set = false;
    bool random_device_set = false;
    bool output_format_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Pushes level and colour settings into fuid::log.
    void apply_logging() const;

    std::unique_ptr<RandomSource> make_random_source() const;
};

// ~/.fuid/config.toml, or empty when no home directory is known.
std::string global_config_path();

} // namespace fuid
