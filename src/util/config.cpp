#include <fuid/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fuid {

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Base62: return "base62";
        case OutputFormat::Uuid:   return "uuid";
        case OutputFormat::Both:   return "both";
    }
    return "unknown";
}

static Result<OutputFormat> parse_output_format(const std::string& s) {
    for (OutputFormat f : {OutputFormat::Base62, OutputFormat::Uuid, OutputFormat::Both}) {
        if (s == output_format_name(f)) return Result<OutputFormat>::ok(f);
    }
    return FuidError(FuidError::Config,
        "unknown output format: " + s,
        "expected one of base62, uuid, both");
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& where = e.source().begin;
        return FuidError(FuidError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(where.line));
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            FUID_TRY_ASSIGN(cfg.log_level, log::parse_level(*v));
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [random] section
    if (auto rnd = doc["random"].as_table()) {
        if (auto v = (*rnd)["device"].value<std::string>()) {
            if (v->empty()) {
                return FuidError(FuidError::Config,
                    "[random] device must not be empty");
            }
            cfg.random_device = *v;
            cfg.random_device_set = true;
        }
    }

    // [output] section
    if (auto out = doc["output"].as_table()) {
        if (auto v = (*out)["format"].value<std::string>()) {
            FUID_TRY_ASSIGN(cfg.output_format, parse_output_format(*v));
            cfg.output_format_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FuidError(FuidError::IO,
            "cannot open config file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
        return r;
    }
    log::debug("loaded config %s", path.c_str());
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.random_device_set) {
        random_device = other.random_device;
        random_device_set = true;
    }
    if (other.output_format_set) {
        output_format = other.output_format;
        output_format_set = true;
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
    log::set_level(log_level);
    if (log_color_set) {
        log::set_color_enabled(log_color);
    }
}

std::unique_ptr<RandomSource> Config::make_random_source() const {
    return std::make_unique<DeviceRandomSource>(random_device);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.fuid/config.toml";
}

} // namespace fuid
