// demo_fuid.cpp
//
// A small standalone program that exercises Fuid generation and conversion,
// the layered config, and error formatting. Run it with:
//
//     ./demo_fuid                                  # generate one FUID
//     ./demo_fuid 6fTiplVKIi6bJFe8rTXPcu           # Base62 -> UUID
//     ./demo_fuid db1f847a-5add-4dfd-be9e-3c22fcab34f8   # UUID -> Base62
//     ./demo_fuid 'ab!'                            # invalid input -> error
//
// A ./fuid.toml next to the working directory overrides ~/.fuid/config.toml.

#include <fuid/config.hpp>
#include <fuid/fuid.hpp>
#include <fuid/log.hpp>
#include <fuid/result.hpp>
#include <fuid/uuid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace fuid;

// A missing file is not an error; a broken one is.
static Result<std::optional<Config>> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    FUID_TRY_ASSIGN(Config cfg, Config::load(path));
    return Result<std::optional<Config>>::ok(std::move(cfg));
}

static Result<Config> load_config() {
    FUID_TRY_ASSIGN(auto global, load_layer(global_config_path()));
    FUID_TRY_ASSIGN(auto local, load_layer("fuid.toml"));
    return Result<Config>::ok(Config::effective(global, local));
}

static void print(const Fuid& id, OutputFormat format) {
    switch (format) {
        case OutputFormat::Base62:
            std::cout << id << "\n";
            break;
        case OutputFormat::Uuid:
            std::cout << id.to_uuid_string() << "\n";
            break;
        case OutputFormat::Both:
            std::cout << id << "  " << id.to_uuid_string() << "\n";
            break;
    }
}

// Anything shaped like a UUID is parsed as one; everything else is Base62.
static Result<Fuid> parse_arg(const std::string& arg) {
    if (arg.size() == uuid::kStringLength && arg.find('-') != std::string::npos) {
        return Fuid::from_uuid_string(arg);
    }
    return Fuid::from_string(arg);
}

int main(int argc, char** argv) {
    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();
    log::debug("output format: %s", output_format_name(cfg.value().output_format));

    if (argc < 2) {
        auto source = cfg.value().make_random_source();
        auto id = Fuid::generate(*source);
        if (id.is_err()) {
            std::cerr << id.error().format() << "\n";
            return 1;
        }
        print(id.value(), cfg.value().output_format);
        return 0;
    }

    int status = 0;
    for (int i = 1; i < argc; ++i) {
        auto id = parse_arg(argv[i]);
        if (id.is_err()) {
            std::cerr << id.error().format() << "\n";
            status = 1;
            continue;
        }
        print(id.value(), OutputFormat::Both);
    }
    return status;
}
