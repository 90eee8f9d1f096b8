// demo_shortuuid.cpp
//
// Encodes a random UUID and a fixed sample UUID with a Codec built from an
// optional TOML config, then decodes them again. Run it with:
//
//     ./demo_shortuuid                   # default 58-character alphabet
//     ./demo_shortuuid codec.toml        # alphabet / length / log level from file
//     ./demo_shortuuid missing.toml      # IO error
//
// Errors are printed in the library's formatted style on stderr.

#include <shortuuid/codec.hpp>
#include <shortuuid/config.hpp>
#include <shortuuid/log.hpp>
#include <shortuuid/short_uuid.hpp>

#include <iostream>
#include <optional>
#include <string>

using namespace shortuuid;

static const char* SAMPLE_UUID = "123e4567-e89b-12d3-a456-426614174000";

// Global config (if present) overridden by the file named on the command line.
static Result<Config> load_config(int argc, char** argv) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty()) {
        auto g = Config::load(global_path);
        if (g.is_ok()) {
            global = std::move(g).value();
        } else if (g.error().code != ShortUuidError::IO) {
            return std::move(g).error();
        }
    }

    std::optional<Config> local;
    if (argc >= 2) {
        auto l = Config::load(argv[1]);
        SHORTUUID_TRY(l);
        local = std::move(l).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

static Status run(int argc, char** argv) {
    auto cfg = load_config(argc, argv);
    SHORTUUID_TRY(cfg);
    cfg.value().apply_logging();

    auto codec = Codec::from_config(cfg.value());
    SHORTUUID_TRY(codec);
    const Codec& c = codec.value();

    log::debug("alphabet '%s' (%zu chars), length %zu",
               c.alphabet().chars().c_str(), c.alphabet().size(), c.length());

    auto uuid = Uuid::v4();
    auto code = c.encode(uuid);
    auto back = c.decode(code);
    SHORTUUID_TRY(back);
    std::cout << "random:  " << uuid.to_string() << " -> " << code
              << " -> " << back.value().to_string() << "\n";

    auto sample = Uuid::from_string(SAMPLE_UUID);
    SHORTUUID_TRY(sample);
    auto short_sample = ShortUuid(c.encode(sample.value()), c.alphabet());
    auto sample_back = short_sample.decode();
    SHORTUUID_TRY(sample_back);
    std::cout << "sample:  " << SAMPLE_UUID << " -> " << short_sample
              << " -> " << sample_back.value().to_string() << "\n";

    if (sample_back.value() != sample.value()) {
        log::warn("sample did not round-trip, length %zu is lossy", c.length());
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
