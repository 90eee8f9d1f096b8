#pragma once

#include <shortuuid/alphabet.hpp>
#include <shortuuid/log.hpp>
#include <shortuuid/result.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace shortuuid {

struct CodecConfig {
    std::string alphabet = DEFAULT_ALPHABET;
    // Unset means calculate_length(alphabet.size())
    std::optional<std::size_t> length;
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global < local, later layers override
// only the keys they set explicitly.
struct Config {
    CodecConfig codec;
    LogConfig logging;
    bool codec_alphabet_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML file
    static Result<Config> load(const std::string& path);

    // Parse from a TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push the [log] settings into the process-wide logger
    void apply_logging() const;
};

// ~/.shortuuid/config.toml
std::string global_config_path();

} // namespace shortuuid
