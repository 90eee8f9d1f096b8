#include <shortuuid/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace shortuuid {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ShortUuidError{ShortUuidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [codec] section
    if (auto codec = doc["codec"].as_table()) {
        if (auto node = codec->get("alphabet")) {
            auto s = node->value<std::string>();
            if (!s) {
                return ShortUuidError{ShortUuidError::Config,
                    "codec.alphabet must be a string"};
            }
            auto alphabet = Alphabet::create(*s);
            if (alphabet.is_err()) {
                return ShortUuidError{ShortUuidError::Config,
                    "codec.alphabet: " + alphabet.error().message,
                    alphabet.error().hint};
            }
            cfg.codec.alphabet = *s;
            cfg.codec_alphabet_set = true;
        }
        if (auto node = codec->get("length")) {
            auto n = node->value<int64_t>();
            if (!n || *n < 0) {
                return ShortUuidError{ShortUuidError::Config,
                    "codec.length must be a non-negative integer"};
            }
            cfg.codec.length = static_cast<std::size_t>(*n);
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto s = node->value<std::string>();
            if (!s) {
                return ShortUuidError{ShortUuidError::Config,
                    "log.level must be a string"};
            }
            auto level = log::parse_level(*s);
            SHORTUUID_TRY(level);
            cfg.logging.level = level.value();
            cfg.log_level_set = true;
        }
        if (auto node = lg->get("color")) {
            auto b = node->value<bool>();
            if (!b) {
                return ShortUuidError{ShortUuidError::Config,
                    "log.color must be a boolean"};
            }
            cfg.logging.color = *b;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ShortUuidError{ShortUuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.codec_alphabet_set) {
        codec.alphabet = other.codec.alphabet;
        codec_alphabet_set = true;
    }
    if (other.codec.length) {
        codec.length = other.codec.length;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
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
    if (log_level_set) {
        log::set_level(logging.level);
    }
    if (log_color_set) {
        log::set_color_enabled(logging.color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.shortuuid/config.toml";
}

} // namespace shortuuid
