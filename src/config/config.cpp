// ==============================================================================
// config.cpp - Конфигурация (YAML)
// ==============================================================================
//
// yaml-cpp бросает YAML::Exception; наружу ошибки уходят через LoadResult.
//
// ==============================================================================

#include <mediascope/config.hpp>
#include <mediascope/platform.hpp>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace mediascope::config {

namespace {

constexpr const char* CONFIG_ENV = "MEDIASCOPE_CONFIG";
constexpr const char* CONFIG_DIR = "mediascope";
constexpr const char* CONFIG_FILE = "config.yaml";

void require_map(const YAML::Node& node, const std::string& key) {
    if (node && !node.IsNull() && !node.IsMap()) {
        throw std::runtime_error("'" + key + "' must be a mapping");
    }
}

void parse_probe(const YAML::Node& node, Config& cfg) {
    require_map(node, "probe");
    if (!node || !node["binary"]) {
        return;
    }
    auto binary = node["binary"].as<std::string>();
    if (binary.empty()) {
        throw std::runtime_error("'probe.binary' must not be empty");
    }
    cfg.probe_binary = std::move(binary);
}

void parse_notification(const YAML::Node& node, Config& cfg) {
    require_map(node, "notification");
    if (!node || !node["lifetime_ms"]) {
        return;
    }
    auto ms = node["lifetime_ms"].as<long long>();
    if (ms <= 0) {
        throw std::runtime_error("'notification.lifetime_ms' must be positive");
    }
    cfg.notification_lifetime = std::chrono::milliseconds(ms);
}

void parse_log(const YAML::Node& node, Config& cfg) {
    require_map(node, "log");
    if (!node) {
        return;
    }
    if (node["path"]) {
        auto path = node["path"].as<std::string>();
        if (!path.empty()) {
            cfg.log_path = platform::path_from_utf8(path);
        }
    }
    if (node["verbose"]) {
        int verbose = node["verbose"].as<int>();
        if (verbose < 0) {
            throw std::runtime_error("'log.verbose' must not be negative");
        }
        cfg.verbose = verbose;
    }
}

void parse_filters(const YAML::Node& node, Config& cfg) {
    require_map(node, "filters");
    if (!node || node.IsNull()) {
        return;
    }
    for (const auto& entry : node) {
        auto key = entry.first.as<std::string>();
        auto field = filter::field_from_string(key);
        if (!field) {
            throw std::runtime_error("unknown filter field '" + key + "'");
        }
        if (!entry.second.IsSequence()) {
            throw std::runtime_error("'filters." + key + "' must be a list");
        }
        std::vector<std::string> values;
        for (const auto& item : entry.second) {
            values.push_back(item.as<std::string>());
        }
        cfg.presets[*field] = std::move(values);
    }
}

Config parse_config(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("top level must be a mapping");
    }

    parse_probe(root["probe"], cfg);
    parse_notification(root["notification"], cfg);
    parse_log(root["log"], cfg);
    parse_filters(root["filters"], cfg);
    return cfg;
}

}  // anonymous namespace

// ============================================================================
// Значения по умолчанию
// ============================================================================

FilterPresets default_presets() {
    return {
        {filter::Field::Container, {"mp4", "mov", "avi", "mkv", "jpg", "png"}},
        {filter::Field::Codec, {"H.264", "H.265", "VP9", "AV1", "Hap", "DXV3"}},
        {filter::Field::Resolution, {"1920x1080", "1280x720", "3840x2160", "2560x1440"}},
        {filter::Field::FrameRate, {"24", "25", "30", "50", "60"}},
        {filter::Field::Bitrate, {"1", "5", "10", "15", "20"}},
    };
}

std::string ConfigError::format() const {
    if (path.empty()) {
        return "failed to load config - " + message;
    }
    return "failed to load config '" + path + "' - " + message;
}

// ============================================================================
// Загрузка
// ============================================================================

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;
    std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = ConfigError{"file not found", path_str};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_str);
        result.config = parse_config(root);
        result.config.source = path;
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), path_str};
    } catch (const std::runtime_error& e) {
        result.error = ConfigError{e.what(), path_str};
    }
    return result;
}

LoadResult load_from_string(std::string_view yaml) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.config = parse_config(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), ""};
    } catch (const std::runtime_error& e) {
        result.error = ConfigError{e.what(), ""};
    }
    return result;
}

ConfigLocation locate() {
    ConfigLocation location;
    if (auto env = platform::env_var(CONFIG_ENV)) {
        location.path = platform::path_from_utf8(*env);
        location.explicit_path = true;
        return location;
    }
    if (auto dir = platform::user_config_dir()) {
        location.path = *dir / CONFIG_DIR / CONFIG_FILE;
    }
    return location;
}

LoadResult load_default() {
    auto location = locate();
    if (!location.path) {
        return LoadResult{true, Config{}, {}};
    }

    std::error_code ec;
    if (!location.explicit_path && !std::filesystem::exists(*location.path, ec)) {
        return LoadResult{true, Config{}, {}};
    }
    return load(*location.path);
}

}  // namespace mediascope::config
