// ==============================================================================
// mediascope/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка config.yaml через yaml-cpp
// - Значения по умолчанию для всех ключей
// - Поиск файла: $MEDIASCOPE_CONFIG, $XDG_CONFIG_HOME/mediascope/config.yaml,
//   $HOME/.config/mediascope/config.yaml
//
// Пример:
// @code
//   probe:
//     binary: ffprobe
//   notification:
//     lifetime_ms: 3000
//   log:
//     path: /tmp/mediascope.log
//     verbose: 1
//   filters:
//     codec: [H.264, H.265]
// @endcode
//
// ==============================================================================

#ifndef MEDIASCOPE_CONFIG_HPP
#define MEDIASCOPE_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <mediascope/filter.hpp>
#include <mediascope/notification.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediascope::config {

/// Предустановленные значения фильтров для вкладки Filters
using FilterPresets = std::map<filter::Field, std::vector<std::string>>;

FilterPresets default_presets();

struct Config {
    std::string probe_binary = "ffprobe";
    std::chrono::milliseconds notification_lifetime = DEFAULT_NOTIFICATION_LIFETIME;
    std::optional<std::filesystem::path> log_path;
    int verbose = 0;
    FilterPresets presets = default_presets();

    /// Откуда загружена конфигурация (пусто = значения по умолчанию)
    std::optional<std::filesystem::path> source;
};

struct ConfigError {
    std::string message;
    std::string path;

    /// "failed to load config '<path>' - <message>"
    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конкретный файл (отсутствие файла: ошибка)
LoadResult load(const std::filesystem::path& path);

/// Разобрать YAML из строки
LoadResult load_from_string(std::string_view yaml);

/// Путь конфигурации по правилам поиска и признак явного задания ($MEDIASCOPE_CONFIG)
struct ConfigLocation {
    std::optional<std::filesystem::path> path;
    bool explicit_path = false;
};

ConfigLocation locate();

/// Загрузить по правилам поиска; отсутствие файла по умолчанию: не ошибка
LoadResult load_default();

}  // namespace mediascope::config

#endif  // MEDIASCOPE_CONFIG_HPP
