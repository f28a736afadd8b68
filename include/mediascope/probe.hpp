// ==============================================================================
// mediascope/probe.hpp - Внешний пробник метаданных (ffprobe)
// ==============================================================================
//
// Назначение:
// - Prober: интерфейс запуска пробника для одного файла
// - FfprobeProber: реализация через ffprobe (JSON-вывод streams + format)
// - ProbeSummary: структурная сводка отчёта (RapidJSON), только для отображения
//
// Поля MediaRecord из ProbeSummary не берутся: они извлекаются эвристиками
// модуля extract.
//
// ==============================================================================

#ifndef MEDIASCOPE_PROBE_HPP
#define MEDIASCOPE_PROBE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediascope::probe {

// ----------------------------------------------------------------------------
// ProbeResult
// ----------------------------------------------------------------------------

struct ProbeResult {
    /// false если пробник не удалось запустить
    bool ok = false;

    /// stdout пробника, декодированный как UTF-8 (lossy)
    std::string report;

    /// Код завершения пробника (не влияет на ok)
    int exit_code = 0;

    /// Описание ошибки запуска
    std::string error;
};

// ----------------------------------------------------------------------------
// Prober
// ----------------------------------------------------------------------------

/// Интерфейс пробника: один синхронный запуск на файл
class Prober {
public:
    virtual ~Prober() = default;

    /// Запустить пробник для файла и вернуть его stdout
    virtual ProbeResult probe(const std::string& path) const = 0;

    /// Имя для диагностики
    virtual std::string name() const = 0;

protected:
    Prober() = default;
};

/// ffprobe -i <path> -show_streams -show_format -hide_banner -of json
class FfprobeProber : public Prober {
public:
    explicit FfprobeProber(std::string binary = "ffprobe");

    ProbeResult probe(const std::string& path) const override;

    std::string name() const override { return binary_; }

    /// Аргументы командной строки для файла (без argv[0])
    static std::vector<std::string> arguments(const std::string& path);

private:
    std::string binary_;
};

// ----------------------------------------------------------------------------
// ProbeSummary
// ----------------------------------------------------------------------------

struct StreamSummary {
    std::string codec_type;  // video | audio | subtitle | data | ...
    std::string codec_name;
};

struct ProbeSummary {
    /// false если отчёт не является JSON-объектом
    bool valid = false;

    std::string format_name;
    std::optional<double> duration_seconds;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> bit_rate;
    std::vector<StreamSummary> streams;
};

/// Разобрать JSON-отчёт ffprobe (объекты "format" и "streams")
///
/// Числовые поля ffprobe пишет строками; принимаются и строки, и числа.
ProbeSummary summarize_report(std::string_view report);

/// Сводка последнего разобранного отчёта
///
/// Повторный запрос того же текста не разбирает JSON заново.
class SummaryCache {
public:
    const ProbeSummary& get(std::string_view report);

    /// Сколько раз отчёт действительно разбирался
    std::size_t parse_count() const { return parse_count_; }

private:
    std::optional<std::string> report_;
    ProbeSummary summary_;
    std::size_t parse_count_ = 0;
};

}  // namespace mediascope::probe

#endif  // MEDIASCOPE_PROBE_HPP
