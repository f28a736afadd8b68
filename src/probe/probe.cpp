// ==============================================================================
// probe.cpp - Запуск ffprobe
// ==============================================================================

#include <mediascope/platform.hpp>
#include <mediascope/probe.hpp>
#include <utility>

namespace mediascope::probe {

FfprobeProber::FfprobeProber(std::string binary) : binary_(std::move(binary)) {}

std::vector<std::string> FfprobeProber::arguments(const std::string& path) {
    return {"-i", path, "-show_streams", "-show_format", "-hide_banner", "-of", "json"};
}

ProbeResult FfprobeProber::probe(const std::string& path) const {
    ProbeResult result;

    auto proc = platform::run_process(binary_, arguments(path));
    if (!proc.launched) {
        result.error = proc.error;
        return result;
    }

    // Ненулевой код завершения: не ошибка: показываем всё, что напечатано
    result.ok = true;
    result.exit_code = proc.exit_code;
    result.report = platform::utf8_lossy(proc.stdout_data);
    return result;
}

}  // namespace mediascope::probe
