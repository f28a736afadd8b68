// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "mediascope/cli.hpp"

#include <cstring>

namespace mediascope::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

}  // anonymous namespace

std::string render_version() {
    return std::string(PROGRAM) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: mediascope [OPTIONS]\n"
           "\n"
           "Options:\n"
           "  -h, --help     Print help\n"
           "  -V, --version  Print version\n"
           "\n"
           "Keys:\n"
           "  a  Add file        f  Add filter       x  Remove last filter\n"
           "  r  Raw output      c  Clear all        h  Help\n"
           "  j/Down, k/Up  Move selection           Tab  Switch tabs\n"
           "  q  Quit\n"
           "\n"
           "Configuration:\n"
           "  $MEDIASCOPE_CONFIG, $XDG_CONFIG_HOME/mediascope/config.yaml or\n"
           "  ~/.config/mediascope/config.yaml\n";
}

ParseResult parse(int argc, char** argv) {
    ParseResult result;

    if (argc <= 1) {
        result.ok = true;
        result.command = RunCommand{};
        return result;
    }

    const char* arg = argv[1];
    if (argc == 2 && (str_eq(arg, "-h") || str_eq(arg, "--help"))) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }
    if (argc == 2 && (str_eq(arg, "-V") || str_eq(arg, "--version"))) {
        result.ok = true;
        result.command = VersionCommand{};
        return result;
    }

    // Любой другой аргумент: ошибка использования
    const char* offending = arg;
    if (argc > 2 && (str_eq(arg, "-h") || str_eq(arg, "--help") || str_eq(arg, "-V") ||
                     str_eq(arg, "--version"))) {
        offending = argv[2];
    }
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message =
        std::string("error: unexpected argument '") + offending +
        "' found\n"
        "\n"
        "Usage: mediascope [OPTIONS]\n"
        "\n"
        "For more information, try '--help'.\n";
    return result;
}

}  // namespace mediascope::cli
