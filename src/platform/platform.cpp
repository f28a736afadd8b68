// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// POSIX-специфика (fork/exec, isatty) изолирована здесь.
//
// ==============================================================================

#include "mediascope/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediascope::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

std::optional<std::string> env_var(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::filesystem::path> user_config_dir() {
    if (auto xdg = env_var("XDG_CONFIG_HOME")) {
        return path_from_utf8(*xdg);
    }
    if (auto home = env_var("HOME")) {
        return path_from_utf8(*home) / ".config";
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

bool is_tty_stdin() {
    return isatty(fileno(stdin)) != 0;
}

// ----------------------------------------------------------------------------
// Внешние процессы
// ----------------------------------------------------------------------------

namespace {

bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags == -1) {
        return false;
    }
    return fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

void close_pair(int fds[2]) {
    if (fds[0] != -1) {
        close(fds[0]);
        fds[0] = -1;
    }
    if (fds[1] != -1) {
        close(fds[1]);
        fds[1] = -1;
    }
}

std::string errno_message(int err) {
    return std::strerror(err);
}

// Дочитать fd до EOF
void read_all(int fd, std::string& out) {
    char buffer[8192];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        break;
    }
}

}  // anonymous namespace

ProcessResult run_process(const std::string& program, const std::vector<std::string>& args) {
    ProcessResult result;

    // out_pipe: stdout ребёнка; err_pipe: errno от неудачного execvp (закрывается по CLOEXEC)
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) == -1) {
        result.error = "failed to create pipe: " + errno_message(errno);
        return result;
    }
    if (pipe(err_pipe) == -1) {
        result.error = "failed to create pipe: " + errno_message(errno);
        close_pair(out_pipe);
        return result;
    }
    if (!set_cloexec(out_pipe[0]) || !set_cloexec(err_pipe[0]) || !set_cloexec(err_pipe[1])) {
        result.error = "failed to configure pipe: " + errno_message(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "failed to fork: " + errno_message(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return result;
    }

    if (pid == 0) {
        // Ребёнок: stdout -> pipe, stdin/stderr -> /dev/null
        int devnull = open("/dev/null", O_RDWR);
        if (devnull != -1) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        close(out_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);

        execvp(program.c_str(), argv.data());

        int err = errno;
        ssize_t written = write(err_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    close(out_pipe[1]);
    out_pipe[1] = -1;
    close(err_pipe[1]);
    err_pipe[1] = -1;

    // Блокируется до успешного exec (EOF) или до записи errno
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close_pair(err_pipe);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_pair(out_pipe);
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        result.error = "failed to launch '" + program + "': " + errno_message(exec_errno);
        return result;
    }

    read_all(out_pipe[0], result.stdout_data);
    close_pair(out_pipe);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    result.launched = true;
    if (waited == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

// ----------------------------------------------------------------------------
// Кодировки
// ----------------------------------------------------------------------------

std::string utf8_lossy(std::string_view bytes) {
    // U+FFFD в UTF-8
    static constexpr const char* REPLACEMENT = "\xef\xbf\xbd";

    std::string out;
    out.reserve(bytes.size());

    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        if (b0 < 0x80) {
            out += static_cast<char>(b0);
            ++i;
            continue;
        }

        // Длина последовательности и допустимый диапазон второго байта
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2;
        } else if (b0 == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
            len = 3;
        } else if (b0 == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (b0 == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (b0 >= 0xF1 && b0 <= 0xF3) {
            len = 4;
        } else if (b0 == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        // Максимальная корректная подпоследовательность заменяется одним U+FFFD
        size_t j = 1;
        bool valid = true;
        for (; j < len; ++j) {
            if (i + j >= n) {
                valid = false;
                break;
            }
            auto b = static_cast<unsigned char>(bytes[i + j]);
            unsigned char min = (j == 1) ? lo : 0x80;
            unsigned char max = (j == 1) ? hi : 0xBF;
            if (b < min || b > max) {
                valid = false;
                break;
            }
        }

        if (valid) {
            out.append(bytes.substr(i, len));
            i += len;
        } else {
            out += REPLACEMENT;
            i += j;
        }
    }

    return out;
}

}  // namespace mediascope::platform
