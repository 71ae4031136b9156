#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <fcntl.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

// A struct to hold the result of a command execution
struct CommandResult {
    int exit_code{};
    std::string stdout_output;
    std::string stderr_output;
};

class Strings {
public:

    static std::string_view trim(const std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r\n\f\v");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n\f\v");
        return s.substr(first, last - first + 1);
    }

    static std::vector<std::string> split_lines(const std::string_view text) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (start < text.size()) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos) end = text.size();
            auto line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            lines.emplace_back(line);
            start = end + 1;
        }
        return lines;
    }

    // Splits on runs of whitespace, never yields empty tokens.
    static std::vector<std::string> split_whitespace(const std::string_view s) {
        std::vector<std::string> tokens;
        size_t i = 0;
        while (i < s.size()) {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            const size_t start = i;
            while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            if (i > start) tokens.emplace_back(s.substr(start, i - start));
        }
        return tokens;
    }

    // Splits on a delimiter, trimming every piece and dropping empty ones ("a, b,," -> {a, b}).
    static std::vector<std::string> split_list(const std::string_view s, const char delim = ',') {
        std::vector<std::string> out;
        size_t start = 0;
        while (start <= s.size()) {
            auto end = s.find(delim, start);
            if (end == std::string_view::npos) end = s.size();
            if (const auto piece = trim(s.substr(start, end - start)); !piece.empty()) {
                out.emplace_back(piece);
            }
            start = end + 1;
        }
        return out;
    }

    static std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
            [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    // POSIX shell quoting: safe words pass through, anything else is single-quoted
    // with embedded quotes spliced as '"'"'.
    static std::string shell_quote(const std::string_view s) {
        if (s.empty()) return "''";

        const bool safe = std::ranges::all_of(s, [](const unsigned char c) {
            return std::isalnum(c) || std::string_view("@%+=:,./-_").find(static_cast<char>(c)) != std::string_view::npos;
        });
        if (safe) return std::string(s);

        std::string quoted = "'";
        for (const char c : s) {
            if (c == '\'') {
                quoted += "'\"'\"'";
            } else {
                quoted += c;
            }
        }
        quoted += '\'';
        return quoted;
    }

    // Renders an argv as something a user could paste into a shell.
    static std::string display_command(const std::vector<std::string>& args) {
        std::vector<std::string> quoted;
        quoted.reserve(args.size());
        for (const auto& a : args) quoted.push_back(shell_quote(a));
        return fmt::format("{}", fmt::join(quoted, " "));
    }
};

class AsyncPipeReader {
public:
    // Drains both pipes until EOF on each. Never returns early on partial data.
    static std::pair<std::string, std::string> readPipes(const int stdout_fd, const int stderr_fd) {
        fcntl(stdout_fd, F_SETFL, O_NONBLOCK);
        fcntl(stderr_fd, F_SETFL, O_NONBLOCK);

        PipeData stdout_data{stdout_fd, {}};
        PipeData stderr_data{stderr_fd, {}};

        stdout_data.buffer.reserve(8192);
        stderr_data.buffer.reserve(4096);

        std::array<char, 8192> read_buffer{};

        while (!stdout_data.finished || !stderr_data.finished) {
            std::array<pollfd, 2> fds = {{
                {stdout_data.finished ? -1 : stdout_fd, POLLIN, 0},
                {stderr_data.finished ? -1 : stderr_fd, POLLIN, 0}
            }};

            const int poll_result = poll(fds.data(), fds.size(), 100);
            if (poll_result < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (poll_result == 0) continue;

            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) drainPipe(stdout_data, read_buffer);
            if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) drainPipe(stderr_data, read_buffer);
        }

        return {std::move(stdout_data.buffer), std::move(stderr_data.buffer)};
    }

private:
    struct PipeData {
        int fd;
        std::string buffer;
        bool finished = false;
    };

    static void drainPipe(PipeData& pipe_data, std::array<char, 8192>& buffer) {
        while (true) {
            const ssize_t bytes_read = read(pipe_data.fd, buffer.data(), buffer.size());
            if (bytes_read > 0) {
                pipe_data.buffer.append(buffer.data(), static_cast<size_t>(bytes_read));
                continue;
            }
            if (bytes_read == 0) {
                pipe_data.finished = true; // EOF
                return;
            }
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                pipe_data.finished = true;
            }
            return;
        }
    }
};

class Execution {
public:
    static bool isFileExecutable(const std::string& path) {
        char resolved_path[PATH_MAX];
        if (realpath(path.c_str(), resolved_path) == nullptr) {
            return false;
        }

        struct stat sb{};
        if (stat(resolved_path, &sb) != 0) {
            return false;
        }

        if (!S_ISREG(sb.st_mode)) {
            return false;
        }

        return access(resolved_path, X_OK) == 0;
    }

    static bool isCommandExecutable(const std::string& command) {
        if (command.empty() || command.find('\0') != std::string::npos) {
            return false;
        }

        if (command.find('/') != std::string::npos) {
            return isFileExecutable(command);
        }

        const char* path_env = std::getenv("PATH");
        if (!path_env) {
            return false;
        }

        std::stringstream ss{std::string(path_env)};
        std::string dir;

        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) {
                continue;
            }

            const std::string full_path = dir + "/" + command;
            if (full_path.length() >= PATH_MAX) {
                continue;
            }

            if (isFileExecutable(full_path)) {
                return true;
            }
        }

        return false;
    }

    // Runs argv to completion, capturing exit code, stdout and stderr.
    static CommandResult execute_vec(const std::vector<std::string>& args) {
        if (args.empty()) {
            return {127, "", "Error: empty command"};
        }

        if (!isCommandExecutable(args[0])) {
            return {127, "", "Error: command not found or not executable: " + args[0]};
        }

        int stdout_pipe[2], stderr_pipe[2];
        if (pipe(stdout_pipe) == -1) {
            return {127, "", "Error: failed to create pipes"};
        }
        if (pipe(stderr_pipe) == -1) {
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            return {127, "", "Error: failed to create pipes"};
        }

        const pid_t pid = fork();
        if (pid == -1) {
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            close(stderr_pipe[0]); close(stderr_pipe[1]);
            return {127, "", "Error: fork failed"};
        }

        if (pid == 0) {
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            close(stderr_pipe[0]); close(stderr_pipe[1]);

            const int devnull = open("/dev/null", O_RDONLY);
            if (devnull != -1) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }

            auto argv = make_argv(args);
            execvp(argv[0], argv.data());
            _exit(127);
        }

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        auto [stdout_result, stderr_result] = AsyncPipeReader::readPipes(stdout_pipe[0], stderr_pipe[0]);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                return {127, std::move(stdout_result), "Error: waitpid failed"};
            }
        }

        const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return {exit_code, std::move(stdout_result), std::move(stderr_result)};
    }

    // Replaces the current process with argv. Only returns on failure, with the reason.
    static std::string exec_replace(const std::vector<std::string>& args) {
        if (args.empty()) {
            return "empty command";
        }
        auto argv = make_argv(args);
        execvp(argv[0], argv.data());
        return fmt::format("{}: {}", args[0], std::strerror(errno));
    }

private:
    static std::vector<char*> make_argv(const std::vector<std::string>& args) {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& s : args) {
            argv.push_back(const_cast<char*>(s.c_str()));
        }
        argv.push_back(nullptr);
        return argv;
    }
};
