/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Command Client Implementation - posix_spawn with captured output
 */

#include "llm/command_client.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace mailrlm::llm {

namespace log_component = util::log_component;

namespace {

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Closes a pipe end on scope exit
struct FdGuard {
    int fd{-1};
    ~FdGuard() { reset(); }
    void reset() {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

struct ProcessOutput {
    std::string out;
    std::string err;
    int exit_code{1};
    bool timed_out{false};
};

ProcessOutput run_capture(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        throw ProcessingFailure(std::string("pipe failed: ") + std::strerror(errno));
    }
    FdGuard out_read{out_pipe[0]};
    FdGuard out_write{out_pipe[1]};
    if (::pipe(err_pipe) != 0) {
        throw ProcessingFailure(std::string("pipe failed: ") + std::strerror(errno));
    }
    FdGuard err_read{err_pipe[0]};
    FdGuard err_write{err_pipe[1]};

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, out_pipe[0]);
    posix_spawn_file_actions_addclose(&actions, err_pipe[0]);
    posix_spawn_file_actions_addclose(&actions, out_pipe[1]);
    posix_spawn_file_actions_addclose(&actions, err_pipe[1]);

    pid_t pid = -1;
    const int sp = posix_spawnp(&pid, argv[0].c_str(), &actions, nullptr, cargs.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    out_write.reset();
    err_write.reset();

    if (sp != 0) {
        throw ProcessingFailure("Cannot start '" + argv[0] + "': " + std::strerror(sp));
    }

    ProcessOutput output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    pollfd fds[2] = {{out_read.fd, POLLIN, 0}, {err_read.fd, POLLIN, 0}};
    std::string* sinks[2] = {&output.out, &output.err};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            output.timed_out = true;
            break;
        }

        int ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    int status = 0;
    bool reaped = false;
    // Both pipes may close while the child keeps running
    while (!output.timed_out) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            throw ProcessingFailure(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            output.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (output.timed_out) {
        ::kill(pid, SIGKILL);
    }

    while (!reaped && ::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProcessingFailure(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) output.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) output.exit_code = 128 + WTERMSIG(status);

    return output;
}

} // namespace

CommandClient::CommandClient(CommandClientConfig config)
    : config_(std::move(config)) {
    if (config_.command.empty()) {
        throw ConfigurationError("llm.command cannot be empty");
    }
}

std::string CommandClient::build_prompt(const std::string& prompt, const std::string& context) {
    if (context.empty()) {
        return prompt;
    }
    return "Context:\n" + context + "\n\nTask:\n" + prompt;
}

std::string CommandClient::query(const std::string& prompt, const std::string& context) const {
    auto argv = config_.command;
    argv.push_back(build_prompt(prompt, context));

    MAILRLM_LOG_DEBUG(log_component::Llm, "Running '{}' (prompt={} chars, context={} chars)",
                      config_.command.front(), prompt.size(), context.size());

    auto start = std::chrono::steady_clock::now();
    auto output = run_capture(argv, config_.timeout);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (output.timed_out) {
        throw ProcessingFailure("Model query timed out after " +
                                std::to_string(config_.timeout.count()) + "s");
    }
    if (output.exit_code != 0) {
        auto message = trim(output.err);
        throw ProcessingFailure("Model query failed (exit " + std::to_string(output.exit_code) +
                                "): " + (message.empty() ? "Unknown error" : message));
    }

    MAILRLM_LOG_DEBUG(log_component::Llm, "Model query finished in {}ms ({} bytes)",
                      elapsed.count(), output.out.size());
    return trim(output.out);
}

} // namespace mailrlm::llm
