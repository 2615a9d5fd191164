#include "rapidmcp/tool_invoker.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace rapidmcp {

namespace {

constexpr size_t kStderrExcerpt = 512;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string excerpt(const std::string& text) {
    std::string out = text.substr(0, kStderrExcerpt);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    return out;
}

} // anonymous namespace

std::string_view tool_failure_to_string(ToolFailure failure) {
    switch (failure) {
        case ToolFailure::NotFound:        return "not_found";
        case ToolFailure::AuthFailure:     return "auth_failure";
        case ToolFailure::NonZeroExit:     return "non_zero_exit";
        case ToolFailure::Timeout:         return "timeout";
        case ToolFailure::MalformedOutput: return "malformed_output";
    }
    return "non_zero_exit";
}

ToolOutput ProcessToolInvoker::invoke(const ToolInvocation& invocation) {
    int stdout_pipe[2]{-1, -1};
    int stderr_pipe[2]{-1, -1};
    int exec_pipe[2]{-1, -1};  // reports execvp errno; closed by exec on success
    if (::pipe(stdout_pipe) != 0 || ::pipe(stderr_pipe) != 0 || ::pipe(exec_pipe) != 0) {
        int err = errno;
        close_fd(stdout_pipe[0]); close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]); close_fd(stderr_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        throw McpError(std::string("pipe() failed: ") + strerror(err));
    }
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    // Build argv before forking
    std::vector<std::string> argv_store;
    argv_store.reserve(invocation.args.size() + 1);
    argv_store.push_back(invocation.program);
    argv_store.insert(argv_store.end(), invocation.args.begin(), invocation.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_store.size() + 1);
    for (auto& a : argv_store) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_fd(stdout_pipe[0]); close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]); close_fd(stderr_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        throw McpError(std::string("fork() failed: ") + strerror(err));
    }

    if (pid == 0) {
        // Child: never read the protocol stream
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        ::close(exec_pipe[0]);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw ExternalToolError(ToolFailure::NotFound,
                                "cannot execute '" + invocation.program + "': " + strerror(exec_errno));
    }

    // poll both pipes with timeout
    std::string out_buf;
    std::string err_buf;
    bool timed_out = false;
    int fds_open = 2;

    pollfd fds[2]{};
    fds[0].fd = stdout_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = stderr_pipe[0];
    fds[1].events = POLLIN;

    auto deadline = std::chrono::steady_clock::now()
                    + std::min(invocation.timeout, MAX_EXEC_TIMEOUT);

    while (fds_open > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        int ret = ::poll(fds, 2, static_cast<int>(std::min<long long>(
                                     remaining, std::numeric_limits<int>::max())));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            timed_out = true;
            break;
        }

        char chunk[4096];
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --fds_open;
            }
        }
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }
    if (fds[0].fd >= 0) ::close(fds[0].fd);
    if (fds[1].fd >= 0) ::close(fds[1].fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (timed_out) {
        throw ExternalToolError(ToolFailure::Timeout,
                                "'" + invocation.program + "' timed out after "
                                    + std::to_string(invocation.timeout.count()) + " ms");
    }

    ToolOutput output;
    output.stdout_text = std::move(out_buf);
    output.stderr_text = std::move(err_buf);
    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    } else {
        output.exit_code = 1;
    }

    spdlog::debug("exec: '{}' exited with {}", invocation.program, output.exit_code);

    if (output.exit_code == 127) {
        throw ExternalToolError(ToolFailure::NotFound,
                                "'" + invocation.program + "' not found", output.exit_code);
    }
    // gh reports missing or expired authentication with exit status 4
    if (output.exit_code == 4) {
        throw ExternalToolError(ToolFailure::AuthFailure,
                                "'" + invocation.program + "' is not authenticated: "
                                    + excerpt(output.stderr_text),
                                output.exit_code);
    }
    if (output.exit_code != 0) {
        throw ExternalToolError(ToolFailure::NonZeroExit,
                                "'" + invocation.program + "' exited with status "
                                    + std::to_string(output.exit_code) + ": "
                                    + excerpt(output.stderr_text),
                                output.exit_code);
    }

    if (invocation.expect_json) {
        auto parsed = nlohmann::json::parse(output.stdout_text, nullptr, false);
        if (parsed.is_discarded()) {
            throw ExternalToolError(ToolFailure::MalformedOutput,
                                    "'" + invocation.program + "' did not produce valid JSON",
                                    output.exit_code);
        }
        output.json = std::move(parsed);
    }
    return output;
}

std::optional<ExecSpec> parse_exec_spec(const CommandDefinition& command) {
    auto exec_it = command.metadata.find("exec");
    if (exec_it == command.metadata.end() || exec_it->is_null()) return std::nullopt;

    const std::string where = "command '" + command.name + "': metadata.exec";
    const nlohmann::json& exec = *exec_it;
    if (!exec.is_object()) {
        throw RegistryError(where + " must be a mapping");
    }

    ExecSpec spec;
    auto program_it = exec.find("program");
    if (program_it == exec.end() || !program_it->is_string()
        || program_it->get_ref<const std::string&>().empty()) {
        throw RegistryError(where + ".program must be a non-empty string");
    }
    spec.program = program_it->get<std::string>();

    if (auto args_it = exec.find("args"); args_it != exec.end() && !args_it->is_null()) {
        if (!args_it->is_array()) {
            throw RegistryError(where + ".args must be a list");
        }
        for (const auto& arg : *args_it) {
            if (!arg.is_string()) {
                throw RegistryError(where + ".args entries must be strings");
            }
            auto tmpl = PromptTemplate::compile(arg.get<std::string>());
            for (const auto& name : tmpl.placeholder_names()) {
                if (!command.find_parameter(name)) {
                    throw RegistryError(where + ".args references unknown parameter '" + name + "'");
                }
            }
            spec.args.push_back(std::move(tmpl));
        }
    }

    if (auto timeout_it = exec.find("timeout_ms"); timeout_it != exec.end()) {
        if (!timeout_it->is_number_integer() || timeout_it->get<int64_t>() <= 0) {
            throw RegistryError(where + ".timeout_ms must be a positive integer");
        }
        if (timeout_it->get<int64_t>() > MAX_EXEC_TIMEOUT.count()) {
            throw RegistryError(where + ".timeout_ms exceeds "
                                + std::to_string(MAX_EXEC_TIMEOUT.count()) + " ms");
        }
        spec.timeout = std::chrono::milliseconds(timeout_it->get<int64_t>());
    }

    if (auto output_it = exec.find("output"); output_it != exec.end()) {
        if (*output_it == "json") {
            spec.json_output = true;
        } else if (*output_it != "text") {
            throw RegistryError(where + ".output must be 'text' or 'json'");
        }
    }
    return spec;
}

ToolInvocation build_invocation(const ExecSpec& spec, const nlohmann::json& arguments,
                                std::chrono::milliseconds default_timeout) {
    ToolInvocation invocation;
    invocation.program = spec.program;
    invocation.args.reserve(spec.args.size());
    for (const auto& tmpl : spec.args) {
        invocation.args.push_back(tmpl.render(arguments));
    }
    invocation.timeout = spec.timeout.value_or(default_timeout);
    invocation.expect_json = spec.json_output;
    return invocation;
}

} // namespace rapidmcp
