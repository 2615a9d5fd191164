#include "rapidmcp/transport/stdio_transport.hpp"
#include "rapidmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace rapidmcp {

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(UnitCallback on_unit) {
    // If shutdown() was called before start(), return without blocking.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    // shutdown() may have raced with the check above
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }
    connected_ = true;
    read_loop(on_unit);
    running_ = false;
    connected_ = false;
}

void StdioTransport::emit_unit(std::string line, const UnitCallback& on_unit) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) return;
    on_unit(line);
}

void StdioTransport::read_loop(const UnitCallback& on_unit) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("poll failed: ") + strerror(errno));
        }

        // Wakeup pipe has data → shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            throw McpTransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            // EOF: a final unterminated line still counts as a unit
            if (!buffer.empty()) {
                emit_unit(std::move(buffer), on_unit);
                buffer.clear();
            }
            spdlog::debug("transport: end of input");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            emit_unit(std::move(line), on_unit);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::send(const std::string& payload) {
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    std::string framed = payload;
    framed += '\n';
    const char* data = framed.data();
    size_t remaining = framed.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) {
        return;
    }
    connected_ = false;
    // Write to wakeup pipe to interrupt poll() in read_loop().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            spdlog::warn("transport: failed to signal shutdown: {}", strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace rapidmcp
