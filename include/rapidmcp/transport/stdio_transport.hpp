#pragma once
#include "transport.hpp"
#include <atomic>
#include <cstddef>
#include <string>

namespace rapidmcp {

/// StdioTransport reads newline-delimited JSON from a file descriptor and
/// writes newline-terminated JSON to another. Reads and writes happen on the
/// calling thread; shutdown() interrupts a blocked read through a self-pipe.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are closed on destruction only when owns_fds is set.
    StdioTransport(int read_fd, int write_fd, bool owns_fds = false);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(UnitCallback on_unit) override;
    void send(const std::string& payload) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const UnitCallback& on_unit);
    void emit_unit(std::string line, const UnitCallback& on_unit);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up the reader
};

} // namespace rapidmcp
