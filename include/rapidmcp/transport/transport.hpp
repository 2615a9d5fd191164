#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace rapidmcp {

/// Callback for each framed input unit (one line, terminator stripped).
using UnitCallback = std::function<void(std::string_view unit)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start reading. Blocks until end of input or shutdown().
    virtual void start(UnitCallback on_unit) = 0;

    /// Write one serialized JSON text followed by the unit terminator.
    virtual void send(const std::string& payload) = 0;

    /// Graceful shutdown; may be called from another thread.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace rapidmcp
