#pragma once

namespace mdmcp {

/// A transport adapter binds session engines to some byte channel.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Serve sessions. Blocks until the channel ends or shutdown() is called.
    virtual void serve() = 0;

    /// Graceful shutdown; safe to call from another thread.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

} // namespace mdmcp
