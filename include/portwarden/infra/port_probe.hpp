#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "portwarden/core/error.hpp"
#include "portwarden/core/types.hpp"

namespace portwarden::infra {

using boost::asio::awaitable;

/// Result of a single availability probe.
struct ProbeOutcome {
    enum class Kind {
        Available,
        Unavailable,
        TimedOut,
    };

    Kind kind = Kind::Unavailable;
    std::string reason;

    [[nodiscard]] auto available() const noexcept -> bool { return kind == Kind::Available; }

    static auto make_available() -> ProbeOutcome { return {Kind::Available, {}}; }
    static auto make_unavailable(std::string reason) -> ProbeOutcome {
        return {Kind::Unavailable, std::move(reason)};
    }
    static auto make_timed_out() -> ProbeOutcome { return {Kind::TimedOut, "timed out"}; }
};

/// Maps a bind/listen error onto the project error code space.
/// address_in_use, access_denied and address_not_available get their own
/// codes; everything else is ListenFailed.
[[nodiscard]] auto classify_bind_error(const boost::system::error_code& ec) -> ErrorCode;

/// Performs one availability check for a candidate port.
class PortProbe {
public:
    virtual ~PortProbe() = default;

    /// Checks whether `port` can currently be bound. Implementations must
    /// never throw for an unusable port; they report Unavailable instead.
    virtual auto probe(uint16_t port, Millis timeout) -> awaitable<ProbeOutcome> = 0;
};

/// Probes by binding a listening acceptor on 127.0.0.1 and releasing it
/// immediately. A port reported available may be taken by another process
/// before the caller binds it for real.
class SocketPortProbe : public PortProbe {
public:
    explicit SocketPortProbe(boost::asio::io_context& ioc);

    auto probe(uint16_t port, Millis timeout) -> awaitable<ProbeOutcome> override;

private:
    boost::asio::io_context& ioc_;
};

} // namespace portwarden::infra
