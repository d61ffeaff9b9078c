#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "portwarden/core/error.hpp"

namespace portwarden::server {

using boost::asio::awaitable;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/// Serves one accepted connection. The bytes on the wire are the
/// handler's business; the listener never inspects them.
using ConnectionHandler = std::function<awaitable<void>(tcp::socket)>;

/// Invoked at most once when a listening socket fails after binding.
using ListenerErrorCallback = std::function<void(const Error&)>;

/// A listening socket bound to the loopback interface.
class Listener {
public:
    virtual ~Listener() = default;

    /// Bind and listen on 127.0.0.1:`port`. Bind failures are returned with
    /// ErrorCode::AddressInUse / PermissionDenied / AddressNotAvailable /
    /// ListenFailed.
    virtual auto listen(uint16_t port) -> VoidResult = 0;

    /// Stop accepting and release the port. Safe to call repeatedly.
    virtual void close() = 0;

    [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;
    [[nodiscard]] virtual auto port() const noexcept -> std::optional<uint16_t> = 0;
};

/// Creates a listener that reports post-bind failures through `on_error`.
using ListenerFactory =
    std::function<std::unique_ptr<Listener>(ListenerErrorCallback on_error)>;

/// Boost.Asio acceptor with an accept loop running on the io_context.
class TcpListener : public Listener {
public:
    TcpListener(net::io_context& ioc, ConnectionHandler handler,
                ListenerErrorCallback on_error);
    ~TcpListener() override;

    // Non-copyable, non-movable.
    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    auto listen(uint16_t port) -> VoidResult override;
    void close() override;

    [[nodiscard]] auto is_open() const noexcept -> bool override;
    [[nodiscard]] auto port() const noexcept -> std::optional<uint16_t> override { return port_; }

    /// Factory producing TcpListeners that share `handler`.
    [[nodiscard]] static auto factory(net::io_context& ioc, ConnectionHandler handler)
        -> ListenerFactory;

    struct AcceptState;

private:
    net::io_context& ioc_;
    ConnectionHandler handler_;
    ListenerErrorCallback on_error_;
    std::shared_ptr<AcceptState> state_;
    std::optional<uint16_t> port_;
};

} // namespace portwarden::server
