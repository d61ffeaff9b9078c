#include "portwarden/server/listener.hpp"
#include "portwarden/core/logger.hpp"
#include "portwarden/infra/port_probe.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace portwarden::server {

// The accept loop keeps this alive through its own reference, so closing
// or destroying the TcpListener never leaves the loop with a dangling
// acceptor.
struct TcpListener::AcceptState {
    AcceptState(net::io_context& ioc, ConnectionHandler h, ListenerErrorCallback e)
        : acceptor(ioc), handler(std::move(h)), on_error(std::move(e)) {}

    tcp::acceptor acceptor;
    ConnectionHandler handler;
    ListenerErrorCallback on_error;
    bool closed = false;
};

namespace {

auto accept_loop(std::shared_ptr<TcpListener::AcceptState> state, uint16_t port)
    -> awaitable<void> {
    while (!state->closed) {
        boost::system::error_code ec;
        auto socket = co_await state->acceptor.async_accept(
            net::redirect_error(net::use_awaitable, ec));

        if (state->closed || ec == net::error::operation_aborted) {
            break;
        }

        if (ec) {
            LOG_ERROR("Accept failed on port {}: {}", port, ec.message());
            state->closed = true;
            if (state->on_error) {
                state->on_error(make_error(
                    ErrorCode::AcceptFailed,
                    "Accept failed on port " + std::to_string(port),
                    ec.message()));
            }
            break;
        }

        if (!state->handler) {
            boost::system::error_code close_ec;
            socket.close(close_ec);
            continue;
        }

        net::co_spawn(state->acceptor.get_executor(),
            [handler = state->handler, socket = std::move(socket), port]() mutable
                -> awaitable<void> {
                try {
                    co_await handler(std::move(socket));
                } catch (const std::exception& e) {
                    LOG_WARN("Connection handler on port {} failed: {}", port, e.what());
                }
            },
            net::detached);
    }

    LOG_DEBUG("Accept loop on port {} finished", port);
}

} // anonymous namespace

TcpListener::TcpListener(net::io_context& ioc, ConnectionHandler handler,
                         ListenerErrorCallback on_error)
    : ioc_(ioc)
    , handler_(std::move(handler))
    , on_error_(std::move(on_error))
{
}

TcpListener::~TcpListener() {
    close();
}

auto TcpListener::listen(uint16_t port) -> VoidResult {
    close();

    auto state = std::make_shared<AcceptState>(ioc_, handler_, on_error_);
    tcp::endpoint endpoint(net::ip::address_v4::loopback(), port);

    boost::system::error_code ec;
    state->acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        state->acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        state->acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        state->acceptor.listen(net::socket_base::max_listen_connections, ec);
    }

    if (ec) {
        boost::system::error_code close_ec;
        state->acceptor.close(close_ec);
        return std::unexpected(make_error(
            infra::classify_bind_error(ec),
            "Failed to listen on 127.0.0.1:" + std::to_string(port),
            ec.message()));
    }

    state_ = state;
    port_ = port;
    net::co_spawn(ioc_, accept_loop(std::move(state), port), net::detached);

    LOG_INFO("Listening on 127.0.0.1:{}", port);
    return {};
}

void TcpListener::close() {
    if (!state_) {
        return;
    }

    state_->closed = true;
    boost::system::error_code ec;
    state_->acceptor.close(ec);
    if (ec) {
        LOG_DEBUG("Closing acceptor on port {}: {}", port_.value_or(0), ec.message());
    }

    LOG_INFO("Listener on port {} closed", port_.value_or(0));
    state_.reset();
    port_.reset();
}

auto TcpListener::is_open() const noexcept -> bool {
    return state_ && !state_->closed && state_->acceptor.is_open();
}

auto TcpListener::factory(net::io_context& ioc, ConnectionHandler handler)
    -> ListenerFactory {
    return [&ioc, handler = std::move(handler)](ListenerErrorCallback on_error) {
        return std::make_unique<TcpListener>(ioc, handler, std::move(on_error));
    };
}

} // namespace portwarden::server
