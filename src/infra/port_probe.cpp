#include "portwarden/infra/port_probe.hpp"
#include "portwarden/core/logger.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace portwarden::infra {

namespace net = boost::asio;
using tcp = net::ip::tcp;

auto classify_bind_error(const boost::system::error_code& ec) -> ErrorCode {
    if (ec == net::error::address_in_use) return ErrorCode::AddressInUse;
    if (ec == net::error::access_denied) return ErrorCode::PermissionDenied;
    if (ec == boost::system::errc::address_not_available) return ErrorCode::AddressNotAvailable;
    return ErrorCode::ListenFailed;
}

SocketPortProbe::SocketPortProbe(net::io_context& ioc)
    : ioc_(ioc)
{
}

auto SocketPortProbe::probe(uint16_t port, Millis /*timeout*/) -> awaitable<ProbeOutcome> {
    tcp::acceptor acceptor(ioc_);
    tcp::endpoint endpoint(net::ip::address_v4::loopback(), port);

    boost::system::error_code ec;
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(net::socket_base::max_listen_connections, ec);
    }

    // Release before reporting so the caller can bind it.
    boost::system::error_code close_ec;
    acceptor.close(close_ec);

    // Yield so sibling probes in the same batch interleave.
    co_await net::post(ioc_, net::use_awaitable);

    if (ec) {
        auto code = classify_bind_error(ec);
        if (code == ErrorCode::ListenFailed) {
            LOG_DEBUG("Port {} is unavailable: {}", port, ec.message());
        } else {
            LOG_DEBUG("Port {} is in use or restricted ({}): {}", port,
                      error_code_to_string(code), ec.message());
        }
        co_return ProbeOutcome::make_unavailable(std::string(error_code_to_string(code)));
    }

    LOG_TRACE("Port {} is available", port);
    co_return ProbeOutcome::make_available();
}

} // namespace portwarden::infra
