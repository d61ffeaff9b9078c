#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "portwarden/core/config.hpp"
#include "portwarden/core/error.hpp"
#include "portwarden/core/types.hpp"
#include "portwarden/infra/port_scanner.hpp"
#include "portwarden/infra/port_state_store.hpp"
#include "portwarden/server/listener.hpp"

namespace portwarden::server {

using boost::asio::awaitable;

/// Tunables of the lifecycle manager.
struct LifecycleOptions {
    /// Timeout/concurrency/retries used for every scan and sticky re-probe.
    infra::ScanOptions scan;

    /// Configured preferred ports, tried after the sticky port.
    std::vector<uint16_t> preferred_ports;

    /// Restart delay after "address in use" on a freshly chosen port.
    Millis address_in_use_backoff{1000};

    /// Restart delay after any other socket error.
    Millis error_backoff{5000};

    /// Delay before the second Running notification.
    Millis running_renotify_delay{1000};
};

[[nodiscard]] auto lifecycle_options_from(const Config& config) -> LifecycleOptions;

/// Owns the server's single listening socket and keeps it alive.
///
/// Port choice: the persisted last successful port is re-probed and reused
/// when it lies in the requested range and is still free. Otherwise a range
/// scan runs with that port and the configured preferred ports in front and
/// the session blacklist excluded.
/// A port that hits "address in use" after being chosen is blacklisted for
/// the rest of the process and the server restarts quickly; other socket
/// errors restart it after a longer backoff, indefinitely, until dispose().
///
/// Status notifications are at-least-once: Running is sent on bind and
/// again after `running_renotify_delay`.
///
/// Everything runs on one io_context thread. The manager, its scanner and
/// its store must outlive any run of that io_context.
class ServerLifecycleManager {
public:
    ServerLifecycleManager(boost::asio::io_context& ioc,
                           infra::PortScanner& scanner,
                           infra::PortStateStore& store,
                           ListenerFactory listener_factory,
                           StatusSink status_sink,
                           LifecycleOptions options = {});
    ~ServerLifecycleManager();

    // Non-copyable, non-movable.
    ServerLifecycleManager(const ServerLifecycleManager&) = delete;
    ServerLifecycleManager& operator=(const ServerLifecycleManager&) = delete;

    /// Choose a port in [start, end], bind it and report Running.
    ///
    /// @returns the bound port; ErrorCode::Disposed after dispose();
    ///          ErrorCode::NoPortAvailable when the scan is exhausted (no
    ///          restart is scheduled); or the bind error, in which case a
    ///          restart has been scheduled.
    auto start_server(uint16_t start, uint16_t end) -> awaitable<Result<uint16_t>>;

    /// Drop the current listener and any pending restart, then start again
    /// on [start, end]. Used when the configured range changes.
    auto restart_server(uint16_t start, uint16_t end) -> awaitable<Result<uint16_t>>;

    /// Close the listener, cancel pending restarts and report Stopped.
    /// Idempotent; nothing transitions out of Stopped afterwards.
    void dispose();

    /// Replace the tunables; applies from the next start attempt.
    void update_options(LifecycleOptions options);

    [[nodiscard]] auto status() const noexcept -> std::optional<ServerStatus> { return status_; }
    [[nodiscard]] auto current_port() const noexcept -> std::optional<uint16_t> { return current_port_; }
    [[nodiscard]] auto is_disposed() const noexcept -> bool { return disposed_; }
    [[nodiscard]] auto blacklist() const noexcept -> const std::set<uint16_t>& { return blacklist_; }
    [[nodiscard]] auto has_listener() const noexcept -> bool;
    [[nodiscard]] auto restart_pending() const noexcept -> bool { return restart_pending_; }

private:
    auto select_port(uint16_t start, uint16_t end) -> awaitable<std::optional<uint16_t>>;
    void handle_runtime_error(uint16_t port, const Error& error, uint16_t start, uint16_t end);
    void schedule_restart(Millis delay, uint16_t start, uint16_t end);
    void schedule_running_renotify(uint16_t port);
    void close_listener();
    void emit(ServerStatus status, std::optional<uint16_t> port = std::nullopt,
              std::optional<std::string> message = std::nullopt);

    boost::asio::io_context& ioc_;
    infra::PortScanner& scanner_;
    infra::PortStateStore& store_;
    ListenerFactory listener_factory_;
    StatusSink status_sink_;
    LifecycleOptions options_;

    std::unique_ptr<Listener> listener_;
    std::set<uint16_t> blacklist_;
    std::optional<ServerStatus> status_;
    std::optional<uint16_t> current_port_;
    // Bumped whenever the listener is dropped; errors carrying an older
    // value come from a listener that is gone.
    uint64_t listener_generation_ = 0;
    bool disposed_ = false;
    bool restart_pending_ = false;

    boost::asio::steady_timer restart_timer_;
    boost::asio::steady_timer renotify_timer_;
};

} // namespace portwarden::server
