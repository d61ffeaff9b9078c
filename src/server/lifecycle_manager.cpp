#include "portwarden/server/lifecycle_manager.hpp"
#include "portwarden/core/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace portwarden::server {

namespace net = boost::asio;
using net::use_awaitable;

auto lifecycle_options_from(const Config& config) -> LifecycleOptions {
    LifecycleOptions options;
    options.scan = infra::scan_options_from(config.scanner);
    options.preferred_ports = config.server.preferred_ports;
    return options;
}

ServerLifecycleManager::ServerLifecycleManager(net::io_context& ioc,
                                               infra::PortScanner& scanner,
                                               infra::PortStateStore& store,
                                               ListenerFactory listener_factory,
                                               StatusSink status_sink,
                                               LifecycleOptions options)
    : ioc_(ioc)
    , scanner_(scanner)
    , store_(store)
    , listener_factory_(std::move(listener_factory))
    , status_sink_(std::move(status_sink))
    , options_(std::move(options))
    , restart_timer_(ioc)
    , renotify_timer_(ioc)
{
}

ServerLifecycleManager::~ServerLifecycleManager() {
    dispose();
}

auto ServerLifecycleManager::start_server(uint16_t start, uint16_t end)
    -> awaitable<Result<uint16_t>> {
    if (disposed_) {
        LOG_WARN("Server manager is disposed, not starting server");
        co_return make_fail(make_error(ErrorCode::Disposed, "Server manager is disposed"));
    }

    emit(ServerStatus::Starting);

    auto port = co_await select_port(start, end);

    // A scan in flight is allowed to finish; its result is dropped here.
    if (disposed_) {
        LOG_WARN("Server manager was disposed during port finding, not starting server");
        co_return make_fail(make_error(ErrorCode::Disposed, "Server manager is disposed"));
    }

    if (!port) {
        auto message = "Could not find available port in range " +
                       std::to_string(start) + "-" + std::to_string(end);
        LOG_ERROR("{}", message);
        emit(ServerStatus::Error, std::nullopt, message);
        co_return make_fail(make_error(ErrorCode::NoPortAvailable, message));
    }

    close_listener();

    auto chosen = *port;
    auto generation = listener_generation_;
    listener_ = listener_factory_([this, chosen, generation, start, end](const Error& error) {
        if (generation != listener_generation_) {
            LOG_DEBUG("Ignoring error from replaced listener on port {}: {}", chosen, error.what());
            return;
        }
        handle_runtime_error(chosen, error, start, end);
    });

    auto listened = listener_->listen(chosen);
    if (!listened) {
        handle_runtime_error(chosen, listened.error(), start, end);
        co_return make_fail(listened.error());
    }

    // A restart armed before or during this start is superseded.
    restart_timer_.cancel();
    restart_pending_ = false;

    current_port_ = chosen;
    if (auto saved = store_.save(chosen); !saved) {
        LOG_WARN("Could not persist port {}: {}", chosen, saved.error().what());
    }

    LOG_INFO("Server running on port {}", chosen);
    emit(ServerStatus::Running, chosen);
    schedule_running_renotify(chosen);

    co_return chosen;
}

auto ServerLifecycleManager::restart_server(uint16_t start, uint16_t end)
    -> awaitable<Result<uint16_t>> {
    if (disposed_) {
        co_return make_fail(make_error(ErrorCode::Disposed, "Server manager is disposed"));
    }

    LOG_INFO("Restarting server on port range {}-{}", start, end);
    restart_timer_.cancel();
    renotify_timer_.cancel();
    restart_pending_ = false;
    close_listener();
    current_port_.reset();

    co_return co_await start_server(start, end);
}

void ServerLifecycleManager::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    restart_pending_ = false;

    restart_timer_.cancel();
    renotify_timer_.cancel();
    close_listener();
    current_port_.reset();

    emit(ServerStatus::Stopped);
    LOG_INFO("Server manager disposed");
}

void ServerLifecycleManager::update_options(LifecycleOptions options) {
    options_ = std::move(options);
    LOG_INFO("Server manager options updated (timeout {}ms, concurrency {}, retries {})",
             options_.scan.timeout.count(), options_.scan.concurrency, options_.scan.retries);
}

auto ServerLifecycleManager::has_listener() const noexcept -> bool {
    return listener_ && listener_->is_open();
}

auto ServerLifecycleManager::select_port(uint16_t start, uint16_t end)
    -> awaitable<std::optional<uint16_t>> {
    auto last = store_.load();

    if (last && (*last < start || *last > end)) {
        LOG_INFO("Last successful port {} is outside range {}-{}, ignoring it", *last, start, end);
        last.reset();
    }

    if (last && blacklist_.contains(*last)) {
        LOG_INFO("Last successful port {} is blacklisted for this session", *last);
    } else if (last) {
        LOG_INFO("Trying last successful port: {}", *last);
        if (co_await scanner_.confirm_port(*last, options_.scan.timeout)) {
            LOG_INFO("Last port {} is available, using it", *last);
            co_return *last;
        }
        LOG_INFO("Last port {} is no longer available, searching for new port", *last);
    }

    auto scan = options_.scan;
    scan.preferred_ports.clear();
    if (last) {
        scan.preferred_ports.push_back(*last);
    }
    scan.preferred_ports.insert(scan.preferred_ports.end(),
                                options_.preferred_ports.begin(),
                                options_.preferred_ports.end());
    scan.excluded_ports.insert(blacklist_.begin(), blacklist_.end());

    co_return co_await scanner_.find_available_port(start, end, std::move(scan));
}

void ServerLifecycleManager::handle_runtime_error(uint16_t port, const Error& error,
                                                  uint16_t start, uint16_t end) {
    if (disposed_) {
        LOG_DEBUG("Ignoring error on port {} after dispose: {}", port, error.what());
        return;
    }

    LOG_ERROR("Server error on port {}: {} ({})", port, error.what(),
              error_code_to_string(error.code()));
    current_port_.reset();

    if (error.code() == ErrorCode::AddressInUse) {
        if (store_.load() == port) {
            if (auto cleared = store_.clear(); !cleared) {
                LOG_WARN("Could not clear persisted port {}: {}", port, cleared.error().what());
            }
        }
        blacklist_.insert(port);
        LOG_WARN("Port {} blacklisted for this session", port);

        emit(ServerStatus::Error, port, "Port " + std::to_string(port) + " is already in use");
        schedule_restart(options_.address_in_use_backoff, start, end);
        return;
    }

    emit(ServerStatus::Error, port, error.what());
    schedule_restart(options_.error_backoff, start, end);
}

void ServerLifecycleManager::schedule_restart(Millis delay, uint16_t start, uint16_t end) {
    if (disposed_) {
        return;
    }

    LOG_INFO("Restarting server in {}ms", delay.count());
    restart_pending_ = true;
    // Re-arming cancels any earlier pending restart; only the latest fires.
    restart_timer_.expires_after(delay);

    net::co_spawn(ioc_,
        [this, start, end]() -> awaitable<void> {
            boost::system::error_code ec;
            co_await restart_timer_.async_wait(net::redirect_error(use_awaitable, ec));

            // A start that succeeded meanwhile clears the pending flag.
            if (ec == net::error::operation_aborted || disposed_ || !restart_pending_) {
                co_return;
            }
            restart_pending_ = false;

            LOG_INFO("Attempting to automatically restart server...");
            close_listener();

            try {
                auto result = co_await start_server(start, end);
                if (!result) {
                    LOG_WARN("Failed to restart server: {}", result.error().what());
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to restart server: {}", e.what());
            }
        },
        net::detached);
}

void ServerLifecycleManager::schedule_running_renotify(uint16_t port) {
    renotify_timer_.expires_after(options_.running_renotify_delay);

    net::co_spawn(ioc_,
        [this, port]() -> awaitable<void> {
            boost::system::error_code ec;
            co_await renotify_timer_.async_wait(net::redirect_error(use_awaitable, ec));

            if (ec == net::error::operation_aborted || disposed_) {
                co_return;
            }
            if (status_ == ServerStatus::Running && current_port_ == port) {
                LOG_DEBUG("Additional delayed status update to running");
                emit(ServerStatus::Running, port);
            }
        },
        net::detached);
}

void ServerLifecycleManager::close_listener() {
    ++listener_generation_;
    if (listener_) {
        listener_->close();
        listener_.reset();
    }
}

void ServerLifecycleManager::emit(ServerStatus status, std::optional<uint16_t> port,
                                  std::optional<std::string> message) {
    status_ = status;
    if (!status_sink_) {
        return;
    }

    try {
        status_sink_(StatusEvent{status, port, std::move(message)});
    } catch (const std::exception& e) {
        LOG_WARN("Status sink rejected '{}' notification: {}", to_string(status), e.what());
    }
}

} // namespace portwarden::server
