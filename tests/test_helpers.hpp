#pragma once

#include <algorithm>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "portwarden/core/error.hpp"
#include "portwarden/core/types.hpp"
#include "portwarden/infra/port_probe.hpp"
#include "portwarden/server/listener.hpp"

namespace portwarden::testing {

namespace net = boost::asio;

// Runs a coroutine to completion on `ioc`, draining every other piece of
// work queued on it as well (retry delays, restart timers, ...).
template <typename T>
auto run_sync(net::io_context& ioc, net::awaitable<T> coro) -> T {
    std::optional<T> result;
    std::exception_ptr failure;
    net::co_spawn(ioc, std::move(coro),
        [&](std::exception_ptr e, T value) {
            if (e) {
                failure = e;
            } else {
                result = std::move(value);
            }
        });
    ioc.restart();
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

// Runs whatever is pending on `ioc` until it runs out of work.
inline void drain(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

// Clock whose "now" only moves when the test says so.
class ManualClock {
public:
    ManualClock() : now_(std::make_shared<Timestamp>(Clock::now())) {}

    void advance(Millis delta) { *now_ += delta; }

    [[nodiscard]] auto fn() const -> NowFn {
        return [now = now_]() { return *now; };
    }

private:
    std::shared_ptr<Timestamp> now_;
};

// Scripted probe: availability per port, optional per-port latency and a
// number of failures to report before a port turns available.
class FakeProbe : public infra::PortProbe {
public:
    explicit FakeProbe(bool default_available = true)
        : default_available_(default_available) {}

    void set_available(uint16_t port, bool available) { available_[port] = available; }
    void set_delay(uint16_t port, Millis delay) { delays_[port] = delay; }
    void fail_times(uint16_t port, int count) { failures_[port] = count; }

    auto probe(uint16_t port, Millis /*timeout*/) -> net::awaitable<infra::ProbeOutcome> override {
        calls.push_back(port);

        if (auto it = delays_.find(port); it != delays_.end()) {
            net::steady_timer timer(co_await net::this_coro::executor, it->second);
            co_await timer.async_wait(net::use_awaitable);
        }
        completions.push_back(port);

        if (auto it = failures_.find(port); it != failures_.end() && it->second > 0) {
            --it->second;
            co_return infra::ProbeOutcome::make_unavailable("ADDRESS_IN_USE");
        }

        auto it = available_.find(port);
        bool available = it != available_.end() ? it->second : default_available_;
        if (available) {
            co_return infra::ProbeOutcome::make_available();
        }
        co_return infra::ProbeOutcome::make_unavailable("ADDRESS_IN_USE");
    }

    [[nodiscard]] auto call_count(uint16_t port) const -> long {
        return std::count(calls.begin(), calls.end(), port);
    }

    std::vector<uint16_t> calls;
    std::vector<uint16_t> completions;

private:
    bool default_available_;
    std::map<uint16_t, bool> available_;
    std::map<uint16_t, Millis> delays_;
    std::map<uint16_t, int> failures_;
};

// Bookkeeping shared by every FakeListener a factory creates.
struct ListenerLog {
    int open = 0;
    int max_open = 0;
    std::vector<uint16_t> listened;
    std::set<uint16_t> refuse;
    std::vector<server::ListenerErrorCallback> error_callbacks;

    // Reports a post-bind failure through the most recent listener.
    void trigger(const Error& error) {
        if (!error_callbacks.empty() && error_callbacks.back()) {
            error_callbacks.back()(error);
        }
    }
};

class FakeListener : public server::Listener {
public:
    explicit FakeListener(std::shared_ptr<ListenerLog> log) : log_(std::move(log)) {}
    ~FakeListener() override { close(); }

    auto listen(uint16_t port) -> VoidResult override {
        log_->listened.push_back(port);
        if (log_->refuse.contains(port)) {
            return std::unexpected(make_error(ErrorCode::AddressInUse,
                "Failed to listen on 127.0.0.1:" + std::to_string(port),
                "Address already in use"));
        }
        port_ = port;
        ++log_->open;
        log_->max_open = std::max(log_->max_open, log_->open);
        return {};
    }

    void close() override {
        if (port_) {
            --log_->open;
            port_.reset();
        }
    }

    [[nodiscard]] auto is_open() const noexcept -> bool override { return port_.has_value(); }
    [[nodiscard]] auto port() const noexcept -> std::optional<uint16_t> override { return port_; }

private:
    std::shared_ptr<ListenerLog> log_;
    std::optional<uint16_t> port_;
};

inline auto fake_listener_factory(std::shared_ptr<ListenerLog> log) -> server::ListenerFactory {
    return [log](server::ListenerErrorCallback on_error) {
        log->error_callbacks.push_back(std::move(on_error));
        return std::make_unique<FakeListener>(log);
    };
}

} // namespace portwarden::testing
