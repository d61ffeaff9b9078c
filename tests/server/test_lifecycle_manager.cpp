#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "portwarden/server/lifecycle_manager.hpp"
#include "../test_helpers.hpp"

using namespace portwarden;
using namespace portwarden::server;
using portwarden::infra::MemoryPortStateStore;
using portwarden::infra::PortAvailabilityCache;
using portwarden::infra::PortScanner;
using portwarden::testing::drain;
using portwarden::testing::FakeProbe;
using portwarden::testing::ListenerLog;
using portwarden::testing::fake_listener_factory;
using portwarden::testing::run_sync;

namespace {

auto fast_options() -> LifecycleOptions {
    LifecycleOptions options;
    options.scan.timeout = Millis{100};
    options.scan.retries = 0;
    options.address_in_use_backoff = Millis{5};
    options.error_backoff = Millis{10};
    options.running_renotify_delay = Millis{5};
    return options;
}

// Everything a manager needs, declared so the manager is destroyed first.
struct Harness {
    explicit Harness(LifecycleOptions options = fast_options(),
                     std::optional<uint16_t> last_port = std::nullopt)
        : scanner(ioc, ports, cache)
        , log(std::make_shared<ListenerLog>())
        , manager(ioc, scanner, store, fake_listener_factory(log),
                  [this](const StatusEvent& event) { events.push_back(event); },
                  std::move(options))
    {
        if (last_port) {
            (void)store.save(*last_port);
        }
    }

    auto count(ServerStatus status) const -> long {
        return std::count_if(events.begin(), events.end(),
            [status](const StatusEvent& e) { return e.status == status; });
    }

    boost::asio::io_context ioc;
    FakeProbe ports;
    PortAvailabilityCache cache;
    PortScanner scanner;
    MemoryPortStateStore store;
    std::shared_ptr<ListenerLog> log;
    std::vector<StatusEvent> events;
    ServerLifecycleManager manager;
};

} // namespace

TEST_CASE("start_server binds the first port and reports Running twice", "[lifecycle]") {
    Harness h;

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));

    REQUIRE(result.has_value());
    CHECK(*result == 9960);
    CHECK(h.manager.status() == ServerStatus::Running);
    CHECK(h.manager.current_port() == uint16_t{9960});
    CHECK(h.manager.has_listener());
    CHECK(h.store.load() == uint16_t{9960});

    REQUIRE(h.events.size() == 3);
    CHECK(h.events[0].status == ServerStatus::Starting);
    CHECK(h.events[1].status == ServerStatus::Running);
    CHECK(h.events[1].port == uint16_t{9960});
    CHECK(h.events[2].status == ServerStatus::Running);
    CHECK(h.events[2].port == uint16_t{9960});
}

TEST_CASE("start_server reuses the last successful port", "[lifecycle]") {
    Harness h(fast_options(), uint16_t{9975});

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));

    REQUIRE(result.has_value());
    CHECK(*result == 9975);
    // Only the sticky port was probed; no range scan ran.
    CHECK(h.ports.calls == std::vector<uint16_t>{9975});
    CHECK(h.log->listened == std::vector<uint16_t>{9975});
}

TEST_CASE("start_server scans when the last port is taken", "[lifecycle]") {
    Harness h(fast_options(), uint16_t{9975});
    h.ports.set_available(9975, false);

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));

    REQUIRE(result.has_value());
    CHECK(*result == 9960);
    CHECK(h.ports.call_count(9975) == 1);
    CHECK(h.store.load() == uint16_t{9960});
}

TEST_CASE("start_server tries configured preferred ports first", "[lifecycle]") {
    auto options = fast_options();
    options.preferred_ports = {9980, 9970};
    Harness h(options);

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));

    REQUIRE(result.has_value());
    CHECK(*result == 9980);
}

TEST_CASE("Exhausted range reports Error without restarting", "[lifecycle]") {
    Harness h;
    FakeProbe unavailable(false);
    PortScanner scanner(h.ioc, unavailable, h.cache);
    std::vector<StatusEvent> events;
    ServerLifecycleManager manager(h.ioc, scanner, h.store, fake_listener_factory(h.log),
                                   [&events](const StatusEvent& e) { events.push_back(e); },
                                   fast_options());

    auto result = run_sync(h.ioc, manager.start_server(9960, 9962));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::NoPortAvailable);
    CHECK_FALSE(manager.restart_pending());
    CHECK(h.log->listened.empty());

    REQUIRE(events.size() == 2);
    CHECK(events[1].status == ServerStatus::Error);
    REQUIRE(events[1].message.has_value());
    CHECK(*events[1].message == "Could not find available port in range 9960-9962");
}

TEST_CASE("Address in use after binding blacklists the port", "[lifecycle]") {
    auto options = fast_options();
    options.preferred_ports = {9975};
    Harness h(options);

    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)) == uint16_t{9975});
    REQUIRE(h.store.load() == uint16_t{9975});

    h.log->trigger(make_error(ErrorCode::AddressInUse, "listen EADDRINUSE 127.0.0.1:9975"));

    CHECK(h.manager.blacklist().contains(9975));
    CHECK_FALSE(h.store.load().has_value());
    CHECK(h.manager.status() == ServerStatus::Error);
    CHECK(h.manager.restart_pending());

    drain(h.ioc);

    // The automatic restart picked another port and never returns 9975.
    REQUIRE(h.manager.current_port().has_value());
    CHECK(*h.manager.current_port() != 9975);
    CHECK(h.manager.status() == ServerStatus::Running);
    CHECK(h.log->max_open == 1);
    CHECK(h.log->open == 1);

    // Later scans in the same session still skip it.
    REQUIRE(h.store.clear().has_value());
    REQUIRE(run_sync(h.ioc, h.manager.start_server(9975, 9976)) == uint16_t{9976});
}

TEST_CASE("Address in use on bind restarts on the next port", "[lifecycle]") {
    Harness h;
    h.log->refuse.insert(9960);

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::AddressInUse);
    CHECK(h.manager.blacklist().contains(9960));

    // run_sync drained the scheduled restart as well.
    CHECK(h.manager.current_port() == uint16_t{9961});
    CHECK(h.log->listened == std::vector<uint16_t>{9960, 9961});
}

TEST_CASE("Other listener errors restart with the slower backoff", "[lifecycle]") {
    Harness h;

    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)) == uint16_t{9960});

    h.log->trigger(make_error(ErrorCode::AcceptFailed, "Accept failed on port 9960"));
    CHECK(h.manager.blacklist().empty());
    CHECK(h.store.load() == uint16_t{9960});

    drain(h.ioc);

    CHECK(h.manager.current_port() == uint16_t{9960});
    CHECK(h.log->listened == std::vector<uint16_t>{9960, 9960});
    CHECK(h.log->max_open == 1);
}

TEST_CASE("At most one listener is open across restarts", "[lifecycle]") {
    Harness h;

    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)).has_value());
    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)).has_value());

    CHECK(h.log->listened.size() == 2);
    CHECK(h.log->max_open == 1);
    CHECK(h.log->open == 1);
}

TEST_CASE("A successful start supersedes a pending restart", "[lifecycle]") {
    Harness h;

    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)) == uint16_t{9960});
    h.log->trigger(make_error(ErrorCode::AcceptFailed, "Accept failed on port 9960"));
    REQUIRE(h.manager.restart_pending());

    // Started again before the restart timer fires.
    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)) == uint16_t{9960});

    CHECK_FALSE(h.manager.restart_pending());
    CHECK(h.log->listened.size() == 2);
    CHECK(h.count(ServerStatus::Running) == 4);
    CHECK(h.log->max_open == 1);

    SECTION("errors from the replaced listener are ignored") {
        REQUIRE(h.log->error_callbacks.size() == 2);
        h.log->error_callbacks[0](make_error(ErrorCode::AcceptFailed, "Accept failed on port 9960"));

        CHECK(h.manager.status() == ServerStatus::Running);
        CHECK_FALSE(h.manager.restart_pending());
        CHECK(h.manager.current_port() == uint16_t{9960});

        drain(h.ioc);

        CHECK(h.log->listened.size() == 2);
        CHECK(h.count(ServerStatus::Error) == 1);
        CHECK(h.log->open == 1);
    }
}

TEST_CASE("Updated options apply on the next start", "[lifecycle]") {
    Harness h;

    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)) == uint16_t{9960});

    auto options = fast_options();
    options.preferred_ports = {9985};
    options.scan.retries = 1;
    h.manager.update_options(options);
    h.ports.fail_times(9985, 1);

    auto result = run_sync(h.ioc, h.manager.restart_server(9980, 9990));

    // 9960 lies outside the new range, so the scan picks the preferred port
    // and the extra retry gets it past the first refusal.
    REQUIRE(result.has_value());
    CHECK(*result == 9985);
    CHECK(h.ports.call_count(9985) == 2);
    CHECK(h.ports.call_count(9960) == 1);
    CHECK(h.log->listened == std::vector<uint16_t>{9960, 9985});
    CHECK(h.log->max_open == 1);
    CHECK(h.log->open == 1);
    CHECK(h.store.load() == uint16_t{9985});
}

TEST_CASE("A last port outside the requested range is not reused", "[lifecycle]") {
    Harness h(fast_options(), uint16_t{9000});

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));

    REQUIRE(result.has_value());
    CHECK(*result == 9960);
    CHECK(h.ports.call_count(9000) == 0);
    CHECK(h.store.load() == uint16_t{9960});
}

TEST_CASE("dispose during port selection stops the start", "[lifecycle]") {
    Harness h;
    h.ports.set_delay(9960, Millis{50});

    boost::asio::steady_timer stop(h.ioc, Millis{10});
    stop.async_wait([&h](const boost::system::error_code& ec) {
        if (!ec) {
            h.manager.dispose();
        }
    });

    auto result = run_sync(h.ioc, h.manager.start_server(9960, 9960));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Disposed);
    CHECK(h.ports.completions == std::vector<uint16_t>{9960});
    CHECK(h.log->listened.empty());
    CHECK_FALSE(h.manager.has_listener());
    CHECK(h.manager.status() == ServerStatus::Stopped);
    REQUIRE_FALSE(h.events.empty());
    CHECK(h.events.back().status == ServerStatus::Stopped);
    CHECK(h.count(ServerStatus::Running) == 0);
}

TEST_CASE("dispose is final", "[lifecycle]") {
    Harness h;

    REQUIRE(run_sync(h.ioc, h.manager.start_server(9960, 9990)).has_value());
    h.log->trigger(make_error(ErrorCode::AddressInUse, "listen EADDRINUSE"));
    REQUIRE(h.manager.restart_pending());

    h.manager.dispose();
    h.manager.dispose();

    CHECK(h.manager.is_disposed());
    CHECK(h.manager.status() == ServerStatus::Stopped);
    CHECK(h.log->open == 0);
    auto events_after_dispose = h.events.size();

    // Advance past the restart timer.
    h.ioc.restart();
    h.ioc.run_for(std::chrono::milliseconds(50));

    CHECK(h.log->listened.size() == 1);
    CHECK(h.events.size() == events_after_dispose);
    CHECK(h.events.back().status == ServerStatus::Stopped);
    CHECK(h.count(ServerStatus::Stopped) == 1);

    SECTION("start_server refuses to run") {
        auto result = run_sync(h.ioc, h.manager.start_server(9960, 9990));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::Disposed);
        CHECK(h.events.size() == events_after_dispose);
    }
}

TEST_CASE("Status sink failures do not break the lifecycle", "[lifecycle]") {
    boost::asio::io_context ioc;
    FakeProbe ports;
    PortAvailabilityCache cache;
    PortScanner scanner(ioc, probe, cache);
    MemoryPortStateStore store;
    auto log = std::make_shared<ListenerLog>();
    ServerLifecycleManager manager(ioc, scanner, store, fake_listener_factory(log),
        [](const StatusEvent&) { throw std::runtime_error("sink closed"); },
        fast_options());

    auto result = run_sync(ioc, manager.start_server(9960, 9990));

    REQUIRE(result.has_value());
    CHECK(manager.status() == ServerStatus::Running);
}
