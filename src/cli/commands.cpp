#include "portwarden/cli/commands.hpp"
#include "portwarden/core/logger.hpp"
#include "portwarden/infra/port_cache.hpp"
#include "portwarden/infra/port_probe.hpp"
#include "portwarden/infra/port_scanner.hpp"
#include "portwarden/infra/port_state_store.hpp"
#include "portwarden/server/lifecycle_manager.hpp"
#include "portwarden/server/listener.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

namespace portwarden::cli {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using net::awaitable;
using net::use_awaitable;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitInvalidConfig = 2;

/// Runs one coroutine to completion on `ioc` and returns its value.
template <typename T>
auto run_blocking(net::io_context& ioc, awaitable<T> coro) -> T {
    std::optional<T> result;
    std::exception_ptr failure;
    net::co_spawn(ioc, std::move(coro),
        [&result, &failure](std::exception_ptr e, T value) {
            if (e) {
                failure = e;
            } else {
                result = std::move(value);
            }
        });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

/// Answers any HTTP request with the latest status event as JSON.
auto serve_status(tcp::socket socket, std::shared_ptr<const StatusEvent> board)
    -> awaitable<void> {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> req;

    stream.expires_after(std::chrono::seconds(30));
    co_await http::async_read(stream, buffer, req, use_awaitable);

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::server, "portwarden");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = json(*board).dump();
    res.prepare_payload();

    co_await http::async_write(stream, res, use_awaitable);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

auto join(const std::vector<uint16_t>& ports) -> std::string {
    std::string out;
    for (auto port : ports) {
        if (!out.empty()) out += " ";
        out += std::to_string(port);
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, ConfigLoader load, ConfigReloader reload,
                            ExitCodeSink set_exit) {
    auto* sub = app.add_subcommand("serve", "Bind a loopback port and keep the server alive");

    struct Args {
        uint16_t port_start = 0;
        uint16_t port_end = 0;
        bool ephemeral = false;
    };
    auto args = std::make_shared<Args>();

    auto* start_opt = sub->add_option("--port-start", args->port_start,
                                      "First port of the range (overrides config)");
    auto* end_opt = sub->add_option("--port-end", args->port_end,
                                    "Last port of the range (overrides config)");
    sub->add_flag("--ephemeral", args->ephemeral,
                  "Do not read or persist the last successful port");

    auto apply_overrides = [args, start_opt, end_opt](Config& config) {
        if (*start_opt) config.server.port_start = args->port_start;
        if (*end_opt) config.server.port_end = args->port_end;
    };

    sub->callback([load, reload, set_exit, args, apply_overrides]() {
        auto& config = load();
        apply_overrides(config);

        if (auto valid = validate_config(config); !valid) {
            LOG_ERROR("Invalid configuration: {}", valid.error().what());
            set_exit(kExitInvalidConfig);
            return;
        }

        auto start = config.server.port_start;
        auto end = config.server.port_end;
        LOG_INFO("Starting portwarden on 127.0.0.1, port range {}-{}", start, end);

        net::io_context ioc;
        net::signal_set signals(ioc, SIGINT, SIGTERM, SIGHUP);

        infra::PortAvailabilityCache cache(Millis{config.scanner.cache_ttl_ms});
        infra::SocketPortProbe probe(ioc);
        infra::PortScanner scanner(ioc, probe, cache);

        std::unique_ptr<infra::PortStateStore> store;
        if (args->ephemeral) {
            store = std::make_unique<infra::MemoryPortStateStore>();
        } else {
            store = std::make_unique<infra::JsonFilePortStateStore>(resolve_data_dir(config));
        }

        auto board = std::make_shared<StatusEvent>();
        auto factory = server::TcpListener::factory(ioc,
            [board](tcp::socket socket) -> awaitable<void> {
                return serve_status(std::move(socket), board);
            });

        auto sink = [board](const StatusEvent& event) {
            *board = event;
            LOG_INFO("Server status: {}{}{}", to_string(event.status),
                     event.port ? ", port " + std::to_string(*event.port) : std::string{},
                     event.message ? ", " + *event.message : std::string{});
        };

        server::ServerLifecycleManager manager(ioc, scanner, *store, factory, sink,
                                               server::lifecycle_options_from(config));

        auto range = std::make_shared<std::pair<uint16_t, uint16_t>>(start, end);

        // SIGHUP reloads the configuration; SIGINT and SIGTERM shut down.
        net::co_spawn(ioc,
            [&manager, &signals, &cache, reload, apply_overrides, range]() -> awaitable<void> {
                for (;;) {
                    boost::system::error_code ec;
                    int sig = co_await signals.async_wait(net::redirect_error(use_awaitable, ec));
                    if (ec) {
                        co_return;
                    }
                    if (sig != SIGHUP) {
                        LOG_INFO("Received shutdown signal {}", sig);
                        manager.dispose();
                        co_return;
                    }

                    auto fresh = reload();
                    apply_overrides(fresh);
                    if (auto valid = validate_config(fresh); !valid) {
                        LOG_ERROR("Ignoring reloaded configuration: {}", valid.error().what());
                        continue;
                    }

                    cache.set_ttl(Millis{fresh.scanner.cache_ttl_ms});
                    manager.update_options(server::lifecycle_options_from(fresh));

                    auto [old_start, old_end] = *range;
                    if (fresh.server.port_start == old_start && fresh.server.port_end == old_end) {
                        LOG_INFO("Configuration reloaded, options apply on the next start");
                        continue;
                    }

                    LOG_INFO("Port configuration changed, restarting server ({}-{} -> {}-{})",
                             old_start, old_end, fresh.server.port_start, fresh.server.port_end);
                    *range = {fresh.server.port_start, fresh.server.port_end};
                    auto result = co_await manager.restart_server(range->first, range->second);
                    if (!result) {
                        LOG_ERROR("Restart on new port range failed: {}", result.error().what());
                    }
                }
            },
            net::detached);

        net::co_spawn(ioc,
            [&manager, &signals, set_exit, start, end]() -> awaitable<void> {
                auto result = co_await manager.start_server(start, end);
                if (!result && result.error().code() == ErrorCode::NoPortAvailable) {
                    set_exit(kExitFailure);
                    manager.dispose();
                    boost::system::error_code ec;
                    signals.cancel(ec);
                }
            },
            net::detached);

        ioc.run();
        LOG_INFO("portwarden stopped");
    });
}

// ---------------------------------------------------------------------------
// scan command
// ---------------------------------------------------------------------------

void register_scan_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit) {
    auto* sub = app.add_subcommand("scan", "Find available ports in a range");

    struct Args {
        int start = 0;
        int end = 0;
        int count = 1;
        bool randomize = false;
        bool high_to_low = false;
        std::vector<uint16_t> exclude;
        std::vector<uint16_t> preferred;
    };
    auto args = std::make_shared<Args>();

    auto* start_opt = sub->add_option("--start", args->start, "First port (default: config)");
    auto* end_opt = sub->add_option("--end", args->end, "Last port (default: config)");
    sub->add_option("-n,--count", args->count, "Number of ports to find")
        ->check(CLI::PositiveNumber);
    sub->add_flag("--randomize", args->randomize, "Probe candidates in random order");
    sub->add_flag("--high-to-low", args->high_to_low, "Probe from the top of the range");
    sub->add_option("--exclude", args->exclude, "Ports never to return");
    sub->add_option("--preferred", args->preferred, "Ports to try first");

    sub->callback([load, set_exit, args, start_opt, end_opt]() {
        auto& config = load();
        auto start = *start_opt ? args->start : static_cast<int>(config.server.port_start);
        auto end = *end_opt ? args->end : static_cast<int>(config.server.port_end);

        auto options = infra::scan_options_from(config.scanner);
        options.randomize = args->randomize;
        options.from_high_to_low = args->high_to_low;
        options.excluded_ports.insert(args->exclude.begin(), args->exclude.end());
        options.preferred_ports = args->preferred;

        net::io_context ioc;
        infra::PortAvailabilityCache cache(Millis{config.scanner.cache_ttl_ms});
        infra::SocketPortProbe probe(ioc);
        infra::PortScanner scanner(ioc, probe, cache);

        auto ports = run_blocking(ioc,
            scanner.find_multiple_available_ports(args->count, start, end, options));

        if (ports.empty()) {
            std::cerr << "No available port in range " << start << "-" << end << "\n";
            set_exit(kExitFailure);
            return;
        }
        std::cout << join(ports) << "\n";
        if (static_cast<int>(ports.size()) < args->count) {
            set_exit(kExitFailure);
        }
    });
}

// ---------------------------------------------------------------------------
// preferred command
// ---------------------------------------------------------------------------

void register_preferred_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit) {
    auto* sub = app.add_subcommand("preferred",
                                   "Try preferred ports, then a random high window");

    auto ports = std::make_shared<std::vector<uint16_t>>();
    sub->add_option("ports", *ports, "Preferred ports (default: 3000 8080 8000 5000 4000 9000)");

    sub->callback([load, set_exit, ports]() {
        auto& config = load();
        auto options = infra::scan_options_from(config.scanner);
        options.preferred_ports = *ports;

        net::io_context ioc;
        infra::PortAvailabilityCache cache(Millis{config.scanner.cache_ttl_ms});
        infra::SocketPortProbe probe(ioc);
        infra::PortScanner scanner(ioc, probe, cache);

        auto port = run_blocking(ioc, scanner.find_preferred_port(options));
        if (!port) {
            std::cerr << "No available port found\n";
            set_exit(kExitFailure);
            return;
        }
        std::cout << *port << "\n";
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit) {
    auto* sub = app.add_subcommand("check", "Report whether a port is in use");

    auto port = std::make_shared<uint16_t>(0);
    sub->add_option("port", *port, "Port to check")->required();

    sub->callback([load, set_exit, port]() {
        auto& config = load();

        net::io_context ioc;
        infra::PortAvailabilityCache cache(Millis{config.scanner.cache_ttl_ms});
        infra::SocketPortProbe probe(ioc);
        infra::PortScanner scanner(ioc, probe, cache);

        auto in_use = run_blocking(ioc,
            scanner.is_port_in_use(*port, Millis{config.scanner.timeout_ms}));
        std::cout << "Port " << *port << (in_use ? " is in use" : " is available") << "\n";
        if (in_use) {
            set_exit(kExitFailure);
        }
    });
}

// ---------------------------------------------------------------------------
// common-ports command
// ---------------------------------------------------------------------------

void register_common_ports_command(CLI::App& app, ConfigLoader load) {
    auto* sub = app.add_subcommand("common-ports",
                                   "Show availability of well-known service ports");

    sub->callback([load]() {
        auto& config = load();

        net::io_context ioc;
        infra::PortAvailabilityCache cache(Millis{config.scanner.cache_ttl_ms});
        infra::SocketPortProbe probe(ioc);
        infra::PortScanner scanner(ioc, probe, cache);

        auto statuses = run_blocking(ioc, scanner.common_ports_status());
        for (const auto& [name, available] : statuses) {
            std::cout << name << ": " << (available ? "available" : "in use") << "\n";
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, ConfigLoader load, ExitCodeSink set_exit) {
    auto* sub = app.add_subcommand("config", "Show and validate the effective configuration");

    sub->callback([load, set_exit]() {
        auto& config = load();
        json j = config;
        j["data_dir"] = resolve_data_dir(config).string();
        std::cout << j.dump(2) << "\n";

        if (auto valid = validate_config(config); !valid) {
            std::cerr << "Invalid configuration: " << valid.error().what() << "\n";
            set_exit(kExitInvalidConfig);
        }
    });
}

} // namespace portwarden::cli
