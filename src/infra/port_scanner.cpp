#include "portwarden/infra/port_scanner.hpp"
#include "portwarden/core/logger.hpp"

#include <algorithm>
#include <memory>
#include <unordered_set>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace portwarden::infra {

namespace net = boost::asio;
using net::use_awaitable;

namespace {

// Well-known service ports reported by common_ports_status().
const std::vector<std::pair<std::string, uint16_t>> kCommonPorts = {
    {"HTTP", 80},
    {"HTTPS", 443},
    {"SSH", 22},
    {"FTP", 21},
    {"SMTP", 25},
    {"POP3", 110},
    {"IMAP", 143},
    {"MySQL", 3306},
    {"PostgreSQL", 5432},
    {"MongoDB", 27017},
    {"Redis", 6379},
    {"Elasticsearch", 9200},
    {"Node Default", 3000},
    {"React Default", 5173},
    {"Angular Default", 4200},
    {"Django Default", 8000},
    {"Flask Default", 5000},
};

auto join_ports(const std::vector<uint16_t>& ports) -> std::string {
    std::string out;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(ports[i]);
    }
    return out;
}

auto elapsed_ms(Timestamp since) -> long long {
    return std::chrono::duration_cast<Millis>(Clock::now() - since).count();
}

/// Moves the preferred ports that are present in `ports` to the front,
/// keeping the preferred order and dropping duplicates.
void prioritize(std::vector<uint16_t>& ports, const std::vector<uint16_t>& preferred) {
    if (preferred.empty()) return;

    std::unordered_set<uint16_t> present(ports.begin(), ports.end());
    std::unordered_set<uint16_t> taken;
    std::vector<uint16_t> ordered;
    ordered.reserve(ports.size());

    for (auto port : preferred) {
        if (present.contains(port) && taken.insert(port).second) {
            ordered.push_back(port);
        }
    }
    for (auto port : ports) {
        if (!taken.contains(port)) {
            ordered.push_back(port);
        }
    }
    ports = std::move(ordered);
}

// Join state for a set of concurrently spawned checks. The timer never
// expires on its own; the last finisher cancels it to wake the waiter.
struct JoinState {
    explicit JoinState(net::any_io_executor ex, size_t count)
        : done(ex, Clock::time_point::max())
        , pending(count)
        , results(count, false) {}

    net::steady_timer done;
    size_t pending;
    std::vector<bool> results;
};

// Shared between a probe and its timeout guard; whichever settles first wins.
struct TimedProbeState {
    explicit TimedProbeState(net::any_io_executor ex) : timer(ex) {}

    net::steady_timer timer;
    std::optional<ProbeOutcome> outcome;
};

} // anonymous namespace

auto scan_options_from(const ScannerConfig& config) -> ScanOptions {
    ScanOptions options;
    options.timeout = Millis{config.timeout_ms};
    options.concurrency = config.concurrency;
    options.retries = config.retries;
    return options;
}

PortScanner::PortScanner(net::io_context& ioc, PortProbe& probe,
                         PortAvailabilityCache& cache)
    : ioc_(ioc)
    , probe_(probe)
    , cache_(cache)
    , rng_(std::random_device{}())
{
}

auto PortScanner::find_available_port(int start, int end, ScanOptions options)
    -> awaitable<std::optional<uint16_t>> {
    if (start < 0 || start > 65535 || end < 0 || end > 65535 || start > end) {
        LOG_ERROR("Invalid port range: {}-{}", start, end);
        co_return std::nullopt;
    }

    auto concurrency = static_cast<size_t>(std::max(1, options.concurrency));
    auto retries = std::max(0, options.retries);
    auto started = Clock::now();

    LOG_INFO("Scanning for available port in range: {}-{}, concurrency: {}",
             start, end, concurrency);

    std::vector<uint16_t> ports;
    ports.reserve(static_cast<size_t>(end - start + 1));
    for (int p = start; p <= end; ++p) {
        auto port = static_cast<uint16_t>(p);
        if (!options.excluded_ports.contains(port)) {
            ports.push_back(port);
        }
    }

    // A cached "available" may be stale; confirm before trusting it.
    for (auto port : ports) {
        if (cache_.get(port) == true) {
            if (co_await confirm_port(port, options.timeout)) {
                LOG_INFO("Found available port (from cache): {}", port);
                co_return port;
            }
        }
    }

    std::erase_if(ports, [this](uint16_t port) { return cache_.get(port) == false; });

    if (options.from_high_to_low) {
        std::reverse(ports.begin(), ports.end());
    }
    if (options.randomize) {
        std::shuffle(ports.begin(), ports.end(), rng_);
    }
    prioritize(ports, options.preferred_ports);

    auto timeout = options.timeout;
    for (size_t i = 0; i < ports.size(); i += concurrency) {
        auto last = std::min(i + concurrency, ports.size());
        std::vector<uint16_t> batch(ports.begin() + static_cast<std::ptrdiff_t>(i),
                                    ports.begin() + static_cast<std::ptrdiff_t>(last));

        auto results = co_await check_all(batch,
            [this, timeout, retries](uint16_t port) -> awaitable<bool> {
                co_return co_await check_with_retries(port, timeout, retries);
            });

        for (size_t j = 0; j < batch.size(); ++j) {
            cache_.set(batch[j], results[j]);
        }

        auto hit = std::find(results.begin(), results.end(), true);
        if (hit != results.end()) {
            auto port = batch[static_cast<size_t>(std::distance(results.begin(), hit))];
            LOG_INFO("Found available port: {} (took {}ms)", port, elapsed_ms(started));
            co_return port;
        }
    }

    LOG_WARN("No available ports found in range: {}-{} (took {}ms)",
             start, end, elapsed_ms(started));
    co_return std::nullopt;
}

auto PortScanner::find_preferred_port(ScanOptions options)
    -> awaitable<std::optional<uint16_t>> {
    std::vector<uint16_t> preferred = options.preferred_ports;
    if (preferred.empty()) {
        preferred.assign(kDefaultPreferredPorts.begin(), kDefaultPreferredPorts.end());
    }
    std::erase_if(preferred, [&options](uint16_t port) {
        return options.excluded_ports.contains(port);
    });

    LOG_INFO("Checking preferred ports first: {}", join_ports(preferred));

    auto timeout = options.timeout;
    auto retries = std::max(0, options.retries);
    auto results = co_await check_all(preferred,
        [this, timeout, retries](uint16_t port) -> awaitable<bool> {
            co_return co_await check_with_retries(port, timeout, retries);
        });

    for (size_t i = 0; i < preferred.size(); ++i) {
        cache_.set(preferred[i], results[i]);
    }
    for (size_t i = 0; i < preferred.size(); ++i) {
        if (results[i]) {
            LOG_INFO("Found available preferred port: {}", preferred[i]);
            co_return preferred[i];
        }
    }

    std::uniform_int_distribution<int> offset(0, 39999);
    auto random_start = 10000 + offset(rng_);
    auto random_end = random_start + kFallbackWindow;
    LOG_INFO("No preferred ports available, checking random range: {}-{}",
             random_start, random_end);

    auto fallback = std::move(options);
    fallback.preferred_ports.clear();
    fallback.randomize = true;
    fallback.concurrency = kFallbackConcurrency;
    co_return co_await find_available_port(random_start, random_end, std::move(fallback));
}

auto PortScanner::confirm_port(uint16_t port, Millis timeout) -> awaitable<bool> {
    auto outcome = co_await probe_with_timeout(port, timeout);
    cache_.set(port, outcome.available());
    co_return outcome.available();
}

auto PortScanner::is_port_in_use(uint16_t port, Millis timeout) -> awaitable<bool> {
    auto outcome = co_await probe_with_timeout(port, timeout);
    co_return !outcome.available();
}

auto PortScanner::find_multiple_available_ports(int count, int start, int end,
                                                ScanOptions options)
    -> awaitable<std::vector<uint16_t>> {
    std::vector<uint16_t> found;
    if (count <= 0) {
        co_return found;
    }

    for (int i = 0; i < count; ++i) {
        auto port = co_await find_available_port(start, end, options);
        if (!port) {
            LOG_WARN("Could only find {} of {} requested ports", found.size(), count);
            break;
        }
        found.push_back(*port);
        options.excluded_ports.insert(*port);
    }

    co_return found;
}

auto PortScanner::common_ports_status(Millis timeout)
    -> awaitable<std::map<std::string, bool>> {
    auto started = Clock::now();
    LOG_INFO("Checking status of {} common ports", kCommonPorts.size());

    std::map<std::string, bool> statuses;
    for (size_t i = 0; i < kCommonPorts.size(); i += kCommonPortsBatch) {
        auto last = std::min(i + kCommonPortsBatch, kCommonPorts.size());

        std::vector<uint16_t> batch;
        for (size_t j = i; j < last; ++j) {
            batch.push_back(kCommonPorts[j].second);
        }

        auto results = co_await check_all(batch,
            [this, timeout](uint16_t port) -> awaitable<bool> {
                auto outcome = co_await probe_with_timeout(port, timeout);
                co_return outcome.available();
            });

        for (size_t j = i; j < last; ++j) {
            const auto& [name, port] = kCommonPorts[j];
            auto available = results[j - i];
            statuses[name + " (" + std::to_string(port) + ")"] = available;
            cache_.set(port, available);
        }
    }

    LOG_INFO("Completed common ports status check in {}ms", elapsed_ms(started));
    co_return statuses;
}

void PortScanner::clear_cache() {
    cache_.clear();
}

auto PortScanner::check_all(const std::vector<uint16_t>& ports, PortCheck check)
    -> awaitable<std::vector<bool>> {
    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<JoinState>(executor, ports.size());

    for (size_t i = 0; i < ports.size(); ++i) {
        net::co_spawn(executor,
            [state, check, i, port = ports[i]]() -> awaitable<void> {
                bool ok = false;
                try {
                    ok = co_await check(port);
                } catch (const std::exception& e) {
                    LOG_WARN("Port {} check failed: {}", port, e.what());
                }
                state->results[i] = ok;
                if (--state->pending == 0) {
                    state->done.cancel();
                }
            },
            net::detached);
    }

    while (state->pending > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(net::redirect_error(use_awaitable, ec));
    }

    co_return state->results;
}

auto PortScanner::probe_with_timeout(uint16_t port, Millis timeout)
    -> awaitable<ProbeOutcome> {
    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<TimedProbeState>(executor);
    state->timer.expires_after(timeout);

    net::co_spawn(executor,
        [this, state, port, timeout]() -> awaitable<void> {
            auto outcome = ProbeOutcome::make_unavailable("probe failed");
            try {
                outcome = co_await probe_.probe(port, timeout);
            } catch (const std::exception& e) {
                LOG_WARN("Error attempting to probe port {}: {}", port, e.what());
            }
            if (!state->outcome) {
                state->outcome = std::move(outcome);
                state->timer.cancel();
            }
        },
        net::detached);

    if (!state->outcome) {
        boost::system::error_code ec;
        co_await state->timer.async_wait(net::redirect_error(use_awaitable, ec));
    }

    if (!state->outcome) {
        LOG_INFO("Port check timed out for port: {}", port);
        state->outcome = ProbeOutcome::make_timed_out();
    }
    co_return *state->outcome;
}

auto PortScanner::check_with_retries(uint16_t port, Millis timeout, int retries)
    -> awaitable<bool> {
    if (auto cached = cache_.get(port)) {
        co_return *cached;
    }

    for (int attempt = 0; attempt <= retries; ++attempt) {
        auto outcome = co_await probe_with_timeout(port, timeout);
        if (outcome.available()) {
            co_return true;
        }

        if (attempt < retries) {
            net::steady_timer delay(ioc_, kRetryDelay);
            co_await delay.async_wait(use_awaitable);
        } else {
            LOG_DEBUG("Port {} unavailable after {} attempt(s): {}",
                      port, attempt + 1, outcome.reason);
        }
    }

    co_return false;
}

} // namespace portwarden::infra
