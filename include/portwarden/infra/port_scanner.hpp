#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "portwarden/core/config.hpp"
#include "portwarden/core/types.hpp"
#include "portwarden/infra/port_cache.hpp"
#include "portwarden/infra/port_probe.hpp"

namespace portwarden::infra {

using boost::asio::awaitable;

/// Parameters of a single scan.
struct ScanOptions {
    Millis timeout{400};
    int concurrency = 8;
    int retries = 1;
    std::vector<uint16_t> preferred_ports;
    std::set<uint16_t> excluded_ports;
    bool randomize = false;
    bool from_high_to_low = false;
};

/// Builds scan options from the scanner section of the configuration.
[[nodiscard]] auto scan_options_from(const ScannerConfig& config) -> ScanOptions;

/// Finds usable ports by batched parallel probing.
///
/// Probes within a batch run concurrently as coroutines on the scanner's
/// io_context; the batch is only evaluated once every probe has settled,
/// and the winner is the first candidate by position, never the first
/// probe to finish. Batches run strictly one after another.
class PortScanner {
public:
    /// Delay between attempts of the per-port retry loop.
    static constexpr Millis kRetryDelay{50};

    /// Preferred ports used by find_preferred_port() when none are given.
    static constexpr std::array<uint16_t, 6> kDefaultPreferredPorts = {
        3000, 8080, 8000, 5000, 4000, 9000};

    /// Width and concurrency of the random fallback window.
    static constexpr int kFallbackWindow = 1000;
    static constexpr int kFallbackConcurrency = 10;

    /// Batch size and probe timeout for common_ports_status().
    static constexpr size_t kCommonPortsBatch = 5;
    static constexpr Millis kCommonPortsTimeout{200};

    PortScanner(boost::asio::io_context& ioc, PortProbe& probe,
                PortAvailabilityCache& cache);

    // Non-copyable, non-movable.
    PortScanner(const PortScanner&) = delete;
    PortScanner& operator=(const PortScanner&) = delete;

    /// Returns the first usable port in [start, end], or nullopt when the
    /// range is invalid or exhausted. Preferred ports that remain candidates
    /// are tried ahead of the rest, in their given order.
    auto find_available_port(int start, int end, ScanOptions options = {})
        -> awaitable<std::optional<uint16_t>>;

    /// Checks the preferred ports in one parallel batch, then falls back to
    /// a randomized scan of a window inside [10000, 51000].
    auto find_preferred_port(ScanOptions options = {})
        -> awaitable<std::optional<uint16_t>>;

    /// One timed probe of `port`; the verdict is written to the cache.
    auto confirm_port(uint16_t port, Millis timeout) -> awaitable<bool>;

    /// True if `port` cannot currently be bound. Bypasses the cache.
    auto is_port_in_use(uint16_t port, Millis timeout = Millis{400}) -> awaitable<bool>;

    /// Finds up to `count` distinct ports in [start, end]. Returns fewer if
    /// the range runs out.
    auto find_multiple_available_ports(int count, int start = 8000, int end = 9000,
                                       ScanOptions options = {})
        -> awaitable<std::vector<uint16_t>>;

    /// Availability of well-known service ports, keyed "Name (port)".
    auto common_ports_status(Millis timeout = kCommonPortsTimeout)
        -> awaitable<std::map<std::string, bool>>;

    void clear_cache();

    [[nodiscard]] auto cache() noexcept -> PortAvailabilityCache& { return cache_; }

    /// Reseeds the shuffle/fallback generator (deterministic tests).
    void seed(uint32_t value) { rng_.seed(value); }

private:
    using PortCheck = std::function<awaitable<bool>(uint16_t)>;

    /// Runs `check` for every port concurrently and waits for all of them.
    /// results[i] belongs to ports[i].
    auto check_all(const std::vector<uint16_t>& ports, PortCheck check)
        -> awaitable<std::vector<bool>>;

    /// Probe guarded by `timeout`; a late result is discarded.
    auto probe_with_timeout(uint16_t port, Millis timeout) -> awaitable<ProbeOutcome>;

    /// Cache first, then up to retries + 1 probes spaced by kRetryDelay.
    auto check_with_retries(uint16_t port, Millis timeout, int retries) -> awaitable<bool>;

    boost::asio::io_context& ioc_;
    PortProbe& probe_;
    PortAvailabilityCache& cache_;
    std::mt19937 rng_;
};

} // namespace portwarden::infra
