#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>

#include "portwarden/core/types.hpp"

namespace portwarden::infra {

/// Last known availability of a port and when it was observed.
struct CacheEntry {
    bool available = false;
    Timestamp timestamp;
};

/// TTL cache of port availability verdicts.
///
/// Entries are never evicted proactively: an entry older than the TTL is
/// dropped the next time it is read. The cache can hand out a stale
/// "available" verdict within the TTL window; callers confirm such
/// verdicts with a fresh probe and handle bind races themselves.
class PortAvailabilityCache {
public:
    static constexpr Millis kDefaultTtl{30000};

    explicit PortAvailabilityCache(Millis ttl = kDefaultTtl, NowFn now = steady_now);

    /// Cached verdict for `port`, or nullopt if unknown or expired.
    [[nodiscard]] auto get(uint16_t port) -> std::optional<bool>;

    /// Record a verdict, overwriting any previous one and resetting its age.
    void set(uint16_t port, bool available);

    void clear();

    [[nodiscard]] auto size() const noexcept -> size_t { return entries_.size(); }
    [[nodiscard]] auto ttl() const noexcept -> Millis { return ttl_; }
    void set_ttl(Millis ttl) { ttl_ = ttl; }

private:
    Millis ttl_;
    NowFn now_;
    std::unordered_map<uint16_t, CacheEntry> entries_;
};

} // namespace portwarden::infra
