#include "portwarden/infra/port_cache.hpp"
#include "portwarden/core/logger.hpp"

namespace portwarden::infra {

PortAvailabilityCache::PortAvailabilityCache(Millis ttl, NowFn now)
    : ttl_(ttl)
    , now_(std::move(now))
{
}

auto PortAvailabilityCache::get(uint16_t port) -> std::optional<bool> {
    auto it = entries_.find(port);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (now_() - it->second.timestamp > ttl_) {
        LOG_TRACE("Port cache: entry for {} expired", port);
        entries_.erase(it);
        return std::nullopt;
    }

    return it->second.available;
}

void PortAvailabilityCache::set(uint16_t port, bool available) {
    entries_.insert_or_assign(port, CacheEntry{
        .available = available,
        .timestamp = now_(),
    });
}

void PortAvailabilityCache::clear() {
    entries_.clear();
    LOG_INFO("Port status cache cleared");
}

} // namespace portwarden::infra
