#pragma once

#include <chrono>  // std::chrono::{seconds, steady_clock}
#include <utility> // std::move

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace nimbus::utils::cache {
  namespace types = ::nimbus::utils::types;

  using TimePoint = std::chrono::steady_clock::time_point;

  /**
   * @brief Time source used to stamp and age cache entries.
   */
  using Clock = types::Fn<TimePoint()>;

  inline fn SteadyClock() -> Clock {
    return [] { return std::chrono::steady_clock::now(); };
  }

  /**
   * @class TtlCache
   * @brief In-memory key/value store whose entries go stale after a fixed time-to-live.
   *
   * @details Expiry is lazy: an entry is only ever removed by the `get` that finds it
   * stale (or by `clear`). There is no background sweeping and no size bound, so keys
   * that are never read again stay resident until the cache is cleared.
   *
   * Every operation takes the instance mutex, which makes each call atomic with respect
   * to the stored (timestamp, value) pair. Nothing is held across calls.
   *
   * @tparam Value Stored type. Returned by copy.
   */
  template <typename Value>
  class TtlCache {
    struct Entry {
      TimePoint insertedAt;
      Value     value;
    };

    std::chrono::seconds                     m_ttl;
    Clock                                    m_now;
    mutable types::Mutex                     m_mutex;
    types::UnorderedMap<types::String, Entry> m_entries;

   public:
    explicit TtlCache(const std::chrono::seconds ttl, Clock now = SteadyClock())
      : m_ttl(ttl), m_now(std::move(now)) {}

    TtlCache(const TtlCache&)                = delete;
    TtlCache(TtlCache&&)                     = delete;
    fn operator=(const TtlCache&)->TtlCache& = delete;
    fn operator=(TtlCache&&)->TtlCache&      = delete;

    ~TtlCache() = default;

    /**
     * @brief Looks up a fresh value.
     * @param key Cache key.
     * @return The value if present and no older than the TTL; None otherwise.
     * @note A stale entry is erased as a side effect.
     */
    fn get(const types::String& key) -> types::Option<Value> {
      const types::LockGuard lock(m_mutex);

      const auto iter = m_entries.find(key);

      if (iter == m_entries.end())
        return types::None;

      if (m_now() - iter->second.insertedAt > m_ttl) {
        m_entries.erase(iter);
        return types::None;
      }

      return iter->second.value;
    }

    /**
     * @brief Inserts or replaces the entry for `key`, stamped with the current time.
     */
    fn set(const types::String& key, Value value) -> types::Unit {
      const TimePoint now = m_now();

      const types::LockGuard lock(m_mutex);

      m_entries.insert_or_assign(key, Entry { .insertedAt = now, .value = std::move(value) });
    }

    fn clear() -> types::Unit {
      const types::LockGuard lock(m_mutex);
      m_entries.clear();
    }

    /**
     * @brief Read-through lookup.
     * @details On a miss the fetcher runs without the lock held, so two callers missing
     * the same key may both fetch; the later `set` wins. A failed fetch is returned
     * unchanged and nothing is stored.
     * @param key Cache key.
     * @param fetcher Callable returning types::Result<Value>.
     */
    template <typename FetcherFunc>
    fn getOrSet(const types::String& key, FetcherFunc&& fetcher) -> types::Result<Value> {
      if (types::Option<Value> cached = get(key)) {
        debug_log("Cache hit for '{}'", key);
        return std::move(*cached);
      }

      debug_log("Cache miss for '{}'", key);

      types::Result<Value> fetched = std::forward<FetcherFunc>(fetcher)();

      if (!fetched)
        return fetched;

      set(key, *fetched);

      return fetched;
    }

    /**
     * @brief Number of entries physically stored, stale ones included.
     */
    [[nodiscard]] fn size() const -> types::usize {
      const types::LockGuard lock(m_mutex);
      return m_entries.size();
    }

    [[nodiscard]] fn ttl() const -> std::chrono::seconds {
      return m_ttl;
    }
  };
} // namespace nimbus::utils::cache
