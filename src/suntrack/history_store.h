#pragma once

/**
 * @file history_store.h
 * @brief Size-capped FIFO history of decoded reports and derived events.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

namespace suntrack {

/** @brief Default capacity of the raw report history. */
constexpr std::size_t kReportHistoryCapacity = 1000;

/** @brief Default capacity of the beacon/ignition event history. */
constexpr std::size_t kEventHistoryCapacity = 10000;

/**
 * @brief Counters for history diagnostics.
 */
struct HistoryMetrics {
    uint64_t appended{0};   ///< Entries ever appended
    uint64_t evicted{0};    ///< Entries dropped because the cap was exceeded
};

/**
 * @brief Append-only ordered collection with a fixed cap.
 *
 * Once the cap is exceeded the oldest entry is removed. Eviction depends
 * on insertion order only; reads never refresh an entry.
 *
 * Not synchronised: the owner guards appends and snapshots with its own
 * lock so that a history append and the related session update are seen
 * together (see TelemetryGateway).
 *
 * @tparam T Entry type (copyable)
 *
 * @code{cpp}
 *   BoundedHistory<BeaconScanEvent> events(kEventHistoryCapacity);
 *   events.Append(event);
 *   auto copy = events.Snapshot();   // oldest first
 * @endcode
 */
template<typename T>
class BoundedHistory {
public:
    explicit BoundedHistory(std::size_t capacity)
        : m_capacity(capacity > 0 ? capacity : 1) {}

    /**
     * @brief Append an entry, evicting the oldest if the cap is exceeded.
     * @return true if an entry was evicted
     */
    bool Append(T entry) {
        m_entries.push_back(std::move(entry));
        ++m_metrics.appended;
        if (m_entries.size() > m_capacity) {
            m_entries.pop_front();
            ++m_metrics.evicted;
            return true;
        }
        return false;
    }

    /**
     * @brief Append a batch in order.
     */
    template<typename InputIt>
    void AppendRange(InputIt first, InputIt last) {
        for (auto it = first; it != last; ++it) {
            Append(*it);
        }
    }

    /**
     * @brief Copy of the current contents, oldest first.
     */
    std::vector<T> Snapshot() const {
        return std::vector<T>(m_entries.begin(), m_entries.end());
    }

    std::size_t Size() const { return m_entries.size(); }
    std::size_t Capacity() const { return m_capacity; }
    bool Empty() const { return m_entries.empty(); }

    void Clear() { m_entries.clear(); }

    HistoryMetrics GetMetrics() const { return m_metrics; }

private:
    std::size_t m_capacity;
    std::deque<T> m_entries;
    HistoryMetrics m_metrics{};
};

} // namespace suntrack
