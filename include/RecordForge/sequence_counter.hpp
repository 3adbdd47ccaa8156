#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>

namespace RecordForge {

/// Source of unique values. Every value handed out is strictly greater than all values
/// previously handed out by the same counter, across threads.
class SequenceCounter {
    std::atomic<std::int64_t> m_last;

public:
    explicit SequenceCounter(std::int64_t last = 0): m_last(last) {}

    SequenceCounter(const SequenceCounter&) = delete;
    SequenceCounter& operator=(const SequenceCounter&) = delete;

    // nullopt once the last value was INT64_MAX; the counter then stays there
    std::optional<std::int64_t> tryNext() {
        std::int64_t current = m_last.load(std::memory_order_relaxed);
        do {
            if(current == std::numeric_limits<std::int64_t>::max()) {
                return std::nullopt;
            }
        } while(!m_last.compare_exchange_weak(current, current + 1, std::memory_order_relaxed));
        return current + 1;
    }

    /// Throws std::bad_optional_access when the counter is exhausted.
    std::int64_t next() {
        return tryNext().value();
    }

    std::int64_t last() const {
        return m_last.load(std::memory_order_relaxed);
    }
};

} // namespace RecordForge
