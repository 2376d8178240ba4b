#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace surge {

/// Fixed-capacity FIFO history of trades in arrival order
///
/// Not thread-safe: owned by the ingestion loop only.
class RollingBuffer {
public:
    /// Default capacity: one hour of 1/sec trades
    static constexpr std::size_t kDefaultCapacity = 3600;

    /// Create a buffer holding at most `capacity` samples
    /// @throws std::invalid_argument if capacity is zero
    explicit RollingBuffer(std::size_t capacity = kDefaultCapacity);

    /// Append a sample, evicting the oldest one when full
    void append(const TradeSample& sample);

    /// The n most recent samples, oldest first
    /// Returns fewer than n if the buffer holds fewer
    [[nodiscard]] std::vector<TradeSample> last_n(std::size_t n) const;

    /// Most recently appended sample, if any
    [[nodiscard]] std::optional<TradeSample> latest() const;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

private:
    std::deque<TradeSample> samples_;
    std::size_t capacity_;
};

}  // namespace surge
