#include "trade/rolling_buffer.hpp"
#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace surge {

RollingBuffer::RollingBuffer(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("RollingBuffer capacity must be at least 1");
    }
}

void RollingBuffer::append(const TradeSample& sample) {
    samples_.push_back(sample);

    if (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

std::vector<TradeSample> RollingBuffer::last_n(std::size_t n) const {
    auto count = std::min(n, samples_.size());
    auto first = samples_.end() - static_cast<std::ptrdiff_t>(count);
    return std::vector<TradeSample>(first, samples_.end());
}

std::optional<TradeSample> RollingBuffer::latest() const {
    if (samples_.empty()) {
        return std::nullopt;
    }
    return samples_.back();
}

std::size_t RollingBuffer::size() const noexcept {
    return samples_.size();
}

std::size_t RollingBuffer::capacity() const noexcept {
    return capacity_;
}

bool RollingBuffer::empty() const noexcept {
    return samples_.empty();
}

}  // namespace surge
