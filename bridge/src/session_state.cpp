/**
 * session_state.cpp — Implementation
 */

#include "session_state.hpp"

#include <algorithm>

namespace interview_coach {

MetricHistory::MetricHistory(std::size_t capacity)
    : slots_(std::max<std::size_t>(capacity, 1))
{
}

void MetricHistory::push(const MetricVector& vector) {
    slots_[head_] = vector;
    head_ = (head_ + 1) % slots_.size();
    if (size_ < slots_.size()) {
        ++size_;
    }
}

const MetricVector& MetricHistory::operator[](std::size_t index) const {
    // Oldest entry sits `size_` slots behind the write head.
    std::size_t oldest = (head_ + slots_.size() - size_) % slots_.size();
    return slots_[(oldest + index) % slots_.size()];
}

MetricHistory MetricHistory::resized(std::size_t capacity) const {
    MetricHistory copy(capacity);
    std::size_t keep = std::min(size_, copy.capacity());
    for (std::size_t i = size_ - keep; i < size_; ++i) {
        copy.push((*this)[i]);
    }
    return copy;
}

} // namespace interview_coach
