/**
 * session_state.hpp — Per-session coaching state
 *
 * MetricHistory is a fixed-capacity ring buffer: storage is allocated once
 * at construction and pushing past capacity overwrites the oldest entry.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "metric_vector.hpp"

namespace interview_coach {

class MetricHistory {
public:
    explicit MetricHistory(std::size_t capacity = 8);

    /**
     * Append as most recent; evicts the oldest entry when full.
     */
    void push(const MetricVector& vector);

    /**
     * Entry by age: 0 is the oldest retained, size()-1 the most recent.
     */
    const MetricVector& operator[](std::size_t index) const;

    /**
     * Copy into a buffer of `capacity` slots, keeping the most recent
     * entries that fit.
     */
    MetricHistory resized(std::size_t capacity) const;

    const MetricVector& back() const { return (*this)[size_ - 1]; }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

private:
    std::vector<MetricVector> slots_;
    std::size_t head_ = 0;   // slot the next push writes to
    std::size_t size_ = 0;
};

struct SessionState {
    std::string session_id;
    std::string current_state_id;

    // Unset until the first transition: the initial state imposes no dwell.
    std::optional<int64_t> entered_state_at_ms;

    // Vectors recorded on transitions, most recent last.
    MetricHistory metric_history;

    // Previous tick's vector, used to carry values across sensor gaps.
    std::optional<MetricVector> last_vector;

    int64_t created_at_ms = 0;
    int64_t last_tick_at_ms = 0;
};

} // namespace interview_coach
