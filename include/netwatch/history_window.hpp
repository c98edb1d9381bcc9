#ifndef NETWATCH_HISTORY_WINDOW_HPP
#define NETWATCH_HISTORY_WINDOW_HPP

#include "netwatch/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace netwatch {

// Fixed-capacity ring of health snapshots. Appending at capacity evicts the
// oldest entry first. Not synchronized; the owner serializes access.
class HistoryWindow {
public:
    explicit HistoryWindow(size_t capacity);

    void append(HealthSnapshot snapshot);

    size_t size() const noexcept { return size_; }
    size_t capacity() const noexcept { return slots_.size(); }
    bool empty() const noexcept { return size_ == 0; }

    std::optional<HealthSnapshot> latest() const;

    // Oldest first.
    std::vector<HealthSnapshot> snapshot() const;

    // The trailing `count` entries, oldest first; clamps to size().
    std::vector<HealthSnapshot> tail(size_t count) const;

private:
    const HealthSnapshot& at(size_t index) const;

    std::vector<HealthSnapshot> slots_;
    size_t cursor_ = 0;   // next write position
    size_t size_ = 0;
};

} // namespace netwatch

#endif
