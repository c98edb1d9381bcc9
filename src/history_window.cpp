#include "netwatch/history_window.hpp"

#include "netwatch/errors.hpp"

#include <utility>

namespace netwatch {

HistoryWindow::HistoryWindow(size_t capacity)
    : slots_(capacity)
{
    if (capacity == 0) {
        throw ConfigurationError("history capacity must be positive");
    }
}

void HistoryWindow::append(HealthSnapshot snapshot) {
    slots_[cursor_] = std::move(snapshot);
    cursor_ = (cursor_ + 1) % slots_.size();
    if (size_ < slots_.size()) {
        ++size_;
    }
}

const HealthSnapshot& HistoryWindow::at(size_t index) const {
    size_t oldest = (cursor_ + slots_.size() - size_) % slots_.size();
    return slots_[(oldest + index) % slots_.size()];
}

std::optional<HealthSnapshot> HistoryWindow::latest() const {
    if (size_ == 0) {
        return std::nullopt;
    }
    return at(size_ - 1);
}

std::vector<HealthSnapshot> HistoryWindow::snapshot() const {
    return tail(size_);
}

std::vector<HealthSnapshot> HistoryWindow::tail(size_t count) const {
    if (count > size_) {
        count = size_;
    }
    std::vector<HealthSnapshot> result;
    result.reserve(count);
    for (size_t i = size_ - count; i < size_; ++i) {
        result.push_back(at(i));
    }
    return result;
}

} // namespace netwatch
