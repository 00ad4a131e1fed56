#include "HistoryRing.h"

namespace afc {

HistoryRing::HistoryRing(int capacity)
    : capacity_(capacity > 0 ? capacity : 1) {
    buf_.assign(static_cast<std::size_t>(capacity_), 0.0);
}

void HistoryRing::push(double v) {
    if (capacity_ <= 0) return;
    buf_[static_cast<std::size_t>(head_)] = v;
    head_ = (head_ + 1) % capacity_;
    if (count_ < capacity_) count_++;
}

double HistoryRing::newest(int k) const {
    if (k < 0 || k >= capacity_) return 0.0;
    int idx = head_ - 1 - k;
    while (idx < 0) idx += capacity_;
    return buf_[static_cast<std::size_t>(idx)];
}

double HistoryRing::meanSquare() const {
    if (count_ <= 0) return 0.0;
    double sum = 0.0;
    for (int k = 0; k < count_; ++k) {
        const double v = newest(k);
        sum += v * v;
    }
    return sum / static_cast<double>(count_);
}

} // namespace afc
