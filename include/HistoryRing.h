#pragma once

#include <vector>

namespace afc {

// Fixed-capacity rolling history of scalars.
// Storage is allocated once at construction; push() never allocates and the
// oldest entry is overwritten once the ring is full.
class HistoryRing {
public:
    HistoryRing() = default;
    explicit HistoryRing(int capacity);

    void push(double v);

    // k = 0 is the most recent entry. Entries never written read as 0.0.
    double newest(int k) const;

    int capacity() const noexcept { return capacity_; }
    // Number of valid entries (saturates at capacity).
    int count() const noexcept { return count_; }
    bool full() const noexcept { return count_ == capacity_; }

    // Mean of squared valid entries; 0 when empty.
    double meanSquare() const;

private:
    std::vector<double> buf_{};
    int capacity_ = 0;
    int head_ = 0;   // next write
    int count_ = 0;  // number valid
};

} // namespace afc
