// VELOCK - Epoch Clock
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Maps wall-clock time onto integer epochs of fixed width. Epoch 1 begins
// at the origin time; times before the origin fall into epoch 0.

#ifndef VELOCK_STAKING_EPOCH_H
#define VELOCK_STAKING_EPOCH_H

#include <velock/core/types.h>

#include <functional>

namespace velock {
namespace staking {

// ============================================================================
// Epoch Constants
// ============================================================================

/// Default epoch width: one week
constexpr int64_t DEFAULT_EPOCH_WIDTH = 7 * 24 * 60 * 60;

/// Length of the longest lock in seconds (four 365-day years)
constexpr int64_t MAX_LOCK_SECONDS = 4 * 365 * 24 * 60 * 60;

/// Shortest lock, in epochs
constexpr Epoch MIN_LOCK_EPOCHS = 4;

// ============================================================================
// Epoch Clock
// ============================================================================

class EpochClock {
public:
    /// Returns the current unix time in seconds
    using TimeSource = std::function<Timestamp()>;

    /// @throws std::invalid_argument if epochWidth <= 0
    explicit EpochClock(Timestamp originTime = 0,
                        int64_t epochWidth = DEFAULT_EPOCH_WIDTH);

    /// Replace util::GetTime() as the source of "now"
    void SetTimeSource(TimeSource source) { timeSource_ = std::move(source); }

    /// floor((time - origin) / width) + 1, or 0 before the origin
    Epoch EpochOf(Timestamp time) const;

    Epoch CurrentEpoch() const;

    /// First second of an epoch. Epoch 0 is reported as starting one
    /// width before the origin.
    /// @throws std::out_of_range if the start is not a representable Timestamp
    Timestamp EpochStart(Epoch epoch) const;

    /// Last epoch whose start fits in a Timestamp
    Epoch GetLastEpoch() const;

    Timestamp GetOriginTime() const { return originTime_; }
    int64_t GetEpochWidth() const { return epochWidth_; }

    /// Number of whole epochs in four years (208 for weekly epochs)
    Epoch EpochsPerFourYears() const {
        return static_cast<Epoch>(MAX_LOCK_SECONDS / epochWidth_);
    }

private:
    Timestamp Now() const;

    Timestamp originTime_;
    int64_t epochWidth_;
    TimeSource timeSource_;
};

} // namespace staking
} // namespace velock

#endif // VELOCK_STAKING_EPOCH_H
