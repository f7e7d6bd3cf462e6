// VELOCK - Epoch Clock Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <velock/staking/epoch.h>
#include <velock/util/time.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace velock {
namespace staking {

EpochClock::EpochClock(Timestamp originTime, int64_t epochWidth)
    : originTime_(originTime), epochWidth_(epochWidth) {
    if (epochWidth_ <= 0) {
        throw std::invalid_argument("epoch width must be positive, got " +
                                    std::to_string(epochWidth_));
    }
}

Timestamp EpochClock::Now() const {
    return timeSource_ ? timeSource_() : util::GetTime();
}

Epoch EpochClock::EpochOf(Timestamp time) const {
    if (time < originTime_) {
        return 0;
    }
    uint64_t elapsed = static_cast<uint64_t>(time) - static_cast<uint64_t>(originTime_);
    return elapsed / static_cast<uint64_t>(epochWidth_) + 1;
}

Epoch EpochClock::CurrentEpoch() const {
    return EpochOf(Now());
}

Timestamp EpochClock::EpochStart(Epoch epoch) const {
    if (epoch == 0) {
        Timestamp start = 0;
        if (!CheckedSub(originTime_, epochWidth_, start)) {
            throw std::out_of_range("epoch 0 starts before the earliest timestamp");
        }
        return start;
    }
    if (epoch > GetLastEpoch()) {
        throw std::out_of_range("epoch " + std::to_string(epoch) +
                                " starts after the latest timestamp");
    }
    // Fits by the bound above; unsigned arithmetic keeps a negative origin exact
    return static_cast<Timestamp>(static_cast<uint64_t>(originTime_) +
                                  (epoch - 1) * static_cast<uint64_t>(epochWidth_));
}

Epoch EpochClock::GetLastEpoch() const {
    uint64_t headroom = static_cast<uint64_t>(std::numeric_limits<Timestamp>::max()) -
                        static_cast<uint64_t>(originTime_);
    uint64_t whole = headroom / static_cast<uint64_t>(epochWidth_);
    return whole < std::numeric_limits<Epoch>::max() ? whole + 1 : whole;
}

} // namespace staking
} // namespace velock
