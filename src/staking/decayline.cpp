// VELOCK - Decay Line Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <velock/staking/decayline.h>

#include <algorithm>
#include <sstream>

namespace velock {
namespace staking {

namespace {

bool Fail(ErrorCode* error, ErrorCode code) {
    if (error) *error = code;
    return false;
}

/// bias += delta, refusing to leave [0, MAX_AMOUNT]
bool AddSigned(Amount& bias, SignedAmount delta, ErrorCode* error) {
    if (delta >= 0) {
        Amount up = static_cast<Amount>(delta);
        if (up > MAX_AMOUNT - bias) return Fail(error, ErrorCode::ArithmeticOverflow);
        bias += up;
    } else {
        // -(delta + 1) + 1 avoids negating MIN_SIGNED_AMOUNT
        Amount down = static_cast<Amount>(-(delta + 1)) + 1;
        if (down > bias) return Fail(error, ErrorCode::ArithmeticUnderflow);
        bias -= down;
    }
    return true;
}

} // namespace

// ============================================================================
// Line
// ============================================================================

std::string Line::ToString() const {
    std::ostringstream ss;
    ss << "Line { bias: " << bias << ", slope: " << slope << " }";
    return ss.str();
}

bool StepForward(Line& line, Amount deposit, SignedAmount slopeChange,
                 ErrorCode* error) {
    Line next = line;
    if (deposit > MAX_AMOUNT - next.bias) {
        return Fail(error, ErrorCode::ArithmeticOverflow);
    }
    next.bias += deposit;
    if (next.slope == MIN_SIGNED_AMOUNT) {
        return Fail(error, ErrorCode::ArithmeticOverflow);
    }
    if (!AddSigned(next.bias, -next.slope, error)) {
        return false;
    }
    if (!CheckedAdd(next.slope, slopeChange, next.slope)) {
        return Fail(error, ErrorCode::ArithmeticOverflow);
    }
    line = next;
    return true;
}

bool StepBackward(Line& line, Amount deposit, SignedAmount slopeChange,
                  ErrorCode* error) {
    Line prev = line;
    if (!CheckedSub(prev.slope, slopeChange, prev.slope)) {
        return Fail(error, ErrorCode::ArithmeticOverflow);
    }
    if (!AddSigned(prev.bias, prev.slope, error)) {
        return false;
    }
    if (deposit > prev.bias) {
        return Fail(error, ErrorCode::ArithmeticUnderflow);
    }
    prev.bias -= deposit;
    line = prev;
    return true;
}

// ============================================================================
// DecayLine - Accessors
// ============================================================================

SignedAmount DecayLine::GetSlopeChange(Epoch epoch) const {
    auto it = slopeChanges_.find(epoch);
    return it == slopeChanges_.end() ? 0 : it->second;
}

Amount DecayLine::GetDeposit(Epoch epoch) const {
    auto it = deposits_.find(epoch);
    return it == deposits_.end() ? 0 : it->second;
}

size_t DecayLine::GetDeltaCount() const {
    size_t count = slopeChanges_.size();
    for (const auto& [epoch, amount] : deposits_) {
        if (slopeChanges_.count(epoch) == 0) ++count;
    }
    return count;
}

bool DecayLine::IsEmpty() const {
    return deposited_ == 0 && line_.bias == 0 && line_.slope == 0 &&
           slopeChanges_.empty() && deposits_.empty();
}

// ============================================================================
// DecayLine - Replay
// ============================================================================

std::optional<Line> DecayLine::Replay(Line line, Epoch from, Epoch target,
                                      ErrorCode* error) const {
    if (target >= from) {
        for (Epoch i = from; i < target;) {
            ++i;
            if (!StepForward(line, GetDeposit(i), GetSlopeChange(i), error)) {
                return std::nullopt;
            }
        }
    } else {
        for (Epoch i = from; i > target; --i) {
            if (!StepBackward(line, GetDeposit(i), GetSlopeChange(i), error)) {
                return std::nullopt;
            }
        }
    }
    return line;
}

std::optional<Line> DecayLine::LineAt(Epoch epoch, ErrorCode* error) const {
    return Replay(line_, lastUpdateEpoch_, epoch, error);
}

bool DecayLine::CommitAdvance(Epoch epoch, ErrorCode* error) {
    if (epoch <= lastUpdateEpoch_) {
        return true;
    }
    auto next = Replay(line_, lastUpdateEpoch_, epoch, error);
    if (!next) {
        return false;
    }
    line_ = *next;
    lastUpdateEpoch_ = epoch;
    return true;
}

// ============================================================================
// DecayLine - Mutation
// ============================================================================

bool DecayLine::ScheduleRamp(Epoch start, Epoch end, Amount amount, SignedAmount slope,
                             ErrorCode* error) {
    if (end <= start) {
        return Fail(error, ErrorCode::InvalidDuration);
    }
    if (slope < 0) {
        return Fail(error, ErrorCode::InvalidAmount);
    }

    // A ramp starting at or before the anchor already contributes to the
    // anchored line: its principal less the decay of the epochs since start.
    Line anchored = line_;
    if (start <= lastUpdateEpoch_) {
        Epoch elapsed = std::min(lastUpdateEpoch_, end) - start;
        Amount decayed = 0;
        if (!CheckedMul<Amount>(static_cast<Amount>(slope), elapsed, decayed) ||
            decayed > amount) {
            return Fail(error, ErrorCode::ArithmeticUnderflow);
        }
        Amount remaining = amount - decayed;
        if (remaining > MAX_AMOUNT - anchored.bias) {
            return Fail(error, ErrorCode::ArithmeticOverflow);
        }
        anchored.bias += remaining;
        if (lastUpdateEpoch_ < end &&
            !CheckedAdd(anchored.slope, slope, anchored.slope)) {
            return Fail(error, ErrorCode::ArithmeticOverflow);
        }
    }

    Amount startDeposit = 0;
    SignedAmount startChange = 0;
    SignedAmount endChange = 0;
    if (!CheckedAdd(GetDeposit(start), amount, startDeposit) ||
        !CheckedAdd(GetSlopeChange(start), slope, startChange) ||
        !CheckedSub(GetSlopeChange(end), slope, endChange)) {
        return Fail(error, ErrorCode::ArithmeticOverflow);
    }

    auto store = [](auto& map, Epoch epoch, auto value) {
        if (value == 0) {
            map.erase(epoch);
        } else {
            map[epoch] = value;
        }
    };
    store(deposits_, start, startDeposit);
    store(slopeChanges_, start, startChange);
    store(slopeChanges_, end, endChange);
    line_ = anchored;
    return true;
}

void DecayLine::CancelRamp(Epoch start, Epoch end, Amount amount, SignedAmount slope) {
    auto deposit = deposits_.find(start);
    if (deposit != deposits_.end()) {
        deposit->second -= std::min(deposit->second, amount);
        if (deposit->second == 0) deposits_.erase(deposit);
    }

    auto adjust = [this](Epoch epoch, SignedAmount delta) {
        SignedAmount value = GetSlopeChange(epoch) + delta;
        if (value == 0) {
            slopeChanges_.erase(epoch);
        } else {
            slopeChanges_[epoch] = value;
        }
    };
    adjust(start, -slope);
    adjust(end, slope);
}

bool DecayLine::AddDeposited(Amount amount) {
    if (amount > MAX_AMOUNT - deposited_) {
        return false;
    }
    deposited_ += amount;
    return true;
}

bool DecayLine::SubDeposited(Amount amount) {
    if (amount > deposited_) {
        return false;
    }
    deposited_ -= amount;
    return true;
}

void DecayLine::Restore(const Checkpoint& cp) {
    line_ = cp.line;
    lastUpdateEpoch_ = cp.lastUpdateEpoch;
    deposited_ = cp.deposited;
}

// ============================================================================
// DecayLine - Serialization
// ============================================================================

std::vector<Byte> DecayLine::Serialize() const {
    DataStream ds;
    ds << *this;
    return ds.Data();
}

std::optional<DecayLine> DecayLine::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ds(data, len);
        DecayLine line;
        ds >> line;
        if (!ds.empty()) {
            return std::nullopt;
        }
        return line;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

bool DecayLine::operator==(const DecayLine& other) const {
    return line_ == other.line_ &&
           lastUpdateEpoch_ == other.lastUpdateEpoch_ &&
           deposited_ == other.deposited_ &&
           slopeChanges_ == other.slopeChanges_ &&
           deposits_ == other.deposits_;
}

std::string DecayLine::ToString() const {
    std::ostringstream ss;
    ss << "DecayLine {"
       << " bias: " << line_.bias
       << ", slope: " << line_.slope
       << ", anchor: " << lastUpdateEpoch_
       << ", deposited: " << deposited_
       << ", deltas: " << GetDeltaCount()
       << " }";
    return ss.str();
}

} // namespace staking
} // namespace velock
