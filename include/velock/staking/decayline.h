// VELOCK - Decay Line
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// A piecewise-linear decay schedule. Each lock is a ramp: its principal
// appears in full at the start epoch and shrinks by a constant slope per
// epoch until the end epoch. A DecayLine stores the sum of any number of
// ramps as a line anchored at one epoch plus sparse per-epoch deltas, so
// the value at any other epoch is a replay over the epochs in between.
//
// One forward step into epoch i:
//     bias += deposits[i];  bias -= slope;  slope += slopeChanges[i];
// One backward step out of epoch i is its exact inverse:
//     slope -= slopeChanges[i];  bias += slope;  bias -= deposits[i];

#ifndef VELOCK_STAKING_DECAYLINE_H
#define VELOCK_STAKING_DECAYLINE_H

#include <velock/core/result.h>
#include <velock/core/serialize.h>
#include <velock/core/types.h>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace velock {
namespace staking {

// ============================================================================
// Line
// ============================================================================

/// Remaining value (bias) and its per-epoch decrease (slope)
struct Line {
    Amount bias{0};
    SignedAmount slope{0};

    bool operator==(const Line& other) const {
        return bias == other.bias && slope == other.slope;
    }
    bool operator!=(const Line& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Apply one forward step into an epoch with the given deltas.
/// Returns false and leaves line untouched on underflow or overflow.
bool StepForward(Line& line, Amount deposit, SignedAmount slopeChange,
                 ErrorCode* error = nullptr);

/// Undo StepForward for the same deltas.
bool StepBackward(Line& line, Amount deposit, SignedAmount slopeChange,
                  ErrorCode* error = nullptr);

// ============================================================================
// DecayLine
// ============================================================================

class DecayLine {
public:
    /// Saved anchor state used to roll back a failed command
    struct Checkpoint {
        Line line;
        Epoch lastUpdateEpoch{0};
        Amount deposited{0};
    };

    DecayLine() = default;

    /// Empty line anchored at the given epoch
    explicit DecayLine(Epoch anchor) : lastUpdateEpoch_(anchor) {}

    // ========================================================================
    // Accessors
    // ========================================================================

    const Line& GetLine() const { return line_; }
    Epoch GetLastUpdateEpoch() const { return lastUpdateEpoch_; }

    /// Principal still held, independent of decay
    Amount GetDeposited() const { return deposited_; }

    /// Zero when nothing is registered at the epoch
    SignedAmount GetSlopeChange(Epoch epoch) const;
    Amount GetDeposit(Epoch epoch) const;

    /// Number of epochs with a non-zero delta of either kind
    size_t GetDeltaCount() const;

    /// No principal, no remaining bias and no pending deltas
    bool IsEmpty() const;

    // ========================================================================
    // Replay
    // ========================================================================

    /**
     * Line at an epoch, replayed forward or backward from the anchor.
     * Does not modify the stored state.
     *
     * @return nullopt if a step would take bias below zero
     *         (ArithmeticUnderflow) or past MAX_AMOUNT (ArithmeticOverflow)
     */
    std::optional<Line> LineAt(Epoch epoch, ErrorCode* error = nullptr) const;

    /**
     * Replay forward to epoch and store the result as the new anchor.
     * An epoch at or before the anchor is a no-op. Nothing is modified
     * on failure.
     */
    bool CommitAdvance(Epoch epoch, ErrorCode* error = nullptr);

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Register a ramp: deposits[start] += amount, slopeChanges[start] += slope,
     * slopeChanges[end] -= slope. When start is at or before the anchor the
     * anchored line is re-derived so it includes the ramp immediately.
     * Nothing is modified on failure.
     */
    bool ScheduleRamp(Epoch start, Epoch end, Amount amount, SignedAmount slope,
                      ErrorCode* error = nullptr);

    /// Remove the deltas of a ramp previously added with ScheduleRamp.
    /// The anchored line is not touched; pair with Restore().
    void CancelRamp(Epoch start, Epoch end, Amount amount, SignedAmount slope);

    /// Returns false on overflow
    bool AddDeposited(Amount amount);

    /// Returns false if amount exceeds the deposited principal
    bool SubDeposited(Amount amount);

    Checkpoint Save() const { return {line_, lastUpdateEpoch_, deposited_}; }
    void Restore(const Checkpoint& cp);

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Deltas are written in epoch order so equal lines encode identically
    template<typename Stream>
    void Serialize(Stream& s) const {
        ::velock::Serialize(s, line_.bias);
        ::velock::Serialize(s, line_.slope);
        ::velock::Serialize(s, lastUpdateEpoch_);
        ::velock::Serialize(s, deposited_);
        ::velock::Serialize(s, std::map<Epoch, SignedAmount>(slopeChanges_.begin(),
                                                             slopeChanges_.end()));
        ::velock::Serialize(s, std::map<Epoch, Amount>(deposits_.begin(), deposits_.end()));
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        std::map<Epoch, SignedAmount> changes;
        std::map<Epoch, Amount> deposits;
        ::velock::Unserialize(s, line_.bias);
        ::velock::Unserialize(s, line_.slope);
        ::velock::Unserialize(s, lastUpdateEpoch_);
        ::velock::Unserialize(s, deposited_);
        ::velock::Unserialize(s, changes);
        ::velock::Unserialize(s, deposits);
        slopeChanges_.clear();
        deposits_.clear();
        for (const auto& [epoch, delta] : changes) {
            if (delta != 0) slopeChanges_[epoch] = delta;
        }
        for (const auto& [epoch, amount] : deposits) {
            if (amount != 0) deposits_[epoch] = amount;
        }
    }

    std::vector<Byte> Serialize() const;
    static std::optional<DecayLine> Deserialize(const Byte* data, size_t len);

    bool operator==(const DecayLine& other) const;
    bool operator!=(const DecayLine& other) const { return !(*this == other); }

    std::string ToString() const;

private:
    Line line_;
    Epoch lastUpdateEpoch_{0};
    Amount deposited_{0};

    /// Sparse, default-zero; entries that reach zero are erased
    std::unordered_map<Epoch, SignedAmount> slopeChanges_;
    std::unordered_map<Epoch, Amount> deposits_;

    /// Replay from (line, from) to target without touching stored state
    std::optional<Line> Replay(Line line, Epoch from, Epoch target,
                               ErrorCode* error) const;
};

template<typename Stream>
void Serialize(Stream& s, const DecayLine& line) {
    line.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, DecayLine& line) {
    line.Unserialize(s);
}

} // namespace staking
} // namespace velock

#endif // VELOCK_STAKING_DECAYLINE_H
