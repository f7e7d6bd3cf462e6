// VELOCK - Governance Module
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Simple-majority governance weighted by vote-escrow voting power.
//
// Key features:
// - Proposal threshold as a share of total voting power
// - Vote weight snapshotted one epoch before the proposal was created
// - Vote changing, tracked per (proposal, voter)
// - Execution through an opaque executor after the voting window

#ifndef VELOCK_GOVERNANCE_GOVERNANCE_H
#define VELOCK_GOVERNANCE_GOVERNANCE_H

#include <velock/core/result.h>
#include <velock/core/types.h>
#include <velock/staking/ledger.h>
#include <velock/util/callguard.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace velock {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Epochs between proposal creation and the end of voting
constexpr Epoch DEFAULT_VOTE_WINDOW = 1;

/// A proposer needs at least 1/100 of total voting power
constexpr uint64_t DEFAULT_MIN_PROPOSE_POWER_DIVISOR = 100;

// ============================================================================
// Governance Types
// ============================================================================

/// When votes are accepted relative to the voting window
enum class VoteTiming {
    /// Only once creationEpoch + voteWindow <= currentEpoch
    AfterWindow,

    /// Only while currentEpoch < creationEpoch + voteWindow
    DuringWindow
};

/// "after-window" / "during-window"
const char* VoteTimingToString(VoteTiming timing);
std::optional<VoteTiming> ParseVoteTiming(const std::string& str);

/// Derived proposal state
enum class ProposalState {
    /// Voting window not yet elapsed
    Pending,

    /// Window elapsed, yes > no, not yet executed
    Executable,

    /// Window elapsed, yes <= no
    Defeated,

    /// Executor ran successfully
    Executed
};

const char* ProposalStateToString(ProposalState state);

/// A voter's standing on one proposal
enum class VoteStatus {
    NoVote,
    No,
    Yes
};

const char* VoteStatusToString(VoteStatus status);

// ============================================================================
// Executor
// ============================================================================

/// Delegated action run when a proposal passes
class IProposalExecutor {
public:
    virtual ~IProposalExecutor() = default;

    /// @return false if the action failed
    virtual bool Execute() = 0;
};

class CallbackExecutor : public IProposalExecutor {
public:
    explicit CallbackExecutor(std::function<bool()> callback)
        : callback_(std::move(callback)) {}

    bool Execute() override { return callback_ ? callback_() : false; }

private:
    std::function<bool()> callback_;
};

// ============================================================================
// Parameters
// ============================================================================

struct GovernanceParams {
    Epoch voteWindow{DEFAULT_VOTE_WINDOW};
    uint64_t minProposePowerDivisor{DEFAULT_MIN_PROPOSE_POWER_DIVISOR};
    VoteTiming voteTiming{VoteTiming::AfterWindow};

    bool IsValid(std::string* error = nullptr) const;

    /// Read the [governance] section, falling back to the defaults above
    static std::optional<GovernanceParams> FromConfig(const util::ConfigManager& config,
                                                      std::string* error = nullptr);
};

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    ProposalId id{0};
    AccountId proposer;
    std::shared_ptr<IProposalExecutor> executor;
    Amount yes{0};
    Amount no{0};
    Epoch creationEpoch{0};
    bool executed{false};

    std::string ToString() const;
};

// ============================================================================
// Governance Module
// ============================================================================

class GovernanceModule {
public:
    /// @throws std::invalid_argument on invalid params
    explicit GovernanceModule(const staking::StakeLedger& ledger,
                              const GovernanceParams& params = GovernanceParams{});

    GovernanceModule(const GovernanceModule&) = delete;
    GovernanceModule& operator=(const GovernanceModule&) = delete;

    // === Commands ===

    /**
     * Create a proposal. The proposer's current voting power is cast as a
     * yes vote.
     *
     * Fails with InvalidExecutor for a null executor and InsufficientPower
     * when power * minProposePowerDivisor < total power.
     */
    OpResult CreateProposal(const AccountId& proposer,
                            std::shared_ptr<IProposalExecutor> executor,
                            ProposalId* id = nullptr);

    /**
     * Cast or change a vote. Weight is the voter's power one epoch before
     * the proposal was created. Repeating the current choice is a no-op.
     */
    OpResult Vote(const AccountId& voter, ProposalId id, bool support);

    /// Run the executor of a passed proposal whose window has elapsed
    OpResult ExecuteProposal(ProposalId id);

    // === Queries ===

    std::optional<Proposal> GetProposal(ProposalId id) const;
    std::optional<ProposalState> GetProposalState(ProposalId id) const;

    VoteStatus GetVoteStatus(ProposalId id, const AccountId& voter) const;

    /// Weight currently applied for the voter's vote (0 without a vote)
    Amount GetVoteWeight(ProposalId id, const AccountId& voter) const;

    size_t GetProposalCount() const;

    const GovernanceParams& GetParams() const { return params_; }

private:
    struct VoteRecord {
        VoteStatus status{VoteStatus::NoVote};
        Amount weight{0};
    };

    template<typename Fn>
    auto Guarded(Fn&& fn) const -> decltype(fn()) {
        if (callGuard_.IsCurrentThreadInside()) {
            return fn();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return fn();
    }

    /// Caller holds mutex_
    ProposalState StateOf(const Proposal& proposal, Epoch now) const;

    const staking::StakeLedger& ledger_;
    GovernanceParams params_;

    std::map<ProposalId, Proposal> proposals_;
    std::map<std::pair<ProposalId, AccountId>, VoteRecord> votes_;
    ProposalId nextId_{1};

    mutable std::mutex mutex_;
    util::ExternalCallGuard callGuard_;
};

} // namespace governance
} // namespace velock

#endif // VELOCK_GOVERNANCE_GOVERNANCE_H
