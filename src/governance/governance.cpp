// VELOCK - Governance Module Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <velock/governance/governance.h>
#include <velock/util/config.h>
#include <velock/util/logging.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <stdexcept>

namespace velock {
namespace governance {

// ============================================================================
// String Conversions
// ============================================================================

const char* VoteTimingToString(VoteTiming timing) {
    switch (timing) {
        case VoteTiming::AfterWindow: return "after-window";
        case VoteTiming::DuringWindow: return "during-window";
        default: return "unknown";
    }
}

std::optional<VoteTiming> ParseVoteTiming(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "after-window" || lower == "after") return VoteTiming::AfterWindow;
    if (lower == "during-window" || lower == "during") return VoteTiming::DuringWindow;
    return std::nullopt;
}

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Pending: return "Pending";
        case ProposalState::Executable: return "Executable";
        case ProposalState::Defeated: return "Defeated";
        case ProposalState::Executed: return "Executed";
        default: return "Unknown";
    }
}

const char* VoteStatusToString(VoteStatus status) {
    switch (status) {
        case VoteStatus::NoVote: return "NoVote";
        case VoteStatus::No: return "No";
        case VoteStatus::Yes: return "Yes";
        default: return "Unknown";
    }
}

// ============================================================================
// GovernanceParams
// ============================================================================

bool GovernanceParams::IsValid(std::string* error) const {
    if (voteWindow == 0) {
        if (error) *error = "vote_window must be at least 1";
        return false;
    }
    if (minProposePowerDivisor == 0) {
        if (error) *error = "min_propose_power_divisor must be at least 1";
        return false;
    }
    return true;
}

std::optional<GovernanceParams> GovernanceParams::FromConfig(const util::ConfigManager& config,
                                                             std::string* error) {
    namespace keys = util::ConfigKeys;
    const std::string section = keys::GOVERNANCE_SECTION;

    auto fail = [error](const std::string& msg) -> std::optional<GovernanceParams> {
        if (error) *error = msg;
        return std::nullopt;
    };

    GovernanceParams params;

    if (config.HasKey(keys::VOTE_WINDOW, section)) {
        auto window = config.TryGetUInt(keys::VOTE_WINDOW, section);
        if (!window) return fail("governance.vote_window is not a non-negative integer");
        params.voteWindow = *window;
    }
    if (config.HasKey(keys::MIN_PROPOSE_POWER_DIVISOR, section)) {
        auto divisor = config.TryGetUInt(keys::MIN_PROPOSE_POWER_DIVISOR, section);
        if (!divisor) return fail("governance.min_propose_power_divisor is not a non-negative integer");
        params.minProposePowerDivisor = *divisor;
    }
    if (auto timing = config.TryGetString(keys::VOTE_TIMING, section)) {
        auto parsed = ParseVoteTiming(*timing);
        if (!parsed) return fail("governance.vote_timing must be after-window or during-window");
        params.voteTiming = *parsed;
    }

    std::string why;
    if (!params.IsValid(&why)) {
        return fail(why);
    }
    return params;
}

// ============================================================================
// Proposal
// ============================================================================

std::string Proposal::ToString() const {
    std::ostringstream ss;
    ss << "Proposal {"
       << " id: " << id
       << ", proposer: " << proposer.ToShortString()
       << ", yes: " << yes
       << ", no: " << no
       << ", created: " << creationEpoch
       << ", executed: " << (executed ? "true" : "false")
       << " }";
    return ss.str();
}

// ============================================================================
// GovernanceModule
// ============================================================================

GovernanceModule::GovernanceModule(const staking::StakeLedger& ledger,
                                   const GovernanceParams& params)
    : ledger_(ledger), params_(params) {
    std::string error;
    if (!params_.IsValid(&error)) {
        throw std::invalid_argument("invalid governance parameters: " + error);
    }
}

ProposalState GovernanceModule::StateOf(const Proposal& proposal, Epoch now) const {
    if (proposal.executed) {
        return ProposalState::Executed;
    }
    if (proposal.creationEpoch + params_.voteWindow > now) {
        return ProposalState::Pending;
    }
    return proposal.yes > proposal.no ? ProposalState::Executable : ProposalState::Defeated;
}

OpResult GovernanceModule::CreateProposal(const AccountId& proposer,
                                          std::shared_ptr<IProposalExecutor> executor,
                                          ProposalId* id) {
    if (callGuard_.IsCurrentThreadInside()) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "CreateProposal rejected: re-entrant call";
        return OpResult::Error(ErrorCode::Reentrancy, "proposal created during execution");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    if (!executor) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Proposal by " << proposer.ToShortString()
                                                << " rejected: no executor";
        return OpResult::Error(ErrorCode::InvalidExecutor, "executor is required");
    }

    const Epoch now = ledger_.CurrentEpoch();
    auto power = ledger_.VotingPowerAt(proposer, now);
    auto total = ledger_.TotalVotingPowerAt(now);
    if (!power || !total) {
        return OpResult::Error(ErrorCode::ArithmeticUnderflow, "voting power unavailable");
    }

    Amount scaled = 0;
    bool meetsThreshold =
        !CheckedMul<Amount>(*power, params_.minProposePowerDivisor, scaled) ||
        scaled >= *total;
    if (!meetsThreshold) {
        LogWarnF(util::LogCategory::GOVERNANCE,
                 "Proposal by %s rejected: power %llu below 1/%llu of total %llu",
                 proposer.ToShortString().c_str(), static_cast<unsigned long long>(*power),
                 static_cast<unsigned long long>(params_.minProposePowerDivisor),
                 static_cast<unsigned long long>(*total));
        return OpResult::Error(ErrorCode::InsufficientPower,
                               "proposer holds " + std::to_string(*power) + " of " +
                               std::to_string(*total) + " voting power");
    }

    Proposal proposal;
    proposal.id = nextId_++;
    proposal.proposer = proposer;
    proposal.executor = std::move(executor);
    proposal.creationEpoch = now;
    proposal.yes = *power;

    votes_[{proposal.id, proposer}] = VoteRecord{VoteStatus::Yes, *power};
    if (id) *id = proposal.id;

    LogInfoF(util::LogCategory::GOVERNANCE, "Proposal %llu created by %s at epoch %llu with %llu yes",
             static_cast<unsigned long long>(proposal.id), proposer.ToShortString().c_str(),
             static_cast<unsigned long long>(proposal.creationEpoch),
             static_cast<unsigned long long>(proposal.yes));
    proposals_.emplace(proposal.id, std::move(proposal));
    return OpResult::Success();
}

OpResult GovernanceModule::Vote(const AccountId& voter, ProposalId id, bool support) {
    if (callGuard_.IsCurrentThreadInside()) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Vote rejected: re-entrant call";
        return OpResult::Error(ErrorCode::Reentrancy, "vote cast during execution");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return OpResult::Error(ErrorCode::ProposalNotFound,
                               "no proposal " + std::to_string(id));
    }
    Proposal& proposal = it->second;
    if (proposal.executed) {
        return OpResult::Error(ErrorCode::AlreadyExecuted,
                               "proposal " + std::to_string(id) + " already executed");
    }

    const Epoch now = ledger_.CurrentEpoch();
    const Epoch windowEnd = proposal.creationEpoch + params_.voteWindow;
    if (params_.voteTiming == VoteTiming::AfterWindow && now < windowEnd) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Vote on " << id << " by "
            << voter.ToShortString() << " rejected: opens at epoch " << windowEnd;
        return OpResult::Error(ErrorCode::VotingNotOpen,
                               "voting opens at epoch " + std::to_string(windowEnd));
    }
    if (params_.voteTiming == VoteTiming::DuringWindow && now >= windowEnd) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Vote on " << id << " by "
            << voter.ToShortString() << " rejected: closed at epoch " << windowEnd;
        return OpResult::Error(ErrorCode::VotingClosed,
                               "voting closed at epoch " + std::to_string(windowEnd));
    }

    const VoteStatus choice = support ? VoteStatus::Yes : VoteStatus::No;
    VoteRecord& record = votes_[{id, voter}];
    if (record.status == choice) {
        return OpResult::Success();
    }

    const Epoch snapshot = proposal.creationEpoch > 0 ? proposal.creationEpoch - 1 : 0;
    auto weight = ledger_.VotingPowerAt(voter, snapshot);
    if (!weight) {
        if (record.status == VoteStatus::NoVote) votes_.erase({id, voter});
        return OpResult::Error(ErrorCode::ArithmeticUnderflow, "voting power unavailable");
    }

    Amount yes = proposal.yes;
    Amount no = proposal.no;
    if (record.status == VoteStatus::Yes) {
        yes -= std::min(yes, record.weight);
    } else if (record.status == VoteStatus::No) {
        no -= std::min(no, record.weight);
    }
    Amount& side = support ? yes : no;
    if (!CheckedAdd(side, *weight, side)) {
        if (record.status == VoteStatus::NoVote) votes_.erase({id, voter});
        return OpResult::Error(ErrorCode::ArithmeticOverflow, "vote tally overflow");
    }

    const VoteStatus previous = record.status;
    proposal.yes = yes;
    proposal.no = no;
    record = VoteRecord{choice, *weight};

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Vote on " << id << " by " << voter.ToShortString()
        << ": " << VoteStatusToString(previous) << " -> " << VoteStatusToString(choice)
        << " weight " << *weight << " (yes " << proposal.yes << ", no " << proposal.no << ")";
    return OpResult::Success();
}

OpResult GovernanceModule::ExecuteProposal(ProposalId id) {
    if (callGuard_.IsCurrentThreadInside()) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Execute rejected: re-entrant call";
        return OpResult::Error(ErrorCode::Reentrancy, "execute called during execution");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return OpResult::Error(ErrorCode::ProposalNotFound,
                               "no proposal " + std::to_string(id));
    }
    Proposal& proposal = it->second;

    switch (StateOf(proposal, ledger_.CurrentEpoch())) {
        case ProposalState::Executed:
            return OpResult::Error(ErrorCode::AlreadyExecuted,
                                   "proposal " + std::to_string(id) + " already executed");
        case ProposalState::Pending:
            return OpResult::Error(ErrorCode::VotingInProgress,
                                   "voting ends at epoch " +
                                   std::to_string(proposal.creationEpoch + params_.voteWindow));
        case ProposalState::Defeated:
            LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << id << " not approved (yes "
                << proposal.yes << ", no " << proposal.no << ")";
            return OpResult::Error(ErrorCode::NotApproved,
                                   "yes " + std::to_string(proposal.yes) + " <= no " +
                                   std::to_string(proposal.no));
        case ProposalState::Executable:
            break;
    }

    proposal.executed = true;
    bool ok = false;
    try {
        util::ExternalCallGuard::Scope scope(callGuard_);
        ok = proposal.executor->Execute();
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::GOVERNANCE) << "Executor of proposal " << id
                                                 << " threw: " << e.what();
        ok = false;
    } catch (...) {
        proposal.executed = false;
        throw;
    }
    if (!ok) {
        proposal.executed = false;
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Proposal " << id << " execution failed";
        return OpResult::Error(ErrorCode::ExecutionFailed, "executor reported failure");
    }

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << id << " executed";
    return OpResult::Success();
}

std::optional<Proposal> GovernanceModule::GetProposal(ProposalId id) const {
    return Guarded([&]() -> std::optional<Proposal> {
        auto it = proposals_.find(id);
        if (it == proposals_.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::optional<ProposalState> GovernanceModule::GetProposalState(ProposalId id) const {
    const Epoch now = ledger_.CurrentEpoch();
    return Guarded([&]() -> std::optional<ProposalState> {
        auto it = proposals_.find(id);
        if (it == proposals_.end()) {
            return std::nullopt;
        }
        return StateOf(it->second, now);
    });
}

VoteStatus GovernanceModule::GetVoteStatus(ProposalId id, const AccountId& voter) const {
    return Guarded([&]() {
        auto it = votes_.find({id, voter});
        return it == votes_.end() ? VoteStatus::NoVote : it->second.status;
    });
}

Amount GovernanceModule::GetVoteWeight(ProposalId id, const AccountId& voter) const {
    return Guarded([&]() {
        auto it = votes_.find({id, voter});
        return it == votes_.end() ? Amount{0} : it->second.weight;
    });
}

size_t GovernanceModule::GetProposalCount() const {
    return Guarded([&]() { return proposals_.size(); });
}

} // namespace governance
} // namespace velock
