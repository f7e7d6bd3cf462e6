// VELOCK - Operation Result Codes
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Every state-changing command returns an OpResult. A failed command
// leaves no partial state behind.

#ifndef VELOCK_CORE_RESULT_H
#define VELOCK_CORE_RESULT_H

#include <string>

namespace velock {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    OK = 0,

    // Staking errors
    InvalidDuration,        ///< Lock duration outside [min, max] epochs
    InvalidAmount,          ///< Lock amount too small to produce a slope
    TransferFailed,         ///< External asset call reported failure
    ArithmeticUnderflow,    ///< Line replay would drive bias below zero
    ArithmeticOverflow,     ///< Amount totals exceed the representable range

    // Governance errors
    InsufficientPower,      ///< Proposer below the proposal threshold
    InvalidExecutor,        ///< Proposal submitted without an executor
    ProposalNotFound,
    VotingNotOpen,          ///< Vote cast before voting opens
    VotingClosed,           ///< Vote cast after voting closed
    VotingInProgress,       ///< Execution attempted before the window elapsed
    NotApproved,            ///< yes <= no at execution time
    AlreadyExecuted,
    ExecutionFailed,        ///< Delegated executor reported failure

    // Call discipline
    Reentrancy              ///< Command issued from inside an external call
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Result of a ledger or governance command.
 */
struct OpResult {
    ErrorCode code{ErrorCode::OK};
    std::string message;

    static OpResult Success() {
        return {ErrorCode::OK, ""};
    }

    static OpResult Error(ErrorCode code, const std::string& msg = "") {
        return {code, msg};
    }

    bool IsOk() const { return code == ErrorCode::OK; }

    /// "OK" or "<Code>: <message>"
    std::string ToString() const;
};

} // namespace velock

#endif // VELOCK_CORE_RESULT_H
