// VELOCK - Operation Result Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include "velock/core/result.h"

namespace velock {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidDuration: return "InvalidDuration";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::ArithmeticUnderflow: return "ArithmeticUnderflow";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCode::InsufficientPower: return "InsufficientPower";
        case ErrorCode::InvalidExecutor: return "InvalidExecutor";
        case ErrorCode::ProposalNotFound: return "ProposalNotFound";
        case ErrorCode::VotingNotOpen: return "VotingNotOpen";
        case ErrorCode::VotingClosed: return "VotingClosed";
        case ErrorCode::VotingInProgress: return "VotingInProgress";
        case ErrorCode::NotApproved: return "NotApproved";
        case ErrorCode::AlreadyExecuted: return "AlreadyExecuted";
        case ErrorCode::ExecutionFailed: return "ExecutionFailed";
        case ErrorCode::Reentrancy: return "Reentrancy";
        default: return "Unknown";
    }
}

std::string OpResult::ToString() const {
    if (IsOk()) return "OK";
    std::string result = ErrorCodeToString(code);
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

} // namespace velock
