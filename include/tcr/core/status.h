// TCR - Operation Status
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Status returned by every mutating protocol operation. A non-OK status
// always means the operation had no effect.

#ifndef TCR_CORE_STATUS_H
#define TCR_CORE_STATUS_H

#include <string>

namespace tcr {

/**
 * Result of a protocol operation.
 */
class Status {
public:
    enum Code {
        OK = 0,
        INVALID_PHASE,          // Outside the valid time window or lifecycle state
        INSUFFICIENT_RIGHTS,    // Commit exceeds unlocked voting rights
        INSUFFICIENT_UNLOCKED,  // Withdrawal exceeds unlocked voting rights
        INSUFFICIENT_FUNDS,     // Token transfer refused (balance or allowance)
        INSUFFICIENT_DEPOSIT,   // Deposit below the required minimum
        SALT_MISMATCH,          // Commit-reveal hash mismatch or nothing to reveal
        DID_NOT_REVEAL,         // Voter never revealed in the poll
        ALREADY_RESOLVED,
        ALREADY_CLAIMED,
        NO_SUCH_CHALLENGE,
        NO_SUCH_LISTING,
        NO_SUCH_POLL,
        NO_SUCH_PROPOSAL,
        NOT_OWNER,
        INVALID_HINT,           // Bad insert position in the commitment list
        INVALID_ARGUMENT,
        DIVISION_BY_ZERO,
        ARITHMETIC_OVERFLOW,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status InvalidPhase(const std::string& msg = "") { return Status(INVALID_PHASE, msg); }
    static Status InsufficientRights(const std::string& msg = "") { return Status(INSUFFICIENT_RIGHTS, msg); }
    static Status InsufficientUnlocked(const std::string& msg = "") { return Status(INSUFFICIENT_UNLOCKED, msg); }
    static Status InsufficientFunds(const std::string& msg = "") { return Status(INSUFFICIENT_FUNDS, msg); }
    static Status InsufficientDeposit(const std::string& msg = "") { return Status(INSUFFICIENT_DEPOSIT, msg); }
    static Status SaltMismatch(const std::string& msg = "") { return Status(SALT_MISMATCH, msg); }
    static Status DidNotReveal(const std::string& msg = "") { return Status(DID_NOT_REVEAL, msg); }
    static Status AlreadyResolved(const std::string& msg = "") { return Status(ALREADY_RESOLVED, msg); }
    static Status AlreadyClaimed(const std::string& msg = "") { return Status(ALREADY_CLAIMED, msg); }
    static Status NoSuchChallenge(const std::string& msg = "") { return Status(NO_SUCH_CHALLENGE, msg); }
    static Status NoSuchListing(const std::string& msg = "") { return Status(NO_SUCH_LISTING, msg); }
    static Status NoSuchPoll(const std::string& msg = "") { return Status(NO_SUCH_POLL, msg); }
    static Status NoSuchProposal(const std::string& msg = "") { return Status(NO_SUCH_PROPOSAL, msg); }
    static Status NotOwner(const std::string& msg = "") { return Status(NOT_OWNER, msg); }
    static Status InvalidHint(const std::string& msg = "") { return Status(INVALID_HINT, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status DivisionByZero(const std::string& msg = "") { return Status(DIVISION_BY_ZERO, msg); }
    static Status Overflow(const std::string& msg = "") { return Status(ARITHMETIC_OVERFLOW, msg); }

    bool ok() const { return code_ == OK; }
    bool IsInvalidPhase() const { return code_ == INVALID_PHASE; }
    bool IsSaltMismatch() const { return code_ == SALT_MISMATCH; }
    bool IsAlreadyClaimed() const { return code_ == ALREADY_CLAIMED; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result = CodeToString(code_);
        if (!message_.empty()) {
            result += ": " + message_;
        }
        return result;
    }

    static const char* CodeToString(Code code);

private:
    Code code_;
    std::string message_;
};

inline const char* Status::CodeToString(Code code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_PHASE: return "InvalidPhase";
        case INSUFFICIENT_RIGHTS: return "InsufficientRights";
        case INSUFFICIENT_UNLOCKED: return "InsufficientUnlocked";
        case INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case INSUFFICIENT_DEPOSIT: return "InsufficientDeposit";
        case SALT_MISMATCH: return "SaltMismatch";
        case DID_NOT_REVEAL: return "DidNotReveal";
        case ALREADY_RESOLVED: return "AlreadyResolved";
        case ALREADY_CLAIMED: return "AlreadyClaimed";
        case NO_SUCH_CHALLENGE: return "NoSuchChallenge";
        case NO_SUCH_LISTING: return "NoSuchListing";
        case NO_SUCH_POLL: return "NoSuchPoll";
        case NO_SUCH_PROPOSAL: return "NoSuchProposal";
        case NOT_OWNER: return "NotOwner";
        case INVALID_HINT: return "InvalidHint";
        case INVALID_ARGUMENT: return "InvalidArgument";
        case DIVISION_BY_ZERO: return "DivisionByZero";
        case ARITHMETIC_OVERFLOW: return "Overflow";
        default: return "Unknown";
    }
}

} // namespace tcr

#endif // TCR_CORE_STATUS_H
