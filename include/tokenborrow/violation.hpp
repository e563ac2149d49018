#ifndef TOKENBORROW_VIOLATION_HPP
#define TOKENBORROW_VIOLATION_HPP

#include <ostream>

// Violation - the closed set of faults the token machine can report
//
// Each rejected operation names exactly one rule it broke. A violation means
// the traced program broke the aliasing discipline; embedders are expected
// to stop the trace (see expect_ok in verify.hpp).

// @safe
namespace tokenborrow {

enum class Violation {
    // The reference id was not issued by this machine.
    UnknownReference,
    // A SharedReadOnly parent tried to derive a mutable child.
    KindViolation,
    // The lender (or splitter) holds no unit.
    InsufficientTokens,
    DeadTarget,
    // Only under RelendPolicy::Reject.
    AlreadyBorrowing,
    NoTokenToReturn,
    PartialReturnForbidden,
    NothingToMerge,
    NotExclusive,
    NoToken,
    DeadReference,
    ReadOnlyViolation,
    // Read through a SharedReadOnly/Unique reference while writers may be live.
    ReadWhileShared,
    WriteToReadOnlyToken,
    UniqueWriteNotExclusive,
    // Held units do not add up to the global count.
    LedgerImbalance,
    // A parent edge that does not point to an earlier reference.
    MalformedHierarchy,
};

inline const char* violation_name(Violation v) {
    switch (v) {
        case Violation::UnknownReference: return "UnknownReference";
        case Violation::KindViolation: return "KindViolation";
        case Violation::InsufficientTokens: return "InsufficientTokens";
        case Violation::DeadTarget: return "DeadTarget";
        case Violation::AlreadyBorrowing: return "AlreadyBorrowing";
        case Violation::NoTokenToReturn: return "NoTokenToReturn";
        case Violation::PartialReturnForbidden: return "PartialReturnForbidden";
        case Violation::NothingToMerge: return "NothingToMerge";
        case Violation::NotExclusive: return "NotExclusive";
        case Violation::NoToken: return "NoToken";
        case Violation::DeadReference: return "DeadReference";
        case Violation::ReadOnlyViolation: return "ReadOnlyViolation";
        case Violation::ReadWhileShared: return "ReadWhileShared";
        case Violation::WriteToReadOnlyToken: return "WriteToReadOnlyToken";
        case Violation::UniqueWriteNotExclusive: return "UniqueWriteNotExclusive";
        case Violation::LedgerImbalance: return "LedgerImbalance";
        case Violation::MalformedHierarchy: return "MalformedHierarchy";
    }
    return "?";
}

inline const char* describe(Violation v) {
    switch (v) {
        case Violation::UnknownReference:
            return "reference was not created by this machine";
        case Violation::KindViolation:
            return "a read-only reference cannot derive a mutable reference";
        case Violation::InsufficientTokens:
            return "need to hold a token unit to lend or split one";
        case Violation::DeadTarget:
            return "a dead reference cannot receive a token unit";
        case Violation::AlreadyBorrowing:
            return "target is already borrowing and re-lending is disabled";
        case Violation::NoTokenToReturn:
            return "cannot give back a token unit without holding one";
        case Violation::PartialReturnForbidden:
            return "split fragments must be merged before returning the unit";
        case Violation::NothingToMerge:
            return "merging needs at least two held units";
        case Violation::NotExclusive:
            return "changing the access mode requires the sole token unit";
        case Violation::NoToken:
            return "cannot access memory without a token unit";
        case Violation::DeadReference:
            return "a dead reference can only relay units, not access or split them";
        case Violation::ReadOnlyViolation:
            return "cannot write through a read-only reference";
        case Violation::ReadWhileShared:
            return "cannot read through this reference while the shared token permits writes";
        case Violation::WriteToReadOnlyToken:
            return "cannot write while the token is read-only";
        case Violation::UniqueWriteNotExclusive:
            return "a unique reference can only write while it holds the only unit";
        case Violation::LedgerImbalance:
            return "held units do not add up to the global unit count";
        case Violation::MalformedHierarchy:
            return "a parent edge does not lead back to the root";
    }
    return "unknown violation";
}

inline std::ostream& operator<<(std::ostream& os, Violation v) {
    return os << violation_name(v);
}

} // namespace tokenborrow

#endif // TOKENBORROW_VIOLATION_HPP
