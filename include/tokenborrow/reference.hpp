#ifndef TOKENBORROW_REFERENCE_HPP
#define TOKENBORROW_REFERENCE_HPP

#include <cstdint>
#include <ostream>

// Reference - an opaque token-holder slot in the derivation hierarchy
//
// A reference is a small integer id into the machine's registry. Its record
// (RefInfo) carries the fixed kind and parent plus the mutable lifecycle
// state and token holdings.

// @safe
namespace tokenborrow {

struct Reference {
    uint32_t id;

    bool operator==(const Reference& other) const { return id == other.id; }
    bool operator!=(const Reference& other) const { return id != other.id; }
};

enum class RefKind {
    Unique,
    SharedReadWrite,
    SharedReadOnly,
};

// Created: never held a unit.
// Borrowing: has received a unit at some point (may have passed it along).
// Dead: returned all of its units to its parent, can never receive again.
enum class RefState {
    Created,
    Borrowing,
    Dead,
};

enum class AccessKind {
    Read,
    Write,
};

enum class AccessMode {
    ReadOnly,
    ReadWrite,
};

enum class Exclusivity {
    Exclusive,
    Shared,
};

struct RefInfo {
    RefKind kind;
    RefState state;
    // The reference this one was derived from; the root is its own parent.
    Reference parent;
    uint32_t held_units;
    // Fragments created by split() that have not been merged back.
    uint32_t split_count;
};

inline const char* to_string(RefKind kind) {
    switch (kind) {
        case RefKind::Unique: return "Unique";
        case RefKind::SharedReadWrite: return "SharedReadWrite";
        case RefKind::SharedReadOnly: return "SharedReadOnly";
    }
    return "?";
}

inline const char* to_string(RefState state) {
    switch (state) {
        case RefState::Created: return "Created";
        case RefState::Borrowing: return "Borrowing";
        case RefState::Dead: return "Dead";
    }
    return "?";
}

inline const char* to_string(AccessKind access) {
    return access == AccessKind::Read ? "Read" : "Write";
}

inline const char* to_string(AccessMode mode) {
    return mode == AccessMode::ReadOnly ? "ReadOnly" : "ReadWrite";
}

inline const char* to_string(Exclusivity exclusivity) {
    return exclusivity == Exclusivity::Exclusive ? "Exclusive" : "Shared";
}

inline std::ostream& operator<<(std::ostream& os, Reference ref) {
    return os << "r" << ref.id;
}

inline std::ostream& operator<<(std::ostream& os, RefKind kind) {
    return os << to_string(kind);
}

inline std::ostream& operator<<(std::ostream& os, RefState state) {
    return os << to_string(state);
}

inline std::ostream& operator<<(std::ostream& os, AccessKind access) {
    return os << to_string(access);
}

inline std::ostream& operator<<(std::ostream& os, AccessMode mode) {
    return os << to_string(mode);
}

inline std::ostream& operator<<(std::ostream& os, Exclusivity exclusivity) {
    return os << to_string(exclusivity);
}

inline std::ostream& operator<<(std::ostream& os, const RefInfo& info) {
    return os << "{ kind: " << info.kind
              << ", state: " << info.state
              << ", parent: " << info.parent
              << ", units: " << info.held_units
              << ", splits: " << info.split_count << " }";
}

} // namespace tokenborrow

#endif // TOKENBORROW_REFERENCE_HPP
