#ifndef TOKENBORROW_PERMISSION_HPP
#define TOKENBORROW_PERMISSION_HPP

#include <cstdint>

#include "option.hpp"
#include "reference.hpp"

// PermissionRegister - the global (exclusivity, access-mode) pair
//
// Only the access mode is stored. Exclusivity is recomputed from the live
// unit count on every query so it can never go stale.

// @safe
namespace tokenborrow {

// Permissions of the frame around the token: None while a single unit
// exists (nobody else can observe an access), otherwise the access mode.
using FramePermissions = Option<AccessMode>;

class PermissionRegister {
private:
    AccessMode mode_;

public:
    explicit PermissionRegister(AccessMode mode = AccessMode::ReadWrite) : mode_(mode) {}

    AccessMode mode() const { return mode_; }

    // Callers gate this on exclusivity.
    void set_mode(AccessMode mode) { mode_ = mode; }

    static Exclusivity exclusivity(uint32_t token_count) {
        return token_count == 1 ? Exclusivity::Exclusive : Exclusivity::Shared;
    }

    static FramePermissions frame(Exclusivity exclusivity, AccessMode mode) {
        if (exclusivity == Exclusivity::Exclusive) {
            return None;
        }
        return Some(mode);
    }

    FramePermissions frame(uint32_t token_count) const {
        return frame(exclusivity(token_count), mode_);
    }

    // Partial order on frames: is `frame` at most `maximum`?
    // None is below everything, nothing but None is below None, and
    // ReadOnly is below ReadWrite.
    static bool bounded(const FramePermissions& frame, const FramePermissions& maximum) {
        if (frame.is_none()) {
            return true;
        }
        if (maximum.is_none()) {
            return false;
        }
        return frame.unwrap_ref() == AccessMode::ReadOnly ||
               maximum.unwrap_ref() == AccessMode::ReadWrite;
    }
};

} // namespace tokenborrow

#endif // TOKENBORROW_PERMISSION_HPP
