#ifndef TOKENBORROW_ACCESS_HPP
#define TOKENBORROW_ACCESS_HPP

#include "permission.hpp"
#include "reference.hpp"
#include "result.hpp"
#include "violation.hpp"

// validate_access - the aliasing rules
//
// Decides whether a reference of the given kind may perform `access` while
// the token is in the given (exclusivity, mode) regime. Token holdings and
// lifecycle are checked by the machine before this is consulted.
//
//   kind             Read                          Write
//   SharedReadOnly   Exclusive or (Shared, RO)     never
//   SharedReadWrite  always                        mode == ReadWrite
//   Unique           Exclusive or (Shared, RO)     (Exclusive, ReadWrite)

// @safe
namespace tokenborrow {

using AccessResult = Result<void, Violation>;

inline AccessResult validate_access(RefKind kind, Exclusivity exclusivity,
                                    AccessMode mode, AccessKind access) {
    const FramePermissions frame = PermissionRegister::frame(exclusivity, mode);

    switch (kind) {
        case RefKind::SharedReadOnly:
            if (access == AccessKind::Write) {
                return AccessResult::Err(Violation::ReadOnlyViolation);
            }
            // No writer can be active next to us.
            if (!PermissionRegister::bounded(frame, Some(AccessMode::ReadOnly))) {
                return AccessResult::Err(Violation::ReadWhileShared);
            }
            return AccessResult::Ok();

        case RefKind::SharedReadWrite:
            if (access == AccessKind::Write && mode == AccessMode::ReadOnly) {
                return AccessResult::Err(Violation::WriteToReadOnlyToken);
            }
            return AccessResult::Ok();

        case RefKind::Unique:
            if (access == AccessKind::Read) {
                if (!PermissionRegister::bounded(frame, Some(AccessMode::ReadOnly))) {
                    return AccessResult::Err(Violation::ReadWhileShared);
                }
                return AccessResult::Ok();
            }
            if (mode == AccessMode::ReadOnly) {
                return AccessResult::Err(Violation::WriteToReadOnlyToken);
            }
            if (!PermissionRegister::bounded(frame, None)) {
                return AccessResult::Err(Violation::UniqueWriteNotExclusive);
            }
            return AccessResult::Ok();
    }
    return AccessResult::Ok();
}

} // namespace tokenborrow

#endif // TOKENBORROW_ACCESS_HPP
