#ifndef TOKENBORROW_REGISTRY_HPP
#define TOKENBORROW_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "option.hpp"
#include "reference.hpp"
#include "result.hpp"
#include "verify.hpp"
#include "violation.hpp"

// RefRegistry - arena of reference records
//
// Identities are indices into the arena and are never reused: references are
// not deleted, Dead is only a state. Parents are stored as ids, so the
// hierarchy is a set of back-references with no ownership between records.

// @safe
namespace tokenborrow {

class RefRegistry {
private:
    std::vector<RefInfo> records_;

public:
    RefRegistry() = default;

    // The root borrows from itself so that every record has a parent and
    // lookups treat it like any other node.
    Reference create_root(RefKind kind) {
        Reference root{static_cast<uint32_t>(records_.size())};
        records_.push_back(RefInfo{kind, RefState::Borrowing, root, 1, 0});
        return root;
    }

    // A read-only reference cannot hand out a mutable one.
    static bool may_derive(RefKind parent, RefKind child) {
        return parent != RefKind::SharedReadOnly || child == RefKind::SharedReadOnly;
    }

    Result<Reference, Violation> create(Reference parent, RefKind kind) {
        if (!contains(parent)) {
            return Result<Reference, Violation>::Err(Violation::UnknownReference);
        }
        if (!may_derive(at(parent).kind, kind)) {
            return Result<Reference, Violation>::Err(Violation::KindViolation);
        }
        Reference fresh{static_cast<uint32_t>(records_.size())};
        records_.push_back(RefInfo{kind, RefState::Created, parent, 0, 0});
        return Result<Reference, Violation>::Ok(fresh);
    }

    bool contains(Reference ref) const { return ref.id < records_.size(); }

    Option<RefInfo> find(Reference ref) const {
        if (!contains(ref)) {
            return None;
        }
        return Some(records_[ref.id]);
    }

    // Callers check contains() first.
    // @lifetime: (&'a) -> &'a
    RefInfo& at(Reference ref) {
        tokenborrow_verify(contains(ref), "reference outside the registry");
        return records_[ref.id];
    }

    // @lifetime: (&'a) -> &'a
    const RefInfo& at(Reference ref) const {
        tokenborrow_verify(contains(ref), "reference outside the registry");
        return records_[ref.id];
    }

    size_t size() const { return records_.size(); }

    uint64_t total_held() const {
        uint64_t sum = 0;
        for (const RefInfo& info : records_) {
            sum += info.held_units;
        }
        return sum;
    }

    // @lifetime: (&'a) -> &'a
    const std::vector<RefInfo>& records() const { return records_; }
};

} // namespace tokenborrow

#endif // TOKENBORROW_REGISTRY_HPP
