#ifndef TOKENBORROW_MACHINE_HPP
#define TOKENBORROW_MACHINE_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "access.hpp"
#include "option.hpp"
#include "permission.hpp"
#include "reference.hpp"
#include "registry.hpp"
#include "result.hpp"
#include "verify.hpp"
#include "violation.hpp"

// TokenMachine - token/permission model of one memory location
//
// The root reference starts out holding the only token unit in exclusive
// read-write mode. Units travel along the parent edges recorded when a
// reference is created: lend() moves one unit from parent to child,
// return_unit() moves it back and kills the child once it holds nothing.
// split()/merge() fragment and recombine a reference's own units, which is
// how several live shared views are modelled. Accesses go through
// use_token(), which applies validate_access() to the reference's kind and
// the current (exclusivity, mode) pair.
//
// Every operation either commits its whole transition or returns the
// violation without touching any state. The machine is single-threaded;
// run one instance per traced execution.

// @safe
namespace tokenborrow {

// Whether a reference that is still Borrowing may receive another unit from
// its parent before it has returned the first.
enum class RelendPolicy {
    Allow,
    Reject,
};

struct Config {
    RelendPolicy relend = RelendPolicy::Allow;
    // Log every transition and rejection through dbg to stderr.
    bool trace = false;
};

class TokenMachine {
private:
    RefRegistry registry_;
    // Invariant: equal to the sum of held_units over all references.
    uint32_t token_count_;
    PermissionRegister perms_;
    Config config_;
    Reference root_;

    explicit TokenMachine(Config config)
        : token_count_(1), perms_(AccessMode::ReadWrite), config_(config), root_{0} {
        root_ = registry_.create_root(RefKind::Unique);
    }

    template<typename R>
    R log_step(const char* op, Reference ref, R result) const {
        if (config_.trace) {
            std::ostringstream line;
            line << op << "(" << ref << ")";
            if (result.is_err()) {
                line << " rejected: " << violation_name(result.err());
            } else {
                line << " committed, token_count=" << token_count_
                     << " mode=" << perms_.mode();
            }
            std::string step = line.str();
            dbg(step);
        }
        return result;
    }

    AccessResult reject(const char* op, Reference ref, Violation v) const {
        return log_step(op, ref, AccessResult::Err(v));
    }

    AccessResult commit(const char* op, Reference ref) const {
        return log_step(op, ref, AccessResult::Ok());
    }

    Option<Reference> fragment_owner(Reference source) const {
        Reference current = source;
        while (true) {
            const RefInfo& info = registry_.at(current);
            if (info.split_count > 0) {
                return Some(current);
            }
            if (info.parent == current) {
                return None;
            }
            current = info.parent;
        }
    }

public:
    static std::pair<Reference, TokenMachine> init(Config config = Config{}) {
        TokenMachine machine(config);
        Reference root = machine.root_;
        return std::make_pair(root, std::move(machine));
    }

    // ---- Reference Registry ----

    Result<Reference, Violation> create(Reference parent, RefKind kind) {
        return log_step("create", parent, registry_.create(parent, kind));
    }

    // ---- Token Ledger ----

    // Moves one unit from target's parent to target.
    AccessResult lend(Reference target) {
        if (!registry_.contains(target)) {
            return reject("lend", target, Violation::UnknownReference);
        }
        const RefInfo& borrower = registry_.at(target);
        const RefInfo& lender = registry_.at(borrower.parent);

        if (lender.held_units == 0) {
            return reject("lend", target, Violation::InsufficientTokens);
        }
        if (borrower.state == RefState::Dead) {
            return reject("lend", target, Violation::DeadTarget);
        }
        if (config_.relend == RelendPolicy::Reject && borrower.state == RefState::Borrowing) {
            return reject("lend", target, Violation::AlreadyBorrowing);
        }

        registry_.at(borrower.parent).held_units -= 1;
        RefInfo& receiver = registry_.at(target);
        receiver.held_units += 1;
        receiver.state = RefState::Borrowing;
        return commit("lend", target);
    }

    // Gives one whole unit back to the parent. A reference that is left
    // holding nothing dies; a dead reference that still holds units relayed
    // up from its children keeps forwarding them.
    AccessResult return_unit(Reference source) {
        if (!registry_.contains(source)) {
            return reject("return_unit", source, Violation::UnknownReference);
        }
        const RefInfo& info = registry_.at(source);
        if (info.held_units == 0) {
            return reject("return_unit", source, Violation::NoTokenToReturn);
        }
        if (info.split_count != 0) {
            return reject("return_unit", source, Violation::PartialReturnForbidden);
        }

        Reference parent = info.parent;
        registry_.at(source).held_units -= 1;
        registry_.at(parent).held_units += 1;

        RefInfo& returned = registry_.at(source);
        if (returned.held_units == 0) {
            returned.state = RefState::Dead;
        }
        return commit("return_unit", source);
    }

    AccessResult split(Reference source) {
        if (!registry_.contains(source)) {
            return reject("split", source, Violation::UnknownReference);
        }
        RefInfo& info = registry_.at(source);
        if (info.held_units == 0) {
            return reject("split", source, Violation::InsufficientTokens);
        }
        // A dead reference only forwards what it relays, it cannot mint units.
        if (info.state == RefState::Dead) {
            return reject("split", source, Violation::DeadReference);
        }
        info.held_units += 1;
        info.split_count += 1;
        token_count_ += 1;
        return commit("split", source);
    }

    // Inverse of split. The fragment is charged back to the nearest
    // reference on the path to the root (source included) with an
    // outstanding split, so a fragment lent down and merged by a descendant
    // still clears the splitter's count. Units that never came from a split
    // merge without touching any split count.
    AccessResult merge(Reference source) {
        if (!registry_.contains(source)) {
            return reject("merge", source, Violation::UnknownReference);
        }
        RefInfo& info = registry_.at(source);
        if (info.held_units < 2) {
            return reject("merge", source, Violation::NothingToMerge);
        }
        tokenborrow_verify(token_count_ >= info.held_units, "held units exceed the global count");
        Option<Reference> splitter = fragment_owner(source);
        info.held_units -= 1;
        if (splitter.is_some()) {
            registry_.at(splitter.unwrap_ref()).split_count -= 1;
        }
        token_count_ -= 1;
        return commit("merge", source);
    }

    // ---- Permission Register ----

    // Counts as a write: only the holder of the sole unit may change the mode.
    AccessResult set_access_mode(Reference source, AccessMode mode) {
        if (!registry_.contains(source)) {
            return reject("set_access_mode", source, Violation::UnknownReference);
        }
        if (registry_.at(source).held_units == 0 || exclusivity() != Exclusivity::Exclusive) {
            return reject("set_access_mode", source, Violation::NotExclusive);
        }
        perms_.set_mode(mode);
        return commit("set_access_mode", source);
    }

    // ---- Access Validator ----

    AccessResult use_token(Reference source, AccessKind access) {
        if (!registry_.contains(source)) {
            return reject("use_token", source, Violation::UnknownReference);
        }
        const RefInfo& info = registry_.at(source);
        if (info.held_units == 0) {
            return reject("use_token", source, Violation::NoToken);
        }
        if (info.state == RefState::Dead) {
            return reject("use_token", source, Violation::DeadReference);
        }
        return log_step("use_token", source,
                        validate_access(info.kind, exclusivity(), perms_.mode(), access));
    }

    // ---- Queries ----

    Reference root() const { return root_; }

    uint32_t token_count() const { return token_count_; }

    Exclusivity exclusivity() const { return PermissionRegister::exclusivity(token_count_); }

    AccessMode access_mode() const { return perms_.mode(); }

    FramePermissions frame_permissions() const { return perms_.frame(token_count_); }

    Option<RefInfo> info(Reference ref) const { return registry_.find(ref); }

    size_t size() const { return registry_.size(); }

    // @lifetime: (&'a) -> &'a
    const Config& config() const { return config_; }

    // Checks the ledger and hierarchy invariants.
    AccessResult audit() const {
        if (token_count_ == 0 || registry_.total_held() != token_count_) {
            return AccessResult::Err(Violation::LedgerImbalance);
        }
        const std::vector<RefInfo>& records = registry_.records();
        for (size_t i = 0; i < records.size(); ++i) {
            const RefInfo& info = records[i];
            bool is_root = i == root_.id;
            if (is_root ? info.parent != root_ : info.parent.id >= i) {
                return AccessResult::Err(Violation::MalformedHierarchy);
            }
            if (info.state == RefState::Created && (info.held_units != 0 || info.split_count != 0)) {
                return AccessResult::Err(Violation::LedgerImbalance);
            }
        }
        return AccessResult::Ok();
    }

    void dump(std::ostream& os) const {
        os << "TokenMachine {\n"
           << "  token_count: " << token_count_
           << " (" << exclusivity() << "), access_mode: " << perms_.mode() << "\n";
        const std::vector<RefInfo>& records = registry_.records();
        for (size_t i = 0; i < records.size(); ++i) {
            os << "  " << Reference{static_cast<uint32_t>(i)} << " " << records[i] << "\n";
        }
        os << "}";
    }

    std::string to_string() const {
        std::ostringstream os;
        dump(os);
        return os.str();
    }
};

inline std::ostream& operator<<(std::ostream& os, const TokenMachine& machine) {
    machine.dump(os);
    return os;
}

} // namespace tokenborrow

#endif // TOKENBORROW_MACHINE_HPP
