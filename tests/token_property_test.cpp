// Property tests: random operation traces against the machine invariants
#include "../include/tokenborrow/tokenborrow.hpp"
#include <cassert>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

using namespace tokenborrow;

static int state_rank(RefState state) {
    switch (state) {
        case RefState::Created: return 0;
        case RefState::Borrowing: return 1;
        case RefState::Dead: return 2;
    }
    return -1;
}

static uint32_t held_sum(const TokenMachine& machine) {
    uint32_t sum = 0;
    for (uint32_t id = 0; id < machine.size(); ++id) {
        sum += machine.info(Reference{id}).unwrap_ref().held_units;
    }
    return sum;
}

// Applies one random operation and checks what must hold afterwards.
static void random_step(TokenMachine& machine, std::mt19937& rng, std::vector<RefState>& seen) {
    const RefKind kinds[] = {RefKind::Unique, RefKind::SharedReadWrite, RefKind::SharedReadOnly};
    std::uniform_int_distribution<uint32_t> pick_ref(0, static_cast<uint32_t>(machine.size() - 1));
    std::uniform_int_distribution<int> pick_op(0, 6);
    std::uniform_int_distribution<int> pick_kind(0, 2);
    std::uniform_int_distribution<int> coin(0, 1);

    Reference ref{pick_ref(rng)};
    uint32_t count_before = machine.token_count();
    std::string before = machine.to_string();

    int op = pick_op(rng);
    bool committed = false;
    switch (op) {
        case 0: {
            auto created = machine.create(ref, kinds[pick_kind(rng)]);
            committed = created.is_ok();
            if (committed) {
                seen.push_back(RefState::Created);
            }
            break;
        }
        case 1:
            committed = machine.lend(ref).is_ok();
            break;
        case 2:
            committed = machine.return_unit(ref).is_ok();
            break;
        case 3:
            committed = machine.split(ref).is_ok();
            if (committed) {
                assert(machine.token_count() == count_before + 1);
            }
            break;
        case 4:
            committed = machine.merge(ref).is_ok();
            if (committed) {
                assert(machine.token_count() == count_before - 1);
            }
            break;
        case 5: {
            AccessMode mode = coin(rng) ? AccessMode::ReadOnly : AccessMode::ReadWrite;
            committed = machine.set_access_mode(ref, mode).is_ok();
            assert(committed == (count_before == 1 && machine.info(ref).unwrap_ref().held_units == 1));
            break;
        }
        case 6: {
            AccessKind access = coin(rng) ? AccessKind::Read : AccessKind::Write;
            auto outcome = machine.use_token(ref, access);
            RefInfo info = machine.info(ref).unwrap_ref();
            if (info.held_units == 0) {
                assert(outcome.err() == Violation::NoToken);
            } else if (info.state == RefState::Dead) {
                assert(outcome.err() == Violation::DeadReference);
            } else {
                auto expected = validate_access(info.kind, machine.exclusivity(),
                                                machine.access_mode(), access);
                assert(outcome.is_ok() == expected.is_ok());
            }
            // Accesses never change state.
            assert(machine.to_string() == before);
            break;
        }
    }

    if (!committed) {
        assert(machine.to_string() == before);
    }
    if (op != 3 && op != 4) {
        assert(machine.token_count() == count_before);
    }

    assert(held_sum(machine) == machine.token_count());
    assert(machine.audit().is_ok());

    for (uint32_t id = 0; id < machine.size(); ++id) {
        RefState now = machine.info(Reference{id}).unwrap_ref().state;
        assert(state_rank(now) >= state_rank(seen[id]));
        seen[id] = now;
    }
}

void test_property_random_traces() {
    printf("test_property_random_traces: ");
    {
        std::mt19937 rng(20261019);
        for (int trace = 0; trace < 200; ++trace) {
            Config config;
            config.relend = trace % 2 == 0 ? RelendPolicy::Allow : RelendPolicy::Reject;
            auto [root, machine] = TokenMachine::init(config);
            std::vector<RefState> seen{RefState::Borrowing};
            assert(machine.info(root).is_some());
            for (int step = 0; step < 150; ++step) {
                random_step(machine, rng, seen);
            }
        }
    }
    printf("PASS\n");
}

void test_property_split_merge_round_trip() {
    printf("test_property_split_merge_round_trip: ");
    {
        auto [root, machine] = TokenMachine::init();
        Reference child = machine.create(root, RefKind::SharedReadWrite).unwrap();
        assert(machine.lend(child).is_ok());
        assert(machine.split(child).is_ok());

        RefInfo before = machine.info(child).unwrap_ref();
        uint32_t count = machine.token_count();

        assert(machine.split(child).is_ok());
        assert(machine.merge(child).is_ok());

        RefInfo after = machine.info(child).unwrap_ref();
        assert(after.held_units == before.held_units);
        assert(after.split_count == before.split_count);
        assert(machine.token_count() == count);
    }
    printf("PASS\n");
}

void test_property_exclusivity_gating() {
    printf("test_property_exclusivity_gating: ");
    {
        auto [root, machine] = TokenMachine::init();
        assert(machine.split(root).is_ok());
        assert(machine.split(root).is_ok());
        assert(machine.token_count() == 3);
        assert(machine.set_access_mode(root, AccessMode::ReadOnly).err() == Violation::NotExclusive);
        assert(machine.set_access_mode(root, AccessMode::ReadWrite).err() == Violation::NotExclusive);
    }
    printf("PASS\n");
}

void test_property_dead_cannot_receive() {
    printf("test_property_dead_cannot_receive: ");
    {
        auto [root, machine] = TokenMachine::init();
        Reference x = machine.create(root, RefKind::Unique).unwrap();
        assert(machine.lend(x).is_ok());
        assert(machine.return_unit(x).is_ok());
        assert(machine.info(x).unwrap_ref().held_units == 0);
        for (int i = 0; i < 3; ++i) {
            assert(machine.lend(x).err() == Violation::DeadTarget);
        }
        assert(machine.info(x).unwrap_ref().state == RefState::Dead);
    }
    printf("PASS\n");
}

void test_property_dump_lists_everything() {
    printf("test_property_dump_lists_everything: ");
    {
        auto [root, machine] = TokenMachine::init();
        Reference child = machine.create(root, RefKind::SharedReadOnly).unwrap();
        assert(machine.lend(child).is_ok());

        std::string dump = machine.to_string();
        assert(dump.find("token_count: 1 (Exclusive)") != std::string::npos);
        assert(dump.find("access_mode: ReadWrite") != std::string::npos);
        assert(dump.find("r0 { kind: Unique, state: Borrowing, parent: r0, units: 0, splits: 0 }") != std::string::npos);
        assert(dump.find("r1 { kind: SharedReadOnly, state: Borrowing, parent: r0, units: 1, splits: 0 }") != std::string::npos);
    }
    printf("PASS\n");
}

int main() {
    printf("=== Testing token machine properties ===\n");

    test_property_random_traces();
    test_property_split_merge_round_trip();
    test_property_exclusivity_gating();
    test_property_dead_cannot_receive();
    test_property_dump_lists_everything();

    printf("\nAll property tests passed!\n");
    return 0;
}
