// Demo of the token machine
// Narrates a few traces and prints the machine state after each step.

#include "tokenborrow/tokenborrow.hpp"
#include <cstdio>
#include <iostream>

using namespace tokenborrow;

// @safe
namespace demo {

void show(const char* step, const TokenMachine& machine) {
    printf("\n-- %s\n", step);
    std::cout << machine << std::endl;
}

// Every step here is expected to succeed; a violation stops the program.
// @safe
void demo_lend_and_share() {
    printf("\n=== Lending, returning and sharing ===\n");

    auto [r1, machine] = TokenMachine::init();
    show("init", machine);

    Reference r2 = expect_ok(machine.create(r1, RefKind::Unique), "create r2");
    Reference r3 = expect_ok(machine.create(r1, RefKind::Unique), "create r3");
    show("create r2, r3 from r1", machine);

    expect_ok(machine.lend(r2), "lend r2");
    expect_ok(machine.use_token(r2, AccessKind::Write), "write r2");
    show("r2 borrows and writes", machine);

    expect_ok(machine.return_unit(r2), "return r2");
    show("r2 returns its unit and dies", machine);

    expect_ok(machine.lend(r3), "lend r3");
    expect_ok(machine.use_token(r3, AccessKind::Write), "write r3");
    expect_ok(machine.return_unit(r3), "return r3");
    show("r3 borrows, writes and returns", machine);

    expect_ok(machine.set_access_mode(r1, AccessMode::ReadOnly), "freeze");
    show("r1 makes the token read-only", machine);

    expect_ok(machine.split(r1), "split 1");
    expect_ok(machine.split(r1), "split 2");
    expect_ok(machine.split(r1), "split 3");
    show("r1 splits its unit three times", machine);

    Reference r4 = expect_ok(machine.create(r1, RefKind::SharedReadOnly), "create r4");
    Reference r5 = expect_ok(machine.create(r1, RefKind::SharedReadOnly), "create r5");
    expect_ok(machine.lend(r4), "lend r4");
    expect_ok(machine.lend(r5), "lend r5");
    expect_ok(machine.use_token(r1, AccessKind::Read), "read r1");
    expect_ok(machine.use_token(r4, AccessKind::Read), "read r4");
    expect_ok(machine.use_token(r5, AccessKind::Read), "read r5");
    show("r1, r4 and r5 read concurrently", machine);

    expect_ok(machine.audit(), "audit");
}

// Write x, write y, read x with x and y derived from the same root: x must
// give its unit back before y can have one, so the final read is caught.
// @safe
void demo_detect_violation() {
    printf("\n=== Write x, write y, read x ===\n");

    Config config;
    config.trace = true;
    auto [root, machine] = TokenMachine::init(config);

    Reference x = expect_ok(machine.create(root, RefKind::Unique), "create x");
    Reference y = expect_ok(machine.create(root, RefKind::Unique), "create y");

    expect_ok(machine.lend(x), "lend x");
    expect_ok(machine.use_token(x, AccessKind::Write), "write x");

    auto early = machine.lend(y);
    printf("lend y while x holds the unit: %s\n",
           early.is_ok() ? "ok" : violation_name(early.err()));

    expect_ok(machine.return_unit(x), "return x");
    expect_ok(machine.lend(y), "lend y");
    expect_ok(machine.use_token(y, AccessKind::Write), "write y");
    show("y holds the unit", machine);

    auto stale = machine.use_token(x, AccessKind::Read);
    if (stale.is_err()) {
        printf("read x rejected: %s (%s)\n",
               violation_name(stale.err()), describe(stale.err()));
    }
}

} // namespace demo

int main() {
    demo::demo_lend_and_share();
    demo::demo_detect_violation();

    printf("\nDemo complete.\n");
    return 0;
}
