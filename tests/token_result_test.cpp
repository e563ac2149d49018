// Tests for tokenborrow::Result and tokenborrow::Option
#include "../include/tokenborrow/option.hpp"
#include "../include/tokenborrow/reference.hpp"
#include "../include/tokenborrow/result.hpp"
#include "../include/tokenborrow/violation.hpp"
#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>

using namespace tokenborrow;

Result<Reference, Violation> derive(uint32_t next, bool allowed) {
    if (!allowed) {
        return Result<Reference, Violation>::Err(Violation::KindViolation);
    }
    return Result<Reference, Violation>::Ok(Reference{next});
}

void test_result_ok_and_err() {
    printf("test_result_ok_and_err: ");
    {
        auto ok = derive(3, true);
        assert(ok.is_ok());
        assert(!ok.is_err());
        assert(static_cast<bool>(ok));
        assert(ok.unwrap() == Reference{3});

        auto err = derive(3, false);
        assert(err.is_err());
        assert(!static_cast<bool>(err));
        assert(err.err() == Violation::KindViolation);
        assert(err.unwrap_err() == Violation::KindViolation);
    }
    printf("PASS\n");
}

void test_result_unwrap_wrong_side_throws() {
    printf("test_result_unwrap_wrong_side_throws: ");
    {
        auto err = derive(1, false);
        bool threw = false;
        try {
            err.unwrap();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            err.expect("child must be derivable");
        } catch (const std::logic_error& e) {
            threw = std::string(e.what()) == "child must be derivable";
        }
        assert(threw);

        auto ok = derive(1, true);
        threw = false;
        try {
            ok.err();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }
    printf("PASS\n");
}

void test_result_unwrap_or() {
    printf("test_result_unwrap_or: ");
    {
        assert(derive(7, true).unwrap_or(Reference{0}) == Reference{7});
        assert(derive(7, false).unwrap_or(Reference{0}) == Reference{0});
    }
    printf("PASS\n");
}

void test_result_void() {
    printf("test_result_void: ");
    {
        auto ok = Result<void, Violation>::Ok();
        assert(ok.is_ok());
        ok.expect("should not throw");

        auto err = Result<void, Violation>::Err(Violation::NoToken);
        assert(err.is_err());
        assert(err.err() == Violation::NoToken);

        // Reassignment keeps the latest outcome.
        ok = err;
        assert(ok.is_err());
        assert(ok.err() == Violation::NoToken);

        err = Result<void, Violation>::Ok();
        assert(err.is_ok());
    }
    printf("PASS\n");
}

void test_result_copy_and_move() {
    printf("test_result_copy_and_move: ");
    {
        Result<std::string, Violation> named = Result<std::string, Violation>::Ok("root");
        Result<std::string, Violation> copy = named;
        assert(copy.unwrap() == "root");

        Result<std::string, Violation> moved = std::move(named);
        assert(moved.is_ok());
        assert(moved.unwrap() == "root");

        Result<std::string, Violation> err = Result<std::string, Violation>::Err(Violation::DeadTarget);
        copy = err;
        assert(copy.is_err());
        assert(copy.err() == Violation::DeadTarget);
    }
    printf("PASS\n");
}

void test_option_basics() {
    printf("test_option_basics: ");
    {
        Option<AccessMode> none = None;
        assert(none.is_none());
        assert(!none.is_some());
        assert(none.unwrap_or(AccessMode::ReadWrite) == AccessMode::ReadWrite);

        Option<AccessMode> some = Some(AccessMode::ReadOnly);
        assert(some.is_some());
        assert(some.unwrap_ref() == AccessMode::ReadOnly);
        assert(some.expect("mode present") == AccessMode::ReadOnly);

        assert(none == Option<AccessMode>(None));
        assert(some != none);
        assert(some == Some(AccessMode::ReadOnly));
        assert(some != Some(AccessMode::ReadWrite));

        bool threw = false;
        try {
            none.unwrap_ref();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        none = some;
        assert(none.is_some());
        some = Option<AccessMode>(None);
        assert(some.is_none());
    }
    printf("PASS\n");
}

void test_violation_names() {
    printf("test_violation_names: ");
    {
        assert(std::string(violation_name(Violation::PartialReturnForbidden)) == "PartialReturnForbidden");
        assert(std::string(violation_name(Violation::UniqueWriteNotExclusive)) == "UniqueWriteNotExclusive");
        assert(std::string(violation_name(Violation::MalformedHierarchy)) == "MalformedHierarchy");
        assert(std::string(describe(Violation::DeadTarget)).find("dead") != std::string::npos);
    }
    printf("PASS\n");
}

int main() {
    printf("=== Testing tokenborrow::Result / Option ===\n");

    test_result_ok_and_err();
    test_result_unwrap_wrong_side_throws();
    test_result_unwrap_or();
    test_result_void();
    test_result_copy_and_move();
    test_option_basics();
    test_violation_names();

    printf("\nAll Result/Option tests passed!\n");
    return 0;
}
