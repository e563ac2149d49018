#ifndef TOKENBORROW_VERIFY_HPP
#define TOKENBORROW_VERIFY_HPP

#include <execinfo.h>

#include <cstdlib>
#include <iostream>

#ifndef DBG_MACRO_NO_WARNING
#define DBG_MACRO_NO_WARNING
#endif
#include <dbg.h>

#include "result.hpp"
#include "violation.hpp"

// Fail-fast reporting for embedders of the token machine.
//
// A violation means the traced program broke the aliasing discipline. The
// machine itself only rejects; an interpreter that wants the trace stopped
// wraps each call in expect_ok(), which logs the violation through dbg,
// prints a backtrace and aborts.

#define TOKENBORROW_PRINT_STACK_TRACE()                                \
    do {                                                               \
        void* buffer[30];                                              \
        int size = backtrace(buffer, 30);                              \
        char** symbols = backtrace_symbols(buffer, size);              \
        if (symbols == nullptr) {                                      \
            std::cerr << "Failed to obtain stack trace." << std::endl; \
            break;                                                     \
        }                                                              \
        std::cerr << "Stack trace:" << std::endl;                      \
        for (int i = 0; i < size; ++i) {                               \
            std::cerr << symbols[i] << std::endl;                      \
        }                                                              \
        free(symbols);                                                 \
    } while (0)

#ifndef tokenborrow_verify
#ifdef TOKENBORROW_INFER_CHECK
// Trap that static analyzers understand as a reachable crash.
#define tokenborrow_verify(x, errmsg)  \
    {                                  \
        if (!(x)) {                    \
            volatile int* a = nullptr; \
            *a;                        \
        }                              \
    }
#else
#define tokenborrow_verify(x, errmsg)         \
    do {                                      \
        if (!(x)) {                           \
            dbg(x, errmsg);                   \
            TOKENBORROW_PRINT_STACK_TRACE();  \
            std::abort();                     \
        }                                     \
    } while (0)
#endif
#endif

// @safe
namespace tokenborrow {

inline void fatal_violation(Violation v, const char* context) {
    const char* rule = violation_name(v);
    const char* reason = describe(v);
    dbg(context, rule, reason);
    TOKENBORROW_PRINT_STACK_TRACE();
    std::abort();
}

inline void expect_ok(const Result<void, Violation>& result, const char* context) {
    if (result.is_err()) {
        fatal_violation(result.err(), context);
    }
}

template<typename T>
T expect_ok(Result<T, Violation> result, const char* context) {
    if (result.is_err()) {
        fatal_violation(result.err(), context);
    }
    return result.unwrap();
}

} // namespace tokenborrow

#endif // TOKENBORROW_VERIFY_HPP
