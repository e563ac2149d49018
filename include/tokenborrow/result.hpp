#ifndef TOKENBORROW_RESULT_HPP
#define TOKENBORROW_RESULT_HPP

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

// Result<T, E> - outcome of a token machine operation
//
// Either Ok (the transition committed, carrying a value for create()) or Err
// (the transition was rejected, carrying the violation). Operations never
// throw for rule violations; unwrapping the wrong side throws
// std::logic_error since that is a bug in the caller, not in the trace.

// @safe
namespace tokenborrow {

template<typename T, typename E>
class Result {
private:
    union Storage {
        typename std::aligned_storage<sizeof(T), alignof(T)>::type ok_storage;
        typename std::aligned_storage<sizeof(E), alignof(E)>::type err_storage;

        Storage() {}
        ~Storage() {}
    } storage;

    bool ok_;

    T& ok_ref() { return *reinterpret_cast<T*>(&storage.ok_storage); }
    const T& ok_ref() const { return *reinterpret_cast<const T*>(&storage.ok_storage); }
    E& err_ref() { return *reinterpret_cast<E*>(&storage.err_storage); }
    const E& err_ref() const { return *reinterpret_cast<const E*>(&storage.err_storage); }

    void construct_from(const Result& other) {
        ok_ = other.ok_;
        if (ok_) {
            new (&storage.ok_storage) T(other.ok_ref());
        } else {
            new (&storage.err_storage) E(other.err_ref());
        }
    }

    void construct_from(Result&& other) {
        ok_ = other.ok_;
        if (ok_) {
            new (&storage.ok_storage) T(std::move(other.ok_ref()));
        } else {
            new (&storage.err_storage) E(std::move(other.err_ref()));
        }
    }

    void destroy() {
        if (ok_) {
            ok_ref().~T();
        } else {
            err_ref().~E();
        }
    }

    explicit Result(bool ok) : ok_(ok) {}

public:
    static Result Ok(T value) {
        Result r(true);
        new (&r.storage.ok_storage) T(std::move(value));
        return r;
    }

    static Result Err(E error) {
        Result r(false);
        new (&r.storage.err_storage) E(std::move(error));
        return r;
    }

    Result(const Result& other) { construct_from(other); }

    Result(Result&& other) noexcept { construct_from(std::move(other)); }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy();
            construct_from(other);
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            destroy();
            construct_from(std::move(other));
        }
        return *this;
    }

    ~Result() { destroy(); }

    bool is_ok() const { return ok_; }
    bool is_err() const { return !ok_; }

    T unwrap() {
        if (!ok_) {
            throw std::logic_error("called unwrap on an Err result");
        }
        return std::move(ok_ref());
    }

    // Like unwrap, with the caller's own message.
    T expect(const char* msg) {
        if (!ok_) {
            throw std::logic_error(msg);
        }
        return std::move(ok_ref());
    }

    T unwrap_or(T fallback) {
        if (ok_) {
            return std::move(ok_ref());
        }
        return fallback;
    }

    // @lifetime: (&'a) -> &'a
    const E& err() const {
        if (ok_) {
            throw std::logic_error("called err on an Ok result");
        }
        return err_ref();
    }

    E unwrap_err() {
        if (ok_) {
            throw std::logic_error("called unwrap_err on an Ok result");
        }
        return std::move(err_ref());
    }

    explicit operator bool() const { return ok_; }
};

// Result<void, E> - an operation that only commits or rejects.
template<typename E>
class Result<void, E> {
private:
    union Storage {
        typename std::aligned_storage<sizeof(E), alignof(E)>::type err_storage;

        Storage() {}
        ~Storage() {}
    } storage;

    bool ok_;

    E& err_ref() { return *reinterpret_cast<E*>(&storage.err_storage); }
    const E& err_ref() const { return *reinterpret_cast<const E*>(&storage.err_storage); }

    void destroy() {
        if (!ok_) {
            err_ref().~E();
        }
    }

public:
    static Result Ok() { return Result(); }

    static Result Err(E error) {
        Result r;
        new (&r.storage.err_storage) E(std::move(error));
        r.ok_ = false;
        return r;
    }

    Result() : ok_(true) {}

    Result(const Result& other) : ok_(other.ok_) {
        if (!ok_) {
            new (&storage.err_storage) E(other.err_ref());
        }
    }

    Result(Result&& other) noexcept : ok_(other.ok_) {
        if (!ok_) {
            new (&storage.err_storage) E(std::move(other.err_ref()));
        }
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy();
            ok_ = other.ok_;
            if (!ok_) {
                new (&storage.err_storage) E(other.err_ref());
            }
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            destroy();
            ok_ = other.ok_;
            if (!ok_) {
                new (&storage.err_storage) E(std::move(other.err_ref()));
            }
        }
        return *this;
    }

    ~Result() { destroy(); }

    bool is_ok() const { return ok_; }
    bool is_err() const { return !ok_; }

    void expect(const char* msg) const {
        if (!ok_) {
            throw std::logic_error(msg);
        }
    }

    // @lifetime: (&'a) -> &'a
    const E& err() const {
        if (ok_) {
            throw std::logic_error("called err on an Ok result");
        }
        return err_ref();
    }

    E unwrap_err() {
        if (ok_) {
            throw std::logic_error("called unwrap_err on an Ok result");
        }
        return std::move(err_ref());
    }

    explicit operator bool() const { return ok_; }
};

template<typename T, typename E>
Result<T, E> Ok(T value) {
    return Result<T, E>::Ok(std::move(value));
}

template<typename T, typename E>
Result<T, E> Err(E error) {
    return Result<T, E>::Err(std::move(error));
}

} // namespace tokenborrow

#endif // TOKENBORROW_RESULT_HPP
