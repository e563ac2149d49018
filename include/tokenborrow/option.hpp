#ifndef TOKENBORROW_OPTION_HPP
#define TOKENBORROW_OPTION_HPP

#include <new>
#include <stdexcept>
#include <utility>

// Option<T> - a value that may be absent
//
// Used for lookups that can miss (info on an unknown reference) and for the
// frame permissions of the token, which are None while a single unit exists.

// @safe
namespace tokenborrow {

struct None_t {};
inline constexpr None_t None{};

template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char dummy;
    };

    void reset() {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    Option() : has_value(false), dummy(0) {}

    Option(None_t) : has_value(false), dummy(0) {}

    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(other.value);
        }
    }

    Option(Option&& other) noexcept : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(std::move(other.value));
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(other.value);
                has_value = true;
            }
        }
        return *this;
    }

    Option& operator=(Option&& other) noexcept {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(std::move(other.value));
                has_value = true;
            }
        }
        return *this;
    }

    ~Option() { reset(); }

    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    // @lifetime: (&'a) -> &'a
    const T& unwrap_ref() const {
        if (!has_value) {
            throw std::logic_error("called unwrap_ref on None");
        }
        return value;
    }

    T expect(const char* msg) const {
        if (!has_value) {
            throw std::logic_error(msg);
        }
        return value;
    }

    T unwrap_or(T fallback) const {
        return has_value ? value : fallback;
    }
};

template<typename T>
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

template<typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.is_none() || rhs.is_none()) return lhs.is_none() == rhs.is_none();
    return lhs.unwrap_ref() == rhs.unwrap_ref();
}

template<typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
    return !(lhs == rhs);
}

} // namespace tokenborrow

#endif // TOKENBORROW_OPTION_HPP
