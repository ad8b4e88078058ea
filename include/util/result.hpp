// Definition of the Res<T> template class.
#pragma once

#include <new>
#include <util/panic.hpp>
#include <util/error.hpp>
#include <util/concepts.hpp>
#include <selftests/selftests.hpp>

// Wrapper class that either contain a result/value or an Error. Useful for
// functions that need to return either a value or an error, for instance
// alloc(), ...
// T and Error are contained in a union so the memory footprint of Res<T> is
// minimal, typically max(sizeof(Error), sizeof(T)) + 1 modulo any padding added
// by the compiler.
template<typename T>
class Res {
public:
    // Construct a default Res<T> containing a default value of T.
    Res() : m_isError(false), m_value() {}

    // Construct a Res<T> containing an error.
    Res(Error const err) : m_isError(true), m_error(err) {}

    // Construct a Res<T> containing a value copy initialized from the given
    // value.
    // @param value: The value to construct the contained value from (copy).
    Res(T const& value) : m_isError(false), m_value(value) {}

    // Copy a Res<T>. The contained value or error is copied.
    // @param other: The Res<T> to copy.
    Res(Res const& other) : m_isError(other.m_isError) {
        if (m_isError) {
            m_error = other.m_error;
        } else {
            new (&m_value) T(other.m_value);
        }
    }

    // Construct a Res<T> containing a value by constructing the value in-place.
    // This constructor does not participate when copying a Res<T>.
    // @param args...: The constructor parameters used to construct the value.
    template<typename... Args>
    requires (sizeof...(Args) != 1 ||
              (!SameAs<RemoveCvRef<Args>, Res> && ...))
    Res(Args&&... args) : m_isError(false), m_value(args...) {}

    Res& operator=(Res const& other) = delete;

    // Destroy a Res<T>. If this Res<T> contained a value, this value is
    // destroyed by calling its destructor.
    ~Res() {
        if (ok()) {
            m_value.~T();
        }
    }

    // Check if this Res<T> contains a value, e.g. does not contain an error.
    // @return: true if this Res<T> contains a value, false otherwise (e.g.
    // contains an error).
    bool ok() const {
        return !m_isError;
    }

    // Shortcut for ok() when a Res<T> is used in a condition.
    // @return: true if this Res<T> contains a value, false otherwise.
    explicit operator bool() const {
        return ok();
    }

    // Get the error contained in this Res<T>. PANICs if this Res<T> does not
    // contain an error.
    // @return: The error contained in this Res<T>.
    Error error() const {
        if (ok()) {
            PANIC("Attempt to call error() on Res<T> with ok() == true");
        }
        return m_error;
    }

    // Get a reference to the value contained in this Res<T>. PANICs if this
    // Res<T> does not contain a value.
    // @return: A reference to the value contained in this Res<T>.
    T& value() {
        if (!ok()) {
            PANIC("Attempt to call value() on Res<T> with error {}", m_error);
        }
        return m_value;
    }

    // Get a const reference to the value contained in this Res<T>. PANICs if
    // this Res<T> does not contain a value.
    // @return: A const reference to the value contained in this Res<T>.
    T const& value() const {
        if (!ok()) {
            PANIC("Attempt to call value() on Res<T> with error {}", m_error);
        }
        return m_value;
    }

    // Pseudo-pointer accessors to the contained value. PANIC if this Res<T>
    // does not contain a value.
    T& operator*() { return value(); }
    T const& operator*() const { return value(); }
    T* operator->() { return &value(); }
    T const* operator->() const { return &value(); }

private:
    // true if this Res<T> contains an error, false otherwise.
    bool m_isError;
    union {
        Error m_error;
        T m_value;
    };
};

namespace Result {
// Run the tests for the Res<T> type.
void Test(SelfTests::TestRunner& runner);
}
