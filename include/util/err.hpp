// Definition of the Err type.
#pragma once

#include <util/assert.hpp>
#include <util/error.hpp>
#include <selftests/selftests.hpp>

struct Ok_t {};

// Value/tag to construct an Err that does not contain an error.
inline Ok_t Ok;

// Type representing an error or the lack thereof.
// An Err optionally contains an error. It is used for functions that typically
// return void, but still need to communicate whether or not an error occured.
// For functions that need to both return a non-void value _and_ communicate
// errors use Res<T> instead.
class Err {
public:
    // A default Err does not contain an error.
    Err() : m_isError(false), m_error(Error::Test) {}

    // Construct an Err that does not contain an Error.
    Err(Ok_t const) : Err() {}

    // Construct an Err that contains an Error.
    // @param error: The error to be contained in the resulting Err.
    Err(Error const error) : m_isError(true), m_error(error) {}

    // Check if this Err contains an error.
    // @return: true if it contains an error, false otherwise.
    explicit operator bool() const {
        return m_isError;
    }

    // Get the error contained in this Err. If this Err does not contain an
    // error then this function PANICs.
    // @return: The contained Error.
    Error error() const {
        ASSERT(m_isError);
        return m_error;
    }

    // Check if this Err contains a particular error, e.g.
    //  if (space->map(...) == Error::AlreadyMapped) {...}
    // @param error: The error to compare with.
    // @return: true if this Err contains `error`, false if it contains another
    // error or no error at all.
    bool operator==(Error const error) const {
        return m_isError && m_error == error;
    }
private:
    // true if this Err contains an error, false otherwise.
    bool m_isError;
    // The error contained. Undefined if m_isError == false.
    Error m_error;
};

namespace ErrType {
// Run the tests for the Err type.
void Test(SelfTests::TestRunner& runner);
}
