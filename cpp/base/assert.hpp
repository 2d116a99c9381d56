#pragma once

/**
 * @file assert.hpp
 * @brief Macro for ndx specific ASSERT.
 *
 * Assertions guard internal invariants only. Invalid input is always reported with an exception.
 */

#ifdef NDX_ASSERTIONS

#include <string>

namespace base {

[[noreturn]] void abort(const std::string& message);

}

#define ASSERT_MESSAGE(expression, message)                                                                            \
    if (!(expression))                                                                                                 \
    base::abort(std::string("Assertion Failed: ") + #expression + "\nMessage: " + message + "\nFile: " + __FILE__ +    \
                ":" + std::to_string(__LINE__))

#else // NDX_ASSERTIONS

#define ASSERT_MESSAGE(expression, message) ((void)0)

#endif // NDX_ASSERTIONS

#define ASSERT(expression) ASSERT_MESSAGE((expression), #expression)
