#pragma once

#include <stdexcept>
#include <string>

namespace MemSize
{
    enum class ArithmeticError
    {
        Overflow,
        Underflow
    };

    char const* toString(ArithmeticError error);

    class OverflowError : public std::overflow_error
    {
      public:
        using std::overflow_error::overflow_error;
    };

    class UnderflowError : public std::underflow_error
    {
      public:
        using std::underflow_error::underflow_error;
    };

    /**
     * Throws the exception type matching the given error.
     */
    [[noreturn]] void throwArithmeticError(ArithmeticError error, std::string const& message);
}
