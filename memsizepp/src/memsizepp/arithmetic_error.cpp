#include <memsizepp/arithmetic_error.hpp>

namespace MemSize
{
    //#####################################################################################################################
    char const* toString(ArithmeticError error)
    {
        switch (error)
        {
            case ArithmeticError::Overflow:
                return "overflow";
            case ArithmeticError::Underflow:
                return "underflow";
        }
        return "unknown arithmetic error";
    }
    //---------------------------------------------------------------------------------------------------------------------
    void throwArithmeticError(ArithmeticError error, std::string const& message)
    {
        if (error == ArithmeticError::Underflow)
            throw UnderflowError(message);
        throw OverflowError(message);
    }
    //#####################################################################################################################
}
