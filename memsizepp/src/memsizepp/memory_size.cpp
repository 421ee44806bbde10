#include <memsizepp/memory_size.hpp>
#include <memsizepp/format.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <ostream>
#include <stdexcept>

namespace leaf = boost::leaf;

using namespace std::literals;

namespace MemSize
{
    namespace
    {
        constexpr auto MaxBits = std::numeric_limits<std::uint64_t>::max();

        bool additionOverflows(MemorySize lhs, MemorySize rhs)
        {
            return lhs.bits() > MaxBits - rhs.bits();
        }

        std::string describe(MemorySize lhs, char op, MemorySize rhs)
        {
            return std::to_string(lhs.bits()) + " bit " + op + " " + std::to_string(rhs.bits()) + " bit";
        }
    }
    //#####################################################################################################################
    std::uint64_t MemorySize::bytes() const
    {
        if (!isWholeBytes())
            throw std::domain_error(std::to_string(bits_) + " bit is not a whole number of bytes.");
        return bits_ / BitsInByte;
    }
    //---------------------------------------------------------------------------------------------------------------------
    BitsAndBytes MemorySize::splitBitsBytes() const
    {
        return BitsAndBytes{.remainderBits = bits_ % BitsInByte, .wholeBytes = bits_ / BitsInByte};
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize MemorySize::alignUp(MemorySize alignment) const
    {
        if (bits_ == 0 || alignment.bits_ == 0)
            return *this;

        using boost::multiprecision::uint128_t;
        const uint128_t aligned =
            (uint128_t{bits_} + alignment.bits_ - 1) / alignment.bits_ * alignment.bits_;
        if (aligned > MaxBits)
            throw OverflowError(
                "Aligning "s + std::to_string(bits_) + " bit up to " + std::to_string(alignment.bits_) +
                " bit overflows.");
        return MemorySize{static_cast<std::uint64_t>(aligned)};
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize MemorySize::roundUpByte() const
    {
        return alignUp(fromBytes(1));
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize MemorySize::clamp(MemorySize lower, MemorySize upper) const
    {
        if (lower > upper)
            throw std::invalid_argument("Cannot clamp to an empty range: " + describe(lower, '>', upper));
        if (*this < lower)
            return lower;
        if (upper < *this)
            return upper;
        return *this;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string MemorySize::toString() const
    {
        return format(*this);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string MemorySize::toString(FormatOptions const& options) const
    {
        return format(*this, options);
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize& MemorySize::operator+=(MemorySize other)
    {
        if (additionOverflows(*this, other))
            throwArithmeticError(ArithmeticError::Overflow, "Memory size addition overflows: " + describe(*this, '+', other));
        bits_ += other.bits_;
        return *this;
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize& MemorySize::operator-=(MemorySize other)
    {
        if (bits_ < other.bits_)
            throwArithmeticError(
                ArithmeticError::Underflow, "Memory size subtraction underflows: " + describe(*this, '-', other));
        bits_ -= other.bits_;
        return *this;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::ostream& operator<<(std::ostream& os, MemorySize const& size)
    {
        return os << format(size);
    }
    //#####################################################################################################################
    MemorySize operator+(MemorySize lhs, MemorySize rhs)
    {
        return lhs += rhs;
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize operator-(MemorySize lhs, MemorySize rhs)
    {
        return lhs -= rhs;
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize min(MemorySize lhs, MemorySize rhs)
    {
        return rhs < lhs ? rhs : lhs;
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize max(MemorySize lhs, MemorySize rhs)
    {
        return lhs < rhs ? rhs : lhs;
    }
    //---------------------------------------------------------------------------------------------------------------------
    MemorySize sum(std::initializer_list<MemorySize> sizes)
    {
        return sum<std::initializer_list<MemorySize>>(sizes);
    }
    //#####################################################################################################################
    leaf::result<MemorySize> checkedFromBytes(std::uint64_t bytes)
    {
        if (bytes > MaxBits / BitsInByte)
            return leaf::new_error(ArithmeticError::Overflow, "Byte count does not fit into 64 bits of memory size.");
        return MemorySize::fromBytes(bytes);
    }
    //---------------------------------------------------------------------------------------------------------------------
    leaf::result<MemorySize> checkedAdd(MemorySize lhs, MemorySize rhs)
    {
        if (additionOverflows(lhs, rhs))
            return leaf::new_error(ArithmeticError::Overflow, "Memory size addition overflows.");
        return MemorySize::fromBits(lhs.bits() + rhs.bits());
    }
    //---------------------------------------------------------------------------------------------------------------------
    leaf::result<MemorySize> checkedSubtract(MemorySize lhs, MemorySize rhs)
    {
        if (lhs < rhs)
            return leaf::new_error(ArithmeticError::Underflow, "Memory size subtraction underflows.");
        return MemorySize::fromBits(lhs.bits() - rhs.bits());
    }
    //#####################################################################################################################
}
