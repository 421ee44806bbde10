#include <memsizepp/format.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace MemSize
{
    namespace
    {
        using boost::multiprecision::uint128_t;

        constexpr unsigned LargestExponent = 6;
        constexpr std::array<char const*, LargestExponent + 1> decimalSuffixes = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
        constexpr std::array<char const*, LargestExponent + 1> binarySuffixes = {
            "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

        std::uint64_t powerOfTen(unsigned exponent)
        {
            std::uint64_t result = 1;
            for (unsigned i = 0; i != exponent; ++i)
                result *= 10;
            return result;
        }
    }
    //#####################################################################################################################
    std::uint64_t unitBase(UnitSystem units)
    {
        return units == UnitSystem::Binary ? 1024 : 1000;
    }
    //---------------------------------------------------------------------------------------------------------------------
    char const* unitSuffix(UnitSystem units, unsigned exponent)
    {
        if (exponent > LargestExponent)
            throw std::out_of_range("No unit suffix for exponent "s + std::to_string(exponent));
        return units == UnitSystem::Binary ? binarySuffixes[exponent] : decimalSuffixes[exponent];
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string format(MemorySize size, FormatOptions const& options)
    {
        if (options.decimalPlaces > MaxDecimalPlaces)
            throw std::invalid_argument(
                "At most "s + std::to_string(MaxDecimalPlaces) + " decimal places are supported, got " +
                std::to_string(options.decimalPlaces));

        std::ostringstream stream;
        if (size.bits() != 0 && size.bits() < BitsInByte)
        {
            stream << size.bits() << " bit";
            return stream.str();
        }

        const auto base = unitBase(options.units);
        unsigned exponent = 0;
        std::uint64_t unitBits = BitsInByte;
        // bits / base >= unitBits is bits >= unitBits * base without the multiplication overflowing.
        while (exponent < LargestExponent && size.bits() / base >= unitBits)
        {
            unitBits *= base;
            ++exponent;
        }

        if (exponent == 0)
        {
            stream << size.bits() / BitsInByte << ' ' << unitSuffix(options.units, 0);
            return stream.str();
        }

        const auto scale = powerOfTen(options.decimalPlaces);
        const uint128_t scaled = uint128_t{size.bits()} * scale / unitBits;

        stream << static_cast<std::uint64_t>(scaled / scale);
        if (options.decimalPlaces != 0)
        {
            stream << '.' << std::setw(static_cast<int>(options.decimalPlaces)) << std::setfill('0')
                   << static_cast<std::uint64_t>(scaled % scale);
        }
        stream << ' ' << unitSuffix(options.units, exponent);
        return stream.str();
    }
    //#####################################################################################################################
}
