#pragma once

#include <memsizepp/memory_size.hpp>

#include <string>

namespace MemSize
{
    enum class UnitSystem
    {
        // Powers of 1000: B, kB, MB, GB, TB, PB, EB
        Decimal,
        // Powers of 1024: B, KiB, MiB, GiB, TiB, PiB, EiB
        Binary
    };

    constexpr unsigned MaxDecimalPlaces = 9;

    struct FormatOptions
    {
        UnitSystem units = UnitSystem::Decimal;
        unsigned decimalPlaces = 0;
    };

    /**
     * Renders the size with the largest unit whose value is at least one.
     * Fractional digits are truncated, byte counts below one kilo unit are printed as integers
     * and sizes below one byte are printed in bits, e.g. "5 bit", "10 B", "1 kB", "1.50 MiB".
     *
     * @throws std::invalid_argument if options.decimalPlaces exceeds MaxDecimalPlaces.
     */
    std::string format(MemorySize size, FormatOptions const& options = {});

    /**
     * Unit suffix for the given power of the unit system's base, "B" for 0.
     */
    char const* unitSuffix(UnitSystem units, unsigned exponent);
    std::uint64_t unitBase(UnitSystem units);
}
