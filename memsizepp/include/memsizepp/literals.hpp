#pragma once

#include <memsizepp/memory_size.hpp>

namespace MemSize::Literals
{
    constexpr MemorySize operator""_bit(unsigned long long bits)
    {
        return MemorySize::fromBits(bits);
    }

    constexpr MemorySize operator""_B(unsigned long long bytes)
    {
        return MemorySize::fromBytes(bytes);
    }

    constexpr MemorySize operator""_kB(unsigned long long kilobytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(kilobytes, 1000));
    }

    constexpr MemorySize operator""_MB(unsigned long long megabytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(megabytes, 1000 * 1000));
    }

    constexpr MemorySize operator""_GB(unsigned long long gigabytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(gigabytes, 1000 * 1000 * 1000));
    }

    constexpr MemorySize operator""_TB(unsigned long long terabytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(terabytes, 1000ull * 1000 * 1000 * 1000));
    }

    constexpr MemorySize operator""_PB(unsigned long long petabytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(petabytes, 1000ull * 1000 * 1000 * 1000 * 1000));
    }

    constexpr MemorySize operator""_EB(unsigned long long exabytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(exabytes, 1000ull * 1000 * 1000 * 1000 * 1000 * 1000));
    }

    constexpr MemorySize operator""_KiB(unsigned long long kibibytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(kibibytes, 1024));
    }

    constexpr MemorySize operator""_MiB(unsigned long long mebibytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(mebibytes, 1024 * 1024));
    }

    constexpr MemorySize operator""_GiB(unsigned long long gibibytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(gibibytes, 1024 * 1024 * 1024));
    }

    constexpr MemorySize operator""_TiB(unsigned long long tebibytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(tebibytes, 1024ull * 1024 * 1024 * 1024));
    }

    constexpr MemorySize operator""_PiB(unsigned long long pebibytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(pebibytes, 1024ull * 1024 * 1024 * 1024 * 1024));
    }

    constexpr MemorySize operator""_EiB(unsigned long long exbibytes)
    {
        return MemorySize::fromBytes(detail::checkedMultiply(exbibytes, 1024ull * 1024 * 1024 * 1024 * 1024 * 1024));
    }
}
