#pragma once

#include <memsizepp/arithmetic_error.hpp>

#include <boost/leaf.hpp>
#include <fmt/ostream.h>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <string>

namespace MemSize
{
    struct FormatOptions;

    constexpr std::uint64_t BitsInByte = 8;

    namespace detail
    {
        constexpr std::uint64_t checkedMultiply(std::uint64_t lhs, std::uint64_t rhs)
        {
            if (rhs != 0 && lhs > std::numeric_limits<std::uint64_t>::max() / rhs)
                throw OverflowError("Memory size does not fit into 64 bits.");
            return lhs * rhs;
        }
    }

    struct BitsAndBytes
    {
        std::uint64_t remainderBits;
        std::uint64_t wholeBytes;

        bool operator==(BitsAndBytes const&) const = default;
    };

    /**
     * The size of an area of memory, stored as a number of bits.
     * The largest representable size is 2^64 - 1 bits (about 2.3 EB).
     */
    class MemorySize
    {
      public:
        constexpr MemorySize()
            : bits_{0}
        {}

        static constexpr MemorySize fromBits(std::uint64_t bits)
        {
            return MemorySize{bits};
        }

        /**
         * @throws OverflowError if bytes * 8 does not fit into 64 bits.
         */
        static constexpr MemorySize fromBytes(std::uint64_t bytes)
        {
            return MemorySize{detail::checkedMultiply(bytes, BitsInByte)};
        }

        /**
         * Rounds the given bit count up to the next whole byte. fromBitsCeil(9) holds 16 bits.
         */
        static constexpr MemorySize fromBitsCeil(std::uint64_t bits)
        {
            return fromBytes(bits / BitsInByte + (bits % BitsInByte != 0 ? 1 : 0));
        }

        constexpr std::uint64_t bits() const
        {
            return bits_;
        }

        /**
         * @throws std::domain_error if the size is not a whole number of bytes.
         */
        std::uint64_t bytes() const;

        constexpr bool isWholeBytes() const
        {
            return bits_ % BitsInByte == 0;
        }

        BitsAndBytes splitBitsBytes() const;

        /**
         * Smallest multiple of alignment that is not less than this size.
         * Zero is aligned to everything and an alignment of zero leaves the size untouched.
         */
        MemorySize alignUp(MemorySize alignment) const;
        MemorySize roundUpByte() const;

        /**
         * @throws std::invalid_argument if lower > upper.
         */
        MemorySize clamp(MemorySize lower, MemorySize upper) const;

        std::string toString() const;
        std::string toString(FormatOptions const& options) const;

        MemorySize& operator+=(MemorySize other);
        MemorySize& operator-=(MemorySize other);

        constexpr auto operator<=>(MemorySize const&) const = default;

        friend std::ostream& operator<<(std::ostream& os, MemorySize const& size);

      private:
        constexpr explicit MemorySize(std::uint64_t bits)
            : bits_{bits}
        {}

      private:
        std::uint64_t bits_;
    };

    MemorySize operator+(MemorySize lhs, MemorySize rhs);
    MemorySize operator-(MemorySize lhs, MemorySize rhs);

    MemorySize min(MemorySize lhs, MemorySize rhs);
    MemorySize max(MemorySize lhs, MemorySize rhs);

    boost::leaf::result<MemorySize> checkedFromBytes(std::uint64_t bytes);
    boost::leaf::result<MemorySize> checkedAdd(MemorySize lhs, MemorySize rhs);
    boost::leaf::result<MemorySize> checkedSubtract(MemorySize lhs, MemorySize rhs);

    template <typename RangeT>
    MemorySize sum(RangeT const& sizes)
    {
        MemorySize total;
        for (auto const& size : sizes)
            total += size;
        return total;
    }
    MemorySize sum(std::initializer_list<MemorySize> sizes);

    template <typename RangeT>
    boost::leaf::result<MemorySize> checkedSum(RangeT const& sizes)
    {
        MemorySize total;
        for (auto const& size : sizes)
        {
            BOOST_LEAF_ASSIGN(total, checkedAdd(total, size));
        }
        return total;
    }
}

template <>
struct std::hash<MemSize::MemorySize>
{
    std::size_t operator()(MemSize::MemorySize const& size) const noexcept
    {
        return std::hash<std::uint64_t>{}(size.bits());
    }
};

template <>
struct fmt::formatter<MemSize::MemorySize> : fmt::ostream_formatter
{};
