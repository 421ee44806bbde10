#pragma once

#include <memsizepp/memory_size.hpp>

#include <boost/leaf.hpp>

#include <string>
#include <string_view>

namespace MemSize
{
    enum class ParseError
    {
        Empty,
        InvalidNumber,
        UnknownUnit
    };

    char const* toString(ParseError error);

    // Error object carrying the text that failed to parse.
    struct e_size_text
    {
        std::string value;
    };

    /**
     * Parses "<number>[.<fraction>][ ]<unit>", e.g. "512", "10 kB", "1.5MiB", "12 bit".
     * Units are bit/bits/b, B, kB/KB, MB, GB, TB, PB, EB and KiB, MiB, GiB, TiB, PiB, EiB; no unit means bytes.
     * Fractions are converted exactly and rounded up to a whole bit.
     *
     * Fails with a ParseError or with ArithmeticError::Overflow, together with an e_size_text.
     */
    boost::leaf::result<MemorySize> parseMemorySize(std::string_view text);
}
