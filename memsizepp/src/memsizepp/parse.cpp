#include <memsizepp/parse.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cctype>
#include <limits>
#include <optional>
#include <utility>

namespace leaf = boost::leaf;

namespace MemSize
{
    namespace
    {
        using boost::multiprecision::cpp_int;

        constexpr std::uint64_t Kilo = 1000;
        constexpr std::uint64_t Kibi = 1024;

        // Bits per unit.
        constexpr std::array<std::pair<std::string_view, std::uint64_t>, 17> units = {{
            {"bit", 1},
            {"bits", 1},
            {"b", 1},
            {"B", BitsInByte},
            {"kB", BitsInByte * Kilo},
            {"KB", BitsInByte * Kilo},
            {"MB", BitsInByte * Kilo * Kilo},
            {"GB", BitsInByte * Kilo * Kilo * Kilo},
            {"TB", BitsInByte * Kilo * Kilo * Kilo * Kilo},
            {"PB", BitsInByte * Kilo * Kilo * Kilo * Kilo * Kilo},
            {"EB", BitsInByte * Kilo * Kilo * Kilo * Kilo * Kilo * Kilo},
            {"KiB", BitsInByte * Kibi},
            {"MiB", BitsInByte * Kibi * Kibi},
            {"GiB", BitsInByte * Kibi * Kibi * Kibi},
            {"TiB", BitsInByte * Kibi * Kibi * Kibi * Kibi},
            {"PiB", BitsInByte * Kibi * Kibi * Kibi * Kibi * Kibi},
            {"EiB", BitsInByte * Kibi * Kibi * Kibi * Kibi * Kibi * Kibi},
        }};

        bool isSpace(char c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        bool isDigit(char c)
        {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && isSpace(text.front()))
                text.remove_prefix(1);
            while (!text.empty() && isSpace(text.back()))
                text.remove_suffix(1);
            return text;
        }

        std::optional<std::uint64_t> bitsPerUnit(std::string_view unit)
        {
            if (unit.empty())
                return BitsInByte;
            for (auto const& [name, bits] : units)
            {
                if (name == unit)
                    return bits;
            }
            return std::nullopt;
        }

        // Appends the digits at the front of text to value and returns how many were consumed.
        std::size_t consumeDigits(std::string_view text, cpp_int& value)
        {
            std::size_t count = 0;
            for (; count != text.size() && isDigit(text[count]); ++count)
                value = value * 10 + (text[count] - '0');
            return count;
        }
    }
    //#####################################################################################################################
    char const* toString(ParseError error)
    {
        switch (error)
        {
            case ParseError::Empty:
                return "empty input";
            case ParseError::InvalidNumber:
                return "invalid number";
            case ParseError::UnknownUnit:
                return "unknown unit";
        }
        return "unknown parse error";
    }
    //---------------------------------------------------------------------------------------------------------------------
    leaf::result<MemorySize> parseMemorySize(std::string_view text)
    {
        auto load = leaf::on_error(e_size_text{std::string{text}});

        auto remaining = trim(text);
        if (remaining.empty())
            return leaf::new_error(ParseError::Empty, "Memory size is empty.");

        cpp_int mantissa = 0;
        cpp_int scale = 1;

        const auto integerDigits = consumeDigits(remaining, mantissa);
        if (integerDigits == 0)
            return leaf::new_error(ParseError::InvalidNumber, "Memory size does not start with a number.");
        remaining.remove_prefix(integerDigits);

        if (!remaining.empty() && remaining.front() == '.')
        {
            remaining.remove_prefix(1);
            const auto fractionDigits = consumeDigits(remaining, mantissa);
            if (fractionDigits == 0)
                return leaf::new_error(ParseError::InvalidNumber, "Decimal point is not followed by digits.");
            remaining.remove_prefix(fractionDigits);
            for (std::size_t i = 0; i != fractionDigits; ++i)
                scale *= 10;
        }

        const auto unitBits = bitsPerUnit(trim(remaining));
        if (!unitBits)
            return leaf::new_error(ParseError::UnknownUnit, "Memory size has an unknown unit.");

        const cpp_int bits = (mantissa * *unitBits + scale - 1) / scale;
        if (bits > std::numeric_limits<std::uint64_t>::max())
            return leaf::new_error(ArithmeticError::Overflow, "Memory size does not fit into 64 bits.");
        return MemorySize::fromBits(bits.convert_to<std::uint64_t>());
    }
    //#####################################################################################################################
}
