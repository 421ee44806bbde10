#include <memsizepp/json.hpp>
#include <memsizepp/parse.hpp>

#include <stdexcept>

using namespace std::literals;

namespace MemSize
{
    //#####################################################################################################################
    void to_json(nlohmann::json& j, MemorySize const& size)
    {
        if (size.isWholeBytes())
            j = size.bytes();
        else
            j = std::to_string(size.bits()) + " bit";
    }
    //---------------------------------------------------------------------------------------------------------------------
    void from_json(nlohmann::json const& j, MemorySize& size)
    {
        if (j.is_number_integer())
        {
            if (!j.is_number_unsigned() && j.get<std::int64_t>() < 0)
                throw std::invalid_argument("Memory size cannot be negative, got "s + j.dump());
            auto result = checkedFromBytes(j.get<std::uint64_t>());
            if (!result)
                throw std::invalid_argument("Byte count "s + j.dump() + " is too large for a memory size.");
            size = *result;
            return;
        }
        if (j.is_string())
        {
            const auto text = j.get<std::string>();
            auto result = parseMemorySize(text);
            if (!result)
                throw std::invalid_argument("'"s + text + "' is not a valid memory size.");
            size = *result;
            return;
        }
        throw std::invalid_argument("Expected a byte count or a size string, got "s + j.dump());
    }
    //---------------------------------------------------------------------------------------------------------------------
    void to_json(nlohmann::json& j, UnitSystem units)
    {
        j = units == UnitSystem::Binary ? "binary" : "decimal";
    }
    //---------------------------------------------------------------------------------------------------------------------
    void from_json(nlohmann::json const& j, UnitSystem& units)
    {
        if (j == "decimal")
            units = UnitSystem::Decimal;
        else if (j == "binary")
            units = UnitSystem::Binary;
        else
            throw std::invalid_argument("Expected \"decimal\" or \"binary\" as unit system, got "s + j.dump());
    }
    //#####################################################################################################################
}
