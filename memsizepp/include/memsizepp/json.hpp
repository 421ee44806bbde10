#pragma once

#include <memsizepp/format.hpp>
#include <memsizepp/memory_size.hpp>

#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;

namespace nlohmann
{
    template <class T>
    struct adl_serializer<std::optional<T>>
    {
        static void to_json(nlohmann::json& j, const std::optional<T>& v)
        {
            if (v.has_value())
                j = *v;
            else
                j = nullptr;
        }

        static void from_json(const nlohmann::json& j, std::optional<T>& v)
        {
            if (j.is_null())
                v = std::nullopt;
            else
                v = j.get<T>();
        }
    };
} // namespace nlohmann

namespace MemSize
{
    /**
     * Whole byte sizes are written as their byte count, anything else as "<n> bit".
     */
    void to_json(nlohmann::json& j, MemorySize const& size);

    /**
     * Accepts a byte count or any text parseMemorySize understands.
     * @throws std::invalid_argument for anything else.
     */
    void from_json(nlohmann::json const& j, MemorySize& size);

    void to_json(nlohmann::json& j, UnitSystem units);

    /**
     * @throws std::invalid_argument for anything but "decimal" or "binary".
     */
    void from_json(nlohmann::json const& j, UnitSystem& units);

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(FormatOptions, units, decimalPlaces)
}
