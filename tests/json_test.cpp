/**
 * @file json_test.cpp
 * @brief Tests for the nlohmann::json serialization of MemorySize and FormatOptions.
 */
#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

#include <memsizepp/json.hpp>

using MemSize::FormatOptions;
using MemSize::MemorySize;
using MemSize::UnitSystem;

// ---------- MemorySize ----------

TEST(Json, WholeBytesAsNumber) {
    EXPECT_EQ(json(MemorySize::fromBytes(4096)), json(4096));
    EXPECT_EQ(json(MemorySize{}), json(0));
}

TEST(Json, PartialBytesAsString) {
    EXPECT_EQ(json(MemorySize::fromBits(12)), json("12 bit"));
    EXPECT_EQ(json(MemorySize::fromBits(12)).get<MemorySize>(), MemorySize::fromBits(12));
}

TEST(Json, FromNumber) {
    EXPECT_EQ(json(10).get<MemorySize>(), MemorySize::fromBytes(10));
    EXPECT_EQ(json::parse("1048576").get<MemorySize>(), MemorySize::fromBytes(1'048'576));
}

TEST(Json, FromString) {
    EXPECT_EQ(json("64 MiB").get<MemorySize>(), MemorySize::fromBytes(64ull << 20));
    EXPECT_EQ(json("1.5 kB").get<MemorySize>(), MemorySize::fromBytes(1500));
}

TEST(Json, Rejects) {
    EXPECT_THROW((void)json(-1).get<MemorySize>(), std::invalid_argument);
    EXPECT_THROW((void)json("ten bytes").get<MemorySize>(), std::invalid_argument);
    EXPECT_THROW((void)json(1.5).get<MemorySize>(), std::invalid_argument);
    EXPECT_THROW((void)json(json::object()).get<MemorySize>(), std::invalid_argument);
    EXPECT_THROW((void)json(std::uint64_t{1} << 62).get<MemorySize>(), std::invalid_argument);
}

TEST(Json, Optional) {
    std::optional<MemorySize> size = MemorySize::fromBytes(5);
    EXPECT_EQ(json(size), json(5));
    size.reset();
    EXPECT_TRUE(json(size).is_null());

    EXPECT_FALSE(json(nullptr).get<std::optional<MemorySize>>().has_value());
    EXPECT_EQ(json("1 kB").get<std::optional<MemorySize>>(), MemorySize::fromBytes(1000));
}

// ---------- FormatOptions ----------

TEST(Json, FormatOptions) {
    const auto options = json::parse(R"({"units": "binary", "decimalPlaces": 2})").get<FormatOptions>();
    EXPECT_EQ(options.units, UnitSystem::Binary);
    EXPECT_EQ(options.decimalPlaces, 2u);

    const auto written = json(FormatOptions{.units = UnitSystem::Decimal, .decimalPlaces = 1});
    EXPECT_EQ(written.at("units"), "decimal");
    EXPECT_EQ(written.at("decimalPlaces"), 1);
}

TEST(Json, FormatOptionsDefaults) {
    const auto options = json::object().get<FormatOptions>();
    EXPECT_EQ(options.units, UnitSystem::Decimal);
    EXPECT_EQ(options.decimalPlaces, 0u);
}

TEST(Json, RejectsUnknownUnitSystem) {
    EXPECT_THROW((void)json("Binary").get<UnitSystem>(), std::invalid_argument);
    EXPECT_THROW((void)json("bianry").get<UnitSystem>(), std::invalid_argument);
    EXPECT_THROW((void)json(1).get<UnitSystem>(), std::invalid_argument);
    EXPECT_THROW((void)json::parse(R"({"units": "Binary"})").get<FormatOptions>(), std::invalid_argument);
    EXPECT_EQ(json("binary").get<UnitSystem>(), UnitSystem::Binary);
    EXPECT_EQ(json(UnitSystem::Binary), json("binary"));
}
