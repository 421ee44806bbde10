/**
 * @file literals_test.cpp
 * @brief Tests for the MemorySize user-defined literals.
 */
#include <gtest/gtest.h>

#include <memsizepp/literals.hpp>

using MemSize::MemorySize;
using MemSize::OverflowError;

using namespace MemSize::Literals;

TEST(Literals, CompileTime) {
    static_assert((64_bit).bits() == 64);
    static_assert((1_B).bits() == 8);
    static_assert((2_kB).bits() == 16'000);
    static_assert((1_KiB).bits() == 8 * 1024);
    SUCCEED();
}

TEST(Literals, DecimalUnits) {
    EXPECT_EQ(10_B, MemorySize::fromBytes(10));
    EXPECT_EQ(3_kB, MemorySize::fromBytes(3'000));
    EXPECT_EQ(3_MB, MemorySize::fromBytes(3'000'000));
    EXPECT_EQ(3_GB, MemorySize::fromBytes(3'000'000'000));
    EXPECT_EQ(3_TB, MemorySize::fromBytes(3'000'000'000'000));
}

TEST(Literals, BinaryUnits) {
    EXPECT_EQ(16_KiB, MemorySize::fromBytes(16 * 1024));
    EXPECT_EQ(16_MiB, MemorySize::fromBytes(16ull << 20));
    EXPECT_EQ(16_GiB, MemorySize::fromBytes(16ull << 30));
    EXPECT_EQ(16_TiB, MemorySize::fromBytes(16ull << 40));
}

TEST(Literals, LargeUnits) {
    EXPECT_EQ(2_PB, MemorySize::fromBytes(2'000'000'000'000'000));
    EXPECT_EQ(1_EB, MemorySize::fromBytes(1'000'000'000'000'000'000));
    EXPECT_EQ(2_PiB, MemorySize::fromBytes(2ull << 50));
    EXPECT_EQ(1_EiB, MemorySize::fromBytes(1ull << 60));
    EXPECT_EQ((1_EiB).bits(), 1ull << 63);
}

TEST(Literals, Arithmetic) {
    EXPECT_EQ(1_KiB + 24_B, MemorySize::fromBytes(1048));
    EXPECT_EQ((1_kB).toString(), "1 kB");
    EXPECT_LT(1_kB, 1_KiB);
}

TEST(Literals, Overflow) {
    // Not constant evaluated, so the overflow surfaces as an exception.
    EXPECT_THROW((void)MemSize::Literals::operator""_TiB(3'000'000), OverflowError);
    EXPECT_THROW((void)MemSize::Literals::operator""_B(1ull << 62), OverflowError);
    EXPECT_THROW((void)MemSize::Literals::operator""_EB(3), OverflowError);
    EXPECT_THROW((void)MemSize::Literals::operator""_EiB(2), OverflowError);
    EXPECT_THROW((void)MemSize::Literals::operator""_PiB(1ull << 14), OverflowError);
}
