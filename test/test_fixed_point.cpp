/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/FixedPoint.hpp"

#include <cmath>
#include <cstddef>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>

namespace qoracle {
TEST(BitWidth, BitsForRange) {
  EXPECT_EQ(bitsForRange(0), 1U);
  EXPECT_EQ(bitsForRange(1), 1U);
  EXPECT_EQ(bitsForRange(2), 1U);
  EXPECT_EQ(bitsForRange(3), 2U);
  EXPECT_EQ(bitsForRange(4), 2U);
  EXPECT_EQ(bitsForRange(5), 3U);
  EXPECT_EQ(bitsForRange(1024), 10U);
  EXPECT_EQ(bitsForRange(1025), 11U);
}

TEST(BitWidth, EveryIndexIsRepresentable) {
  for (std::size_t n = 1; n < 70; ++n) {
    const auto bits = bitsForRange(n);
    EXPECT_NO_THROW(std::ignore = encodeUnsigned(n - 1, bits)) << "n = " << n;
  }
}

TEST(UnsignedCodec, EncodeAndDecode) {
  EXPECT_EQ(encodeUnsigned(5, 4), "0101");
  EXPECT_EQ(encodeUnsigned(0, 1), "0");
  EXPECT_EQ(decodeUnsigned("0101"), 5U);
  EXPECT_EQ(decodeUnsigned("1"), 1U);
}

TEST(UnsignedCodec, RejectsValuesThatDoNotFit) {
  EXPECT_THROW(std::ignore = encodeUnsigned(16, 4), RangeError);
  EXPECT_THROW(std::ignore = encodeUnsigned(1, 0), RangeError);
  EXPECT_THROW(std::ignore = decodeUnsigned(""), RangeError);
  EXPECT_THROW(std::ignore = decodeUnsigned("01x"), std::invalid_argument);
}

TEST(FixedPoint, EncodePositive) {
  // 0.125 * 2^8 = 32
  EXPECT_EQ(encodeSignedFixed(0.125, 10, 8), "0000100000");
  EXPECT_EQ(encodeSignedFixed(0.0, 10, 8), "0000000000");
}

TEST(FixedPoint, EncodeNegativeAsTwosComplement) {
  // -0.25 * 2^8 = -64 -> 1024 - 64 = 960
  const auto bits = encodeSignedFixed(-0.25, 10, 8);
  EXPECT_EQ(bits, "1111000000");
  EXPECT_EQ(bits.front(), '1');
  EXPECT_EQ(encodeSignedFixed(-1.0, 4, 0), "1111");
}

TEST(FixedPoint, RoundsTiesToEven) {
  EXPECT_EQ(encodeSignedFixed(1.5 / 256., 10, 8), "0000000010");
  EXPECT_EQ(encodeSignedFixed(2.5 / 256., 10, 8), "0000000010");
  EXPECT_EQ(encodeSignedFixed(0.3 / 256., 10, 8), "0000000000");
}

TEST(FixedPoint, RoundTripWithinHalfLsb) {
  constexpr std::size_t totalBits = 12;
  for (const std::size_t fracBits : {0U, 3U, 8U, 11U}) {
    const auto [lo, hi] = fixedPointRange(totalBits, fracBits);
    const auto halfLsb = 0.5 / std::ldexp(1.0, static_cast<int>(fracBits));
    for (int i = 0; i <= 200; ++i) {
      const auto v = lo + ((hi - lo) * i / 200.);
      const auto decoded =
          decodeSignedFixed(encodeSignedFixed(v, totalBits, fracBits), fracBits);
      EXPECT_LE(std::abs(decoded - v), halfLsb)
          << "v = " << v << ", frac_bits = " << fracBits;
    }
  }
}

TEST(FixedPoint, Range) {
  const auto [lo, hi] = fixedPointRange(10, 8);
  EXPECT_DOUBLE_EQ(lo, -2.0);
  EXPECT_DOUBLE_EQ(hi, 511. / 256.);
}

TEST(FixedPoint, OverflowIsNeverClamped) {
  EXPECT_THROW(std::ignore = encodeSignedFixed(2.0, 10, 8), OverflowError);
  EXPECT_NO_THROW(std::ignore = encodeSignedFixed(-2.0, 10, 8));
  EXPECT_THROW(std::ignore = encodeSignedFixed(-2.01, 10, 8), OverflowError);
  EXPECT_THROW(std::ignore = encodeSignedFixed(1e300, 10, 8), OverflowError);
  EXPECT_THROW(std::ignore = encodeSignedFixed(
                   std::numeric_limits<double>::quiet_NaN(), 10, 8),
               OverflowError);
}

TEST(FixedPoint, OverflowAtWideWidths) {
  // 2^(n-1) - 1 is not exactly representable as a double for n >= 55
  EXPECT_THROW(std::ignore = encodeSignedFixed(std::ldexp(1.0, 62), 63, 0),
               OverflowError);
  EXPECT_THROW(std::ignore = encodeSignedFixed(std::ldexp(1.0, 54), 55, 0),
               OverflowError);
  EXPECT_THROW(std::ignore = encodeSignedFixed(std::ldexp(1.0, 52), 55, 2),
               OverflowError);

  const auto largest = std::ldexp(1.0, 62) - 1024.;
  const auto positive = encodeSignedFixed(largest, 63, 0);
  EXPECT_EQ(positive.front(), '0');
  EXPECT_DOUBLE_EQ(decodeSignedFixed(positive, 0), largest);

  const auto negative = encodeSignedFixed(-std::ldexp(1.0, 62), 63, 0);
  EXPECT_EQ(negative, "1" + std::string(62, '0'));
  EXPECT_DOUBLE_EQ(decodeSignedFixed(negative, 0), -std::ldexp(1.0, 62));
}

TEST(FixedPoint, RejectsInvalidWidths) {
  EXPECT_THROW(std::ignore = encodeSignedFixed(0.0, 0, 0), ConfigurationError);
  EXPECT_THROW(std::ignore = encodeSignedFixed(0.0, 64, 0),
               ConfigurationError);
  EXPECT_THROW(std::ignore = fixedPointRange(8, 63), ConfigurationError);
}

TEST(FixedPoint, DecodeSignBit) {
  EXPECT_DOUBLE_EQ(decodeSignedFixed("1000000000", 8), -2.0);
  EXPECT_DOUBLE_EQ(decodeSignedFixed("0111111111", 8), 511. / 256.);
  EXPECT_DOUBLE_EQ(decodeSignedFixed("1", 0), -1.0);
}
} // namespace qoracle
