/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/FixedPoint.hpp"

#include "qoracle/Definitions.hpp"
#include "qoracle/Exceptions.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>

namespace qoracle {
namespace {
void checkWidths(const std::size_t totalBits, const std::size_t fracBits) {
  if (totalBits == 0 || totalBits > MAX_PACKED_BITS) {
    throw ConfigurationError("Fixed-point width must be in [1, " +
                             std::to_string(MAX_PACKED_BITS) + "], got " +
                             std::to_string(totalBits) + ".");
  }
  if (fracBits >= MAX_PACKED_BITS) {
    throw ConfigurationError("Number of fractional bits must be smaller than " +
                             std::to_string(MAX_PACKED_BITS) + ", got " +
                             std::to_string(fracBits) + ".");
  }
}

/// Integer range [min, max] of a signed two's-complement register.
std::pair<std::int64_t, std::int64_t> signedRange(const std::size_t totalBits) {
  const auto half = std::int64_t{1} << (totalBits - 1);
  return {-half, half - 1};
}
} // namespace

std::string encodeSignedFixed(const double value, const std::size_t totalBits,
                              const std::size_t fracBits) {
  checkWidths(totalBits, fracBits);
  const auto scale = std::ldexp(1.0, static_cast<int>(fracBits));
  const auto [minInt, maxInt] = signedRange(totalBits);
  // 2^(totalBits-1) is exact in double, unlike maxInt for wide registers
  const auto bound = std::ldexp(1.0, static_cast<int>(totalBits - 1));
  // ties are rounded to even
  const auto scaled = std::nearbyint(value * scale);
  if (!std::isfinite(scaled) || scaled < -bound || scaled >= bound) {
    std::stringstream ss;
    ss << "Value " << value << " overflows signed fixed-point ["
       << static_cast<double>(minInt) / scale << ", "
       << static_cast<double>(maxInt) / scale << "] for total_bits=" << totalBits
       << ", frac_bits=" << fracBits << ".";
    throw OverflowError(ss.str());
  }
  auto raw = static_cast<std::int64_t>(scaled);
  if (raw < 0) {
    raw += std::int64_t{1} << totalBits;
  }
  return encodeUnsigned(static_cast<std::uint64_t>(raw), totalBits);
}

double decodeSignedFixed(const std::string& bits, const std::size_t fracBits) {
  checkWidths(bits.size(), fracBits);
  auto raw = static_cast<std::int64_t>(decodeUnsigned(bits));
  if (bits.front() == '1') {
    raw -= std::int64_t{1} << bits.size();
  }
  return static_cast<double>(raw) /
         std::ldexp(1.0, static_cast<int>(fracBits));
}

std::pair<double, double> fixedPointRange(const std::size_t totalBits,
                                          const std::size_t fracBits) {
  checkWidths(totalBits, fracBits);
  const auto scale = std::ldexp(1.0, static_cast<int>(fracBits));
  const auto [minInt, maxInt] = signedRange(totalBits);
  return {static_cast<double>(minInt) / scale,
          static_cast<double>(maxInt) / scale};
}
} // namespace qoracle
