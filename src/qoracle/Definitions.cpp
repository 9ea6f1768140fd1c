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

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

namespace qoracle {
std::size_t bitsForRange(const std::size_t size) {
  if (size <= 1) {
    return 1;
  }
  std::size_t bits = 0;
  while (bits < 64 && (std::uint64_t{1} << bits) < size) {
    ++bits;
  }
  return bits;
}

std::string encodeUnsigned(const std::uint64_t value, const std::size_t nBits) {
  if (nBits == 0 || nBits > MAX_PACKED_BITS ||
      value >= (std::uint64_t{1} << nBits)) {
    std::stringstream ss;
    ss << "Value " << value << " cannot fit in " << nBits << " bits.";
    throw RangeError(ss.str());
  }
  std::string bits(nBits, '0');
  for (std::size_t i = 0; i < nBits; ++i) {
    if (((value >> i) & 1U) == 1U) {
      bits[nBits - 1 - i] = '1';
    }
  }
  return bits;
}

std::uint64_t decodeUnsigned(const std::string& bits) {
  if (bits.empty() || bits.size() > MAX_PACKED_BITS) {
    throw RangeError("Bit string of length " + std::to_string(bits.size()) +
                     " cannot be decoded into a packed integer.");
  }
  std::uint64_t value = 0;
  for (const char c : bits) {
    if (c != '0' && c != '1') {
      throw std::invalid_argument("Invalid character '" + std::string(1, c) +
                                  "' in bit string " + bits);
    }
    value = (value << 1U) | static_cast<std::uint64_t>(c == '1');
  }
  return value;
}
} // namespace qoracle
