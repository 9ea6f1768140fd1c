/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace qoracle {
/// Packed bit registers are stored in 64-bit words; the top bit is kept free.
constexpr std::size_t MAX_PACKED_BITS = 63;

/**
 * @brief Number of bits needed to address a domain of the given size.
 * @details Computes max(1, ceil(log2(size))), so every index in [0, size) is
 * representable.
 */
[[nodiscard]] std::size_t bitsForRange(std::size_t size);

/**
 * @brief Formats an unsigned value as a fixed-width binary string (MSB first).
 * @throws RangeError if the value does not fit into nBits bits
 */
[[nodiscard]] std::string encodeUnsigned(std::uint64_t value,
                                         std::size_t nBits);

/// Inverse of encodeUnsigned.
[[nodiscard]] std::uint64_t decodeUnsigned(const std::string& bits);
} // namespace qoracle
