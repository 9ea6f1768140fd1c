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
#include <string>
#include <utility>

namespace qoracle {
/**
 * @brief Encodes a real value as a signed two's-complement fixed-point bit
 * string.
 * @details The value is scaled by 2^fracBits and rounded to the nearest
 * integer. Negative values are stored in two's complement. The result has
 * exactly totalBits characters, most significant bit first.
 * @param value is the real value to encode
 * @param totalBits is the width of the encoding including the sign bit
 * @param fracBits is the number of fractional bits
 * @return the encoded bit string
 * @throws OverflowError if the scaled value is outside
 * [-2^(totalBits-1), 2^(totalBits-1)-1]
 * @throws ConfigurationError if the widths cannot be represented
 */
[[nodiscard]] std::string encodeSignedFixed(double value,
                                            std::size_t totalBits,
                                            std::size_t fracBits);

/**
 * @brief Decodes a two's-complement fixed-point bit string.
 * @param bits is the bit string, most significant bit first
 * @param fracBits is the number of fractional bits
 * @return the represented real value
 */
[[nodiscard]] double decodeSignedFixed(const std::string& bits,
                                       std::size_t fracBits);

/// The smallest and largest real values representable with the given widths.
[[nodiscard]] std::pair<double, double> fixedPointRange(std::size_t totalBits,
                                                        std::size_t fracBits);
} // namespace qoracle
