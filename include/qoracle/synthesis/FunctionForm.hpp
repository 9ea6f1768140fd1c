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

#include "qoracle/synthesis/Configuration.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace qoracle::synthesis {
/// Packed input integer -> packed output integer
using TruthTable = std::map<std::uint64_t, std::uint64_t>;
using BitVector = std::vector<std::uint8_t>;
/// Row-major matrix over GF(2), one row per output bit
using BitMatrix = std::vector<BitVector>;

/**
 * An explicit truth table mapping x -> f(x) as packed integers.
 * Bit i of a packed integer corresponds to wire i of the respective register.
 */
struct LookupTableForm {
  std::size_t nInputBits = 0;
  std::size_t nOutputBits = 0;
  TruthTable table;
  std::string name = "lut";

  /**
   * @throws MalformedTableError if the table does not have exactly
   * 2^nInputBits entries or contains keys or values out of range
   */
  void validate() const;
};

/// A bit-affine map y = A x xor b over GF(2).
struct AffineXorForm {
  std::size_t nInputBits = 0;
  std::size_t nOutputBits = 0;
  BitMatrix matrix;
  BitVector offsetBits;
  std::string name = "affine_xor";

  /**
   * @throws ShapeError if the matrix or offset dimensions do not match the
   * declared widths
   * @throws MalformedTableError if an entry is not 0 or 1
   */
  void validate() const;

  /**
   * Each output bit is the offset bit xor the parity of the input bits
   * selected by the corresponding matrix row.
   * @throws RangeError if x is outside [0, 2^nInputBits)
   */
  [[nodiscard]] std::uint64_t evaluate(std::uint64_t x) const;

  /// Exhaustively evaluates the map into a truth table.
  [[nodiscard]] LookupTableForm toLookupTable() const;
};

/// A callable that is only materialized when lowered to a truth table.
struct CompilableFunctionForm {
  std::size_t nInputBits = 0;
  std::size_t nOutputBits = 0;
  std::function<std::uint64_t(std::uint64_t)> fn;
  std::string name = "callable_fn";

  /**
   * Enumerates fn over the whole input domain.
   * @throws ConfigurationError if enumeration is disabled or nInputBits
   * exceeds config.maxTruthTableInputBits
   * @throws RangeError if fn produces a value outside [0, 2^nOutputBits)
   */
  [[nodiscard]] LookupTableForm toLookupTable(const SynthConfig& config) const;
};

/// The closed set of function specifications understood by the synthesizer.
using FunctionForm =
    std::variant<LookupTableForm, AffineXorForm, CompilableFunctionForm>;
} // namespace qoracle::synthesis
