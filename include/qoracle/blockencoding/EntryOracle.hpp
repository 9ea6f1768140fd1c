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

#include "qoracle/blockencoding/AccessOracle.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace qoracle::blockencoding {
/// (row, col) -> matrix entry
using EntryFunction = std::function<double(std::size_t, std::size_t)>;
using DenseMatrix = std::vector<std::vector<double>>;

/**
 * @brief Entry oracle O_A: (row, col) -> fixed-point bit string of A[row, col].
 * @details All entries are encoded eagerly with valueBits total bits and
 * fracBits fractional bits.
 */
class EntryBinaryOracle {
  std::size_t nRows_ = 0;
  std::size_t nCols_ = 0;
  std::size_t valueBits_ = 0;
  std::size_t fracBits_ = 0;
  std::vector<std::string> table_;

  EntryBinaryOracle(std::size_t nRows, std::size_t nCols, std::size_t valueBits,
                    std::size_t fracBits, const EntryFunction& entry);

public:
  /// @throws OverflowError if an entry does not fit the fixed-point format
  [[nodiscard]] static auto fromFunction(std::size_t nRows, std::size_t nCols,
                                         std::size_t valueBits,
                                         std::size_t fracBits,
                                         const EntryFunction& entry)
      -> EntryBinaryOracle;

  /**
   * @throws ShapeError if the matrix is empty or not rectangular
   * @throws OverflowError if an entry does not fit the fixed-point format
   */
  [[nodiscard]] static auto fromDense(const DenseMatrix& matrix,
                                      std::size_t valueBits,
                                      std::size_t fracBits)
      -> EntryBinaryOracle;

  /// @throws RangeError if (row, col) lies outside the matrix
  [[nodiscard]] auto lookupBits(std::size_t row, std::size_t col) const
      -> const std::string&;
  [[nodiscard]] auto lookupValue(std::size_t row, std::size_t col) const
      -> double;

  /// Row bits followed by column bits, mapped to the stored value bits.
  [[nodiscard]] auto compileTruthTable() const -> BitStringTable;

  [[nodiscard]] auto getNrows() const -> std::size_t { return nRows_; }
  [[nodiscard]] auto getNcols() const -> std::size_t { return nCols_; }
  [[nodiscard]] auto getValueBits() const -> std::size_t { return valueBits_; }
  [[nodiscard]] auto getFracBits() const -> std::size_t { return fracBits_; }
};
} // namespace qoracle::blockencoding
