/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/blockencoding/EntryOracle.hpp"

#include "qoracle/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/FixedPoint.hpp"
#include "qoracle/blockencoding/AccessOracle.hpp"

#include <cstddef>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace qoracle::blockencoding {
EntryBinaryOracle::EntryBinaryOracle(const std::size_t nRows,
                                     const std::size_t nCols,
                                     const std::size_t valueBits,
                                     const std::size_t fracBits,
                                     const EntryFunction& entry)
    : nRows_(nRows), nCols_(nCols), valueBits_(valueBits), fracBits_(fracBits) {
  table_.reserve(nRows_ * nCols_);
  for (std::size_t row = 0; row < nRows_; ++row) {
    for (std::size_t col = 0; col < nCols_; ++col) {
      table_.emplace_back(encodeSignedFixed(entry(row, col), valueBits_,
                                            fracBits_));
    }
  }
  SPDLOG_DEBUG("Loaded {}x{} entries with {} value bits ({} fractional)",
               nRows_, nCols_, valueBits_, fracBits_);
}

auto EntryBinaryOracle::fromFunction(const std::size_t nRows,
                                     const std::size_t nCols,
                                     const std::size_t valueBits,
                                     const std::size_t fracBits,
                                     const EntryFunction& entry)
    -> EntryBinaryOracle {
  return {nRows, nCols, valueBits, fracBits, entry};
}

auto EntryBinaryOracle::fromDense(const DenseMatrix& matrix,
                                  const std::size_t valueBits,
                                  const std::size_t fracBits)
    -> EntryBinaryOracle {
  if (matrix.empty() || matrix.front().empty()) {
    throw ShapeError("Matrix must be non-empty.");
  }
  const auto nCols = matrix.front().size();
  for (const auto& row : matrix) {
    if (row.size() != nCols) {
      std::stringstream ss;
      ss << "Matrix must be rectangular, found rows of length " << nCols
         << " and " << row.size() << ".";
      throw ShapeError(ss.str());
    }
  }
  return fromFunction(matrix.size(), nCols, valueBits, fracBits,
                      [&matrix](const std::size_t i, const std::size_t j) {
                        return matrix[i][j];
                      });
}

auto EntryBinaryOracle::lookupBits(const std::size_t row,
                                   const std::size_t col) const
    -> const std::string& {
  if (row >= nRows_ || col >= nCols_) {
    std::stringstream ss;
    ss << "Entry (" << row << ", " << col << ") outside " << nRows_ << "x"
       << nCols_ << " matrix.";
    throw RangeError(ss.str());
  }
  return table_[(row * nCols_) + col];
}

auto EntryBinaryOracle::lookupValue(const std::size_t row,
                                    const std::size_t col) const -> double {
  return decodeSignedFixed(lookupBits(row, col), fracBits_);
}

auto EntryBinaryOracle::compileTruthTable() const -> BitStringTable {
  const auto rowBits = bitsForRange(nRows_);
  const auto colBits = bitsForRange(nCols_);
  BitStringTable compiled;
  for (std::size_t row = 0; row < nRows_; ++row) {
    for (std::size_t col = 0; col < nCols_; ++col) {
      compiled.emplace(encodeUnsigned(row, rowBits) +
                           encodeUnsigned(col, colBits),
                       lookupBits(row, col));
    }
  }
  return compiled;
}
} // namespace qoracle::blockencoding
