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
#include "qoracle/synthesis/ReversibleCircuit.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace qoracle::blockencoding {
/// (index, slot) -> target index
using IndexFunction = std::function<std::size_t(std::size_t, std::size_t)>;
/// Fixed-width bit string key -> fixed-width bit string value
using BitStringTable = std::map<std::string, std::string>;

/**
 * @brief Shared storage of the sparse access oracles.
 * @details The oracle maps every pair (index, slot) with index in
 * [0, nIndices) and slot in [0, maxNnz) to a target index in [0, nTargets).
 * The complete table is materialized on construction and never changes
 * afterwards.
 */
class AccessOracle {
protected:
  std::size_t nIndices_ = 0;
  std::size_t nTargets_ = 0;
  std::size_t maxNnz_ = 0;
  /// Row-major over (index, slot)
  std::vector<std::size_t> table_;
  std::string name_;

  /**
   * @throws RangeError as soon as fn produces a target outside
   * [0, nTargets)
   */
  AccessOracle(std::size_t nIndices, std::size_t nTargets, std::size_t maxNnz,
               const IndexFunction& fn, std::string name);

public:
  /// @throws RangeError if (index, slot) lies outside the declared domain
  [[nodiscard]] auto lookup(std::size_t index, std::size_t slot) const
      -> std::size_t;

  /**
   * Re-keys all entries as bit strings: index bits followed by slot bits,
   * mapped to the target bits.
   */
  [[nodiscard]] auto compileTruthTable() const -> BitStringTable;

  /**
   * Synthesizes the oracle on the packed input (index << slotBits) | slot.
   * Packed inputs outside the declared domain map to 0.
   */
  [[nodiscard]] auto
  compileReversibleCircuit(const synthesis::SynthConfig& config = {}) const
      -> synthesis::ReversibleCircuit;

  /// Number of stored entries
  [[nodiscard]] auto size() const -> std::size_t { return table_.size(); }
  [[nodiscard]] auto getName() const -> const std::string& { return name_; }
};

/// Row-access oracle O_r: (row, slot) -> column of the slot-th entry in row.
class RowAccessOracle : public AccessOracle {
  RowAccessOracle(std::size_t nRows, std::size_t nCols, std::size_t maxRowNnz,
                  const IndexFunction& rowToCol);

public:
  [[nodiscard]] static auto fromFunction(std::size_t nRows, std::size_t nCols,
                                         std::size_t maxRowNnz,
                                         const IndexFunction& rowToCol)
      -> RowAccessOracle;

  [[nodiscard]] auto getNrows() const -> std::size_t { return nIndices_; }
  [[nodiscard]] auto getNcols() const -> std::size_t { return nTargets_; }
  [[nodiscard]] auto getMaxRowNnz() const -> std::size_t { return maxNnz_; }
};

/// Column-access oracle O_c: (col, slot) -> row of the slot-th entry in col.
class ColAccessOracle : public AccessOracle {
  ColAccessOracle(std::size_t nRows, std::size_t nCols, std::size_t maxColNnz,
                  const IndexFunction& colToRow);

public:
  [[nodiscard]] static auto fromFunction(std::size_t nRows, std::size_t nCols,
                                         std::size_t maxColNnz,
                                         const IndexFunction& colToRow)
      -> ColAccessOracle;

  [[nodiscard]] auto getNrows() const -> std::size_t { return nTargets_; }
  [[nodiscard]] auto getNcols() const -> std::size_t { return nIndices_; }
  [[nodiscard]] auto getMaxColNnz() const -> std::size_t { return maxNnz_; }
};
} // namespace qoracle::blockencoding
