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
#include "qoracle/blockencoding/AmplitudeOracle.hpp"
#include "qoracle/blockencoding/BlockEncoding.hpp"
#include "qoracle/blockencoding/EntryOracle.hpp"

#include <cstddef>
#include <string>

namespace qoracle::blockencoding {
/// Row, column and amplitude oracles of one sparse matrix.
struct SparseOracleBundle {
  RowAccessOracle rowOracle;
  ColAccessOracle colOracle;
  FullDataLoadingAmplitudeOracle amplitudeOracle;

  /// Build all three oracles eagerly from shared generating functions.
  [[nodiscard]] static auto
  fromFunctions(std::size_t nRows, std::size_t nCols, std::size_t maxRowNnz,
                std::size_t maxColNnz, const IndexFunction& rowToCol,
                const IndexFunction& colToRow, const EntryFunction& entry,
                std::size_t valueBits, std::size_t fracBits, double alpha)
      -> SparseOracleBundle;
};

/**
 * @brief Sparse block encoding with separate row, column and amplitude
 * oracles.
 * @details Queries return SDK-neutral operation records. The adjoint query
 * returns the same data under a different operation name; reversing the gate
 * order and inverting the rotations is left to the backend.
 */
class SparseMatrixBlockEncoding final : public BlockEncoding {
  SparseOracleBundle bundle_;
  BlockEncodingMetadata metadata_;

public:
  explicit SparseMatrixBlockEncoding(SparseOracleBundle bundle,
                                     const std::string& name =
                                         "sparse_full_load");

  [[nodiscard]] auto getBundle() const -> const SparseOracleBundle& {
    return bundle_;
  }

  [[nodiscard]] auto metadata() const -> const BlockEncodingMetadata& override {
    return metadata_;
  }

  /**
   * Resolve col = O_r(row, slot) and encode the entry (row, col). The request
   * must carry the integral parameters "row" and "slot".
   * @throws std::invalid_argument if a parameter is missing or not a
   * non-negative integer
   */
  [[nodiscard]] auto query(const BlockEncodingQuery& request) const
      -> OperationRecord override;

  [[nodiscard]] auto adjointQuery(const BlockEncodingQuery& request) const
      -> OperationRecord override;
};
} // namespace qoracle::blockencoding
