/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/blockencoding/SparseMatrixBlockEncoding.hpp"

#include "qoracle/blockencoding/AccessOracle.hpp"
#include "qoracle/blockencoding/AmplitudeOracle.hpp"
#include "qoracle/blockencoding/BlockEncoding.hpp"
#include "qoracle/blockencoding/EntryOracle.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace qoracle::blockencoding {
namespace {
std::size_t indexParameter(const BlockEncodingQuery& request,
                           const std::string& key) {
  const auto it = request.parameters.find(key);
  if (it == request.parameters.end()) {
    throw std::invalid_argument("Query parameter '" + key +
                                "' is missing in request for step " +
                                std::to_string(request.step));
  }
  const auto value = it->second;
  // 2^digits is the first integral double that does not fit a size_t
  const auto limit =
      std::ldexp(1.0, std::numeric_limits<std::size_t>::digits);
  if (!std::isfinite(value) || value < 0. || value >= limit ||
      std::floor(value) != value) {
    throw std::invalid_argument("Query parameter '" + key +
                                "' must be a representable non-negative integer, got " +
                                std::to_string(value));
  }
  return static_cast<std::size_t>(value);
}
} // namespace

auto SparseOracleBundle::fromFunctions(
    const std::size_t nRows, const std::size_t nCols,
    const std::size_t maxRowNnz, const std::size_t maxColNnz,
    const IndexFunction& rowToCol, const IndexFunction& colToRow,
    const EntryFunction& entry, const std::size_t valueBits,
    const std::size_t fracBits, const double alpha) -> SparseOracleBundle {
  auto rowOracle =
      RowAccessOracle::fromFunction(nRows, nCols, maxRowNnz, rowToCol);
  auto colOracle =
      ColAccessOracle::fromFunction(nRows, nCols, maxColNnz, colToRow);
  auto entryOracle = EntryBinaryOracle::fromFunction(nRows, nCols, valueBits,
                                                     fracBits, entry);
  return {std::move(rowOracle), std::move(colOracle),
          FullDataLoadingAmplitudeOracle(std::move(entryOracle), alpha)};
}

SparseMatrixBlockEncoding::SparseMatrixBlockEncoding(SparseOracleBundle bundle,
                                                     const std::string& name)
    : bundle_(std::move(bundle)) {
  metadata_.name = name;
  metadata_.alpha = bundle_.amplitudeOracle.getAlpha();
  metadata_.ancillaQubits = 1;
  metadata_.logicalCostHint = {{"query_oracles", 3.}};
}

auto SparseMatrixBlockEncoding::query(const BlockEncodingQuery& request) const
    -> OperationRecord {
  const auto row = indexParameter(request, "row");
  const auto slot = indexParameter(request, "slot");
  const auto col = bundle_.rowOracle.lookup(row, slot);
  const auto amplitude = bundle_.amplitudeOracle.encode(row, col);

  OperationRecord record;
  record["op"] = "sparse_block_encoding_query";
  record["step"] = request.step;
  record["row"] = row;
  record["slot"] = slot;
  record["col"] = col;
  record["theta"] = amplitude.theta;
  record["phase"] = amplitude.phase;
  record["value"] = amplitude.value;
  record["normalized_abs"] = amplitude.normalizedAbs;
  return record;
}

auto SparseMatrixBlockEncoding::adjointQuery(
    const BlockEncodingQuery& request) const -> OperationRecord {
  auto record = query(request);
  record["op"] = "sparse_block_encoding_query_dagger";
  return record;
}
} // namespace qoracle::blockencoding
