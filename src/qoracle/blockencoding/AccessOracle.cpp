/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/blockencoding/AccessOracle.hpp"

#include "qoracle/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/synthesis/Configuration.hpp"
#include "qoracle/synthesis/FunctionForm.hpp"
#include "qoracle/synthesis/ReversibleCircuit.hpp"
#include "qoracle/synthesis/ReversibleSynthesizer.hpp"

#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <utility>

namespace qoracle::blockencoding {
AccessOracle::AccessOracle(const std::size_t nIndices,
                           const std::size_t nTargets,
                           const std::size_t maxNnz, const IndexFunction& fn,
                           std::string name)
    : nIndices_(nIndices), nTargets_(nTargets), maxNnz_(maxNnz),
      name_(std::move(name)) {
  table_.reserve(nIndices_ * maxNnz_);
  for (std::size_t index = 0; index < nIndices_; ++index) {
    for (std::size_t slot = 0; slot < maxNnz_; ++slot) {
      const auto target = fn(index, slot);
      if (target >= nTargets_) {
        std::stringstream ss;
        ss << name_ << " produced invalid index " << target << " for ("
           << index << ", " << slot << "), expected a value below "
           << nTargets_ << ".";
        throw RangeError(ss.str());
      }
      table_.emplace_back(target);
    }
  }
  SPDLOG_DEBUG("Materialized {} with {} entries", name_, table_.size());
}

auto AccessOracle::lookup(const std::size_t index, const std::size_t slot) const
    -> std::size_t {
  if (index >= nIndices_ || slot >= maxNnz_) {
    std::stringstream ss;
    ss << "(" << index << ", " << slot << ") outside the domain of " << name_
       << " [0, " << nIndices_ << ") x [0, " << maxNnz_ << ").";
    throw RangeError(ss.str());
  }
  return table_[(index * maxNnz_) + slot];
}

auto AccessOracle::compileTruthTable() const -> BitStringTable {
  const auto indexBits = bitsForRange(nIndices_);
  const auto slotBits = bitsForRange(maxNnz_);
  const auto targetBits = bitsForRange(nTargets_);
  BitStringTable compiled;
  for (std::size_t index = 0; index < nIndices_; ++index) {
    for (std::size_t slot = 0; slot < maxNnz_; ++slot) {
      compiled.emplace(encodeUnsigned(index, indexBits) +
                           encodeUnsigned(slot, slotBits),
                       encodeUnsigned(lookup(index, slot), targetBits));
    }
  }
  return compiled;
}

auto AccessOracle::compileReversibleCircuit(
    const synthesis::SynthConfig& config) const
    -> synthesis::ReversibleCircuit {
  const auto indexBits = bitsForRange(nIndices_);
  const auto slotBits = bitsForRange(maxNnz_);
  const auto slotMask = (std::uint64_t{1} << slotBits) - 1;

  synthesis::CompilableFunctionForm form;
  form.nInputBits = indexBits + slotBits;
  form.nOutputBits = bitsForRange(nTargets_);
  form.name = name_;
  form.fn = [this, slotBits, slotMask](const std::uint64_t x) -> std::uint64_t {
    const auto slot = static_cast<std::size_t>(x & slotMask);
    const auto index = static_cast<std::size_t>(x >> slotBits);
    if (index >= nIndices_ || slot >= maxNnz_) {
      return 0;
    }
    return lookup(index, slot);
  };
  return synthesis::compileFunctionForm(form, config);
}

RowAccessOracle::RowAccessOracle(const std::size_t nRows,
                                 const std::size_t nCols,
                                 const std::size_t maxRowNnz,
                                 const IndexFunction& rowToCol)
    : AccessOracle(nRows, nCols, maxRowNnz, rowToCol, "row_access_oracle") {}

auto RowAccessOracle::fromFunction(const std::size_t nRows,
                                   const std::size_t nCols,
                                   const std::size_t maxRowNnz,
                                   const IndexFunction& rowToCol)
    -> RowAccessOracle {
  return {nRows, nCols, maxRowNnz, rowToCol};
}

ColAccessOracle::ColAccessOracle(const std::size_t nRows,
                                 const std::size_t nCols,
                                 const std::size_t maxColNnz,
                                 const IndexFunction& colToRow)
    : AccessOracle(nCols, nRows, maxColNnz, colToRow, "col_access_oracle") {}

auto ColAccessOracle::fromFunction(const std::size_t nRows,
                                   const std::size_t nCols,
                                   const std::size_t maxColNnz,
                                   const IndexFunction& colToRow)
    -> ColAccessOracle {
  return {nRows, nCols, maxColNnz, colToRow};
}
} // namespace qoracle::blockencoding
