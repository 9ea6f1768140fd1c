/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/synthesis/FunctionForm.hpp"

#include "qoracle/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/synthesis/Configuration.hpp"

#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace qoracle::synthesis {
namespace {
template <class ErrorType>
void checkPackedWidth(const std::size_t nBits, const std::string& what) {
  if (nBits > MAX_PACKED_BITS) {
    std::stringstream ss;
    ss << what << "=" << nBits << " exceeds the maximal packed width of "
       << MAX_PACKED_BITS << " bits.";
    throw ErrorType(ss.str());
  }
}

/// y = A x xor b for an already validated form and an in-range x
std::uint64_t applyAffine(const AffineXorForm& form, const std::uint64_t x) {
  std::uint64_t out = 0;
  for (std::size_t outBit = 0; outBit < form.nOutputBits; ++outBit) {
    auto bit = static_cast<std::uint64_t>(form.offsetBits[outBit]);
    for (std::size_t inBit = 0; inBit < form.nInputBits; ++inBit) {
      if (form.matrix[outBit][inBit] == 1U) {
        bit ^= (x >> inBit) & 1U;
      }
    }
    out |= bit << outBit;
  }
  return out;
}
} // namespace

void LookupTableForm::validate() const {
  checkPackedWidth<MalformedTableError>(nInputBits, "n_input_bits");
  checkPackedWidth<MalformedTableError>(nOutputBits, "n_output_bits");
  const auto nEntries = std::uint64_t{1} << nInputBits;
  if (table.size() != nEntries) {
    std::stringstream ss;
    ss << "LookupTableForm '" << name << "' requires full table of size "
       << nEntries << ", got " << table.size() << ".";
    throw MalformedTableError(ss.str());
  }
  const auto maxOut = std::uint64_t{1} << nOutputBits;
  for (const auto& [in, out] : table) {
    if (in >= nEntries) {
      std::stringstream ss;
      ss << "Input key " << in << " outside n_input_bits=" << nInputBits
         << ".";
      throw MalformedTableError(ss.str());
    }
    if (out >= maxOut) {
      std::stringstream ss;
      ss << "Output value " << out << " outside n_output_bits=" << nOutputBits
         << ".";
      throw MalformedTableError(ss.str());
    }
  }
}

void AffineXorForm::validate() const {
  checkPackedWidth<ShapeError>(nInputBits, "n_input_bits");
  checkPackedWidth<ShapeError>(nOutputBits, "n_output_bits");
  if (matrix.size() != nOutputBits) {
    throw ShapeError("Matrix row count " + std::to_string(matrix.size()) +
                     " must match n_output_bits=" +
                     std::to_string(nOutputBits) + ".");
  }
  if (offsetBits.size() != nOutputBits) {
    throw ShapeError("offset_bits length " + std::to_string(offsetBits.size()) +
                     " must match n_output_bits=" +
                     std::to_string(nOutputBits) + ".");
  }
  for (const auto& row : matrix) {
    if (row.size() != nInputBits) {
      throw ShapeError("Matrix row length " + std::to_string(row.size()) +
                       " must match n_input_bits=" +
                       std::to_string(nInputBits) + ".");
    }
    for (const auto bit : row) {
      if (bit > 1U) {
        throw MalformedTableError("Affine matrix entries must be 0/1.");
      }
    }
  }
  for (const auto bit : offsetBits) {
    if (bit > 1U) {
      throw MalformedTableError("offset_bits entries must be 0/1.");
    }
  }
}

std::uint64_t AffineXorForm::evaluate(const std::uint64_t x) const {
  validate();
  if (x >= (std::uint64_t{1} << nInputBits)) {
    std::stringstream ss;
    ss << "x=" << x << " outside n_input_bits=" << nInputBits << ".";
    throw RangeError(ss.str());
  }
  return applyAffine(*this, x);
}

LookupTableForm AffineXorForm::toLookupTable() const {
  validate();
  LookupTableForm lut{nInputBits, nOutputBits, {}, name + "_as_lut"};
  const auto nEntries = std::uint64_t{1} << nInputBits;
  for (std::uint64_t x = 0; x < nEntries; ++x) {
    lut.table.emplace_hint(lut.table.cend(), x, applyAffine(*this, x));
  }
  return lut;
}

LookupTableForm
CompilableFunctionForm::toLookupTable(const SynthConfig& config) const {
  if (!config.allowCallableEnumeration) {
    throw ConfigurationError("Callable enumeration disabled in SynthConfig.");
  }
  if (nInputBits > config.maxTruthTableInputBits) {
    std::stringstream ss;
    ss << "n_input_bits=" << nInputBits << " exceeds configured maximum "
       << config.maxTruthTableInputBits << ".";
    throw ConfigurationError(ss.str());
  }
  checkPackedWidth<ConfigurationError>(nInputBits, "n_input_bits");
  checkPackedWidth<RangeError>(nOutputBits, "n_output_bits");
  if (!fn) {
    throw ConfigurationError("CompilableFunctionForm '" + name +
                             "' has no callable.");
  }

  const auto nEntries = std::uint64_t{1} << nInputBits;
  const auto maxOut = std::uint64_t{1} << nOutputBits;
  SPDLOG_DEBUG("Enumerating '{}' over {} inputs", name, nEntries);
  LookupTableForm lut{nInputBits, nOutputBits, {}, name + "_enumerated"};
  for (std::uint64_t x = 0; x < nEntries; ++x) {
    const auto y = fn(x);
    if (y >= maxOut) {
      std::stringstream ss;
      ss << "Callable '" << name << "' produced y=" << y << " for x=" << x
         << ", outside n_output_bits=" << nOutputBits << ".";
      throw RangeError(ss.str());
    }
    lut.table.emplace_hint(lut.table.cend(), x, y);
  }
  return lut;
}
} // namespace qoracle::synthesis
