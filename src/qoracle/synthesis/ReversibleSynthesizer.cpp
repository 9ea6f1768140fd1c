/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/synthesis/ReversibleSynthesizer.hpp"

#include "ir/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/synthesis/Configuration.hpp"
#include "qoracle/synthesis/FunctionForm.hpp"
#include "qoracle/synthesis/ReversibleCircuit.hpp"

#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace qoracle::synthesis {
namespace {
/**
 * Append `op` conjugated by X gates on the given input wires. Between the
 * flips, a positive control on one of the wires acts as a negative control on
 * the original value. The wires are flipped back in reverse order.
 */
void appendWithNegativeControls(ReversibleCircuit& circuit,
                                const std::vector<qc::Qubit>& zeroWires,
                                ReversibleOp op) {
  for (const auto wire : zeroWires) {
    circuit.append(ReversibleOp::x(wire));
  }
  circuit.append(std::move(op));
  for (auto it = zeroWires.crbegin(); it != zeroWires.crend(); ++it) {
    circuit.append(ReversibleOp::x(*it));
  }
}
} // namespace

ReversibleSynthesizer::ReversibleSynthesizer(const SynthConfig& config)
    : config_(config) {
  spdlog::set_level(config_.logLevel);
}

auto ReversibleSynthesizer::compile(const FunctionForm& form) const
    -> ReversibleCircuit {
  return compileFunctionForm(form, config_);
}

auto ReversibleSynthesizer::compileLookupTable(const LookupTableForm& form)
    -> ReversibleCircuit {
  form.validate();
  ReversibleCircuit circuit(form.nInputBits, form.nOutputBits);
  const auto nInputs = form.nInputBits;

  // every minterm is controlled on all input wires
  std::vector<qc::Qubit> controls;
  controls.reserve(nInputs);
  for (std::size_t i = 0; i < nInputs; ++i) {
    controls.emplace_back(static_cast<qc::Qubit>(i));
  }
  const std::vector<bool> polarities(nInputs, true);

  std::size_t nMinterms = 0;
  for (std::size_t outBit = 0; outBit < form.nOutputBits; ++outBit) {
    const auto target =
        static_cast<qc::Qubit>(circuit.outputOffset() + outBit);
    for (const auto& [x, y] : form.table) {
      if (((y >> outBit) & 1U) == 0U) {
        continue;
      }
      ++nMinterms;
      std::vector<qc::Qubit> zeroControlWires;
      for (std::size_t inBit = 0; inBit < nInputs; ++inBit) {
        if (((x >> inBit) & 1U) == 0U) {
          zeroControlWires.emplace_back(static_cast<qc::Qubit>(inBit));
        }
      }
      if (nInputs == 0) {
        circuit.append(ReversibleOp::x(target));
      } else if (nInputs == 1) {
        appendWithNegativeControls(
            circuit, zeroControlWires,
            ReversibleOp::cx(controls.front(), target));
      } else {
        appendWithNegativeControls(
            circuit, zeroControlWires,
            ReversibleOp::mcx(controls, polarities, target));
      }
    }
  }

  circuit.setMetadata("source", form.name);
  circuit.setMetadata("method", "sum_of_minterms");
  SPDLOG_DEBUG("Compiled '{}' as sum of {} minterms into {} operations",
               form.name, nMinterms, circuit.size());
  return circuit;
}

auto ReversibleSynthesizer::compileAffineXor(const AffineXorForm& form)
    -> ReversibleCircuit {
  form.validate();
  ReversibleCircuit circuit(form.nInputBits, form.nOutputBits);
  for (std::size_t outBit = 0; outBit < form.nOutputBits; ++outBit) {
    const auto target =
        static_cast<qc::Qubit>(circuit.outputOffset() + outBit);
    if (form.offsetBits[outBit] == 1U) {
      circuit.append(ReversibleOp::x(target));
    }
    for (std::size_t inBit = 0; inBit < form.nInputBits; ++inBit) {
      if (form.matrix[outBit][inBit] == 1U) {
        circuit.append(
            ReversibleOp::cx(static_cast<qc::Qubit>(inBit), target));
      }
    }
  }

  circuit.setMetadata("source", form.name);
  circuit.setMetadata("method", "affine_xor");
  SPDLOG_DEBUG("Compiled '{}' as affine network into {} operations", form.name,
               circuit.size());
  return circuit;
}

ReversibleCircuit compileFunctionForm(const FunctionForm& form,
                                      const SynthConfig& config) {
  if (form.valueless_by_exception()) {
    throw UnsupportedFormTypeError("Unsupported form type: empty form");
  }
  return std::visit(
      [&config](const auto& f) -> ReversibleCircuit {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, AffineXorForm>) {
          return ReversibleSynthesizer::compileAffineXor(f);
        } else if constexpr (std::is_same_v<T, LookupTableForm>) {
          return ReversibleSynthesizer::compileLookupTable(f);
        } else {
          return ReversibleSynthesizer::compileLookupTable(
              f.toLookupTable(config));
        }
      },
      form);
}
} // namespace qoracle::synthesis
