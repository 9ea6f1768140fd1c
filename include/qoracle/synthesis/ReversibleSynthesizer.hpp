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
#include "qoracle/synthesis/FunctionForm.hpp"
#include "qoracle/synthesis/ReversibleCircuit.hpp"

namespace qoracle::synthesis {
/**
 * @brief Baseline synthesis of classical functions into reversible networks.
 * @details Affine forms are compiled into CNOT/X networks. Lookup tables, and
 * every other form after lowering to a lookup table, are compiled as a sum of
 * minterms: one fully controlled X per minterm and output bit, with negative
 * controls realized by X conjugation of the respective input wires.
 */
class ReversibleSynthesizer {
  SynthConfig config_;

public:
  ReversibleSynthesizer() : ReversibleSynthesizer(SynthConfig{}) {}
  /// Create a synthesizer and apply the configured log level.
  explicit ReversibleSynthesizer(const SynthConfig& config);

  [[nodiscard]] auto getConfig() const -> const SynthConfig& {
    return config_;
  }

  /**
   * Dispatch on the kind of the form and compile it.
   * @throws UnsupportedFormTypeError if the form holds no alternative
   */
  [[nodiscard]] auto compile(const FunctionForm& form) const
      -> ReversibleCircuit;

  /// @throws MalformedTableError if the table does not validate
  [[nodiscard]] static auto compileLookupTable(const LookupTableForm& form)
      -> ReversibleCircuit;

  [[nodiscard]] static auto compileAffineXor(const AffineXorForm& form)
      -> ReversibleCircuit;
};

/**
 * Compile a function form under the given configuration. Unlike constructing a
 * ReversibleSynthesizer, this leaves the global log level untouched.
 * @throws UnsupportedFormTypeError if the form holds no alternative
 */
[[nodiscard]] ReversibleCircuit
compileFunctionForm(const FunctionForm& form, const SynthConfig& config = {});
} // namespace qoracle::synthesis
