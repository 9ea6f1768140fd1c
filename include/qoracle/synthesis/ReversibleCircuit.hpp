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

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "qoracle/synthesis/GateCost.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace qoracle::synthesis {
enum class GateKind : std::uint8_t { X, CX, MCX };

[[nodiscard]] std::string toString(GateKind kind);
/// @throws UnsupportedGateError for names other than "x", "cx" and "mcx"
[[nodiscard]] GateKind gateKindFromString(const std::string& name);

/**
 * A single reversible gate. The polarity of a control records whether it
 * fires on 1 (true) or on 0 (false).
 */
struct ReversibleOp {
  GateKind kind = GateKind::X;
  std::vector<qc::Qubit> controls;
  std::vector<bool> polarities;
  qc::Qubit target = 0;

  [[nodiscard]] static ReversibleOp x(const qc::Qubit target) {
    return {GateKind::X, {}, {}, target};
  }
  [[nodiscard]] static ReversibleOp cx(const qc::Qubit control,
                                       const qc::Qubit target,
                                       const bool polarity = true) {
    return {GateKind::CX, {control}, {polarity}, target};
  }
  [[nodiscard]] static ReversibleOp mcx(std::vector<qc::Qubit> controls,
                                        std::vector<bool> polarities,
                                        const qc::Qubit target) {
    return {GateKind::MCX, std::move(controls), std::move(polarities), target};
  }

  [[nodiscard]] friend bool operator==(const ReversibleOp& lhs,
                                       const ReversibleOp& rhs) {
    return lhs.kind == rhs.kind && lhs.controls == rhs.controls &&
           lhs.polarities == rhs.polarities && lhs.target == rhs.target;
  }
  [[nodiscard]] friend bool operator!=(const ReversibleOp& lhs,
                                       const ReversibleOp& rhs) {
    return !(lhs == rhs);
  }

  [[nodiscard]] nlohmann::json json() const;
};

/**
 * @brief A reversible network implementing |x>|0> -> |x>|f(x)>.
 * @details The input register occupies wires [0, nInputBits), the output
 * register occupies [nInputBits, nInputBits + nOutputBits). Operations are
 * only ever appended.
 */
class ReversibleCircuit {
  std::size_t nInputBits_ = 0;
  std::size_t nOutputBits_ = 0;
  std::vector<ReversibleOp> operations_;
  std::map<std::string, std::string> metadata_;

public:
  ReversibleCircuit() = default;
  ReversibleCircuit(std::size_t nInputBits, std::size_t nOutputBits);

  /**
   * Append an operation at the end of the network.
   * @throws RangeError if a wire lies outside the circuit, or the control
   * and polarity lists differ in length
   */
  void append(ReversibleOp op);

  void setMetadata(const std::string& key, std::string value) {
    metadata_[key] = std::move(value);
  }

  [[nodiscard]] auto getNinputBits() const -> std::size_t {
    return nInputBits_;
  }
  [[nodiscard]] auto getNoutputBits() const -> std::size_t {
    return nOutputBits_;
  }
  [[nodiscard]] auto nQubits() const -> std::size_t {
    return nInputBits_ + nOutputBits_;
  }
  [[nodiscard]] auto outputOffset() const -> std::size_t {
    return nInputBits_;
  }
  [[nodiscard]] auto getOperations() const -> const std::vector<ReversibleOp>& {
    return operations_;
  }
  [[nodiscard]] auto getMetadata() const
      -> const std::map<std::string, std::string>& {
    return metadata_;
  }
  [[nodiscard]] auto size() const -> std::size_t { return operations_.size(); }
  [[nodiscard]] auto empty() const -> bool { return operations_.empty(); }
  [[nodiscard]] auto begin() const { return operations_.cbegin(); }
  [[nodiscard]] auto end() const { return operations_.cend(); }

  /**
   * Fold the operations from left to right into a logical cost summary.
   * @details X counts as one X gate and CX as one CNOT. An MCX with k
   * controls counts T(k) Toffolis, 7 T(k) T gates, max(1, 3 T(k)) T layers
   * and raises the ancilla peak to k - 2.
   * @throws UnsupportedGateError for any other gate kind
   */
  [[nodiscard]] GateCost estimateCost() const;

  /**
   * Evaluate the network classically on the basis state |x>|0>.
   * @return the packed content of the output register
   * @throws RangeError if x is outside [0, 2^nInputBits)
   */
  [[nodiscard]] std::uint64_t simulate(std::uint64_t x) const;

  /**
   * Lower the network to an MQT quantum computation with the quantum
   * registers "x" (inputs) and "y" (outputs).
   */
  [[nodiscard]] qc::QuantumComputation toQuantumComputation() const;

  [[nodiscard]] nlohmann::json json() const;

  friend std::ostream& operator<<(std::ostream& os,
                                  const ReversibleCircuit& circuit) {
    os << circuit.json().dump(2);
    return os;
  }
};
} // namespace qoracle::synthesis
