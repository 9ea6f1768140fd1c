/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/synthesis/ReversibleCircuit.hpp"

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "ir/operations/Control.hpp"
#include "qoracle/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/synthesis/GateCost.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace qoracle::synthesis {
std::string toString(const GateKind kind) {
  switch (kind) {
  case GateKind::X:
    return "x";
  case GateKind::CX:
    return "cx";
  case GateKind::MCX:
    return "mcx";
  }
  return "Error";
}

GateKind gateKindFromString(const std::string& name) {
  if (name == "x") {
    return GateKind::X;
  }
  if (name == "cx") {
    return GateKind::CX;
  }
  if (name == "mcx") {
    return GateKind::MCX;
  }
  throw UnsupportedGateError("Unsupported gate type: " + name);
}

nlohmann::json ReversibleOp::json() const {
  nlohmann::json j;
  j["gate"] = toString(kind);
  j["controls"] = controls;
  std::vector<int> controlValues;
  controlValues.reserve(polarities.size());
  for (const bool polarity : polarities) {
    controlValues.emplace_back(polarity ? 1 : 0);
  }
  j["control_values"] = controlValues;
  j["target"] = target;
  return j;
}

ReversibleCircuit::ReversibleCircuit(const std::size_t nInputBits,
                                     const std::size_t nOutputBits)
    : nInputBits_(nInputBits), nOutputBits_(nOutputBits) {
  if (nInputBits_ > MAX_PACKED_BITS || nOutputBits_ > MAX_PACKED_BITS) {
    std::stringstream ss;
    ss << "Register widths (" << nInputBits_ << ", " << nOutputBits_
       << ") exceed the maximal packed width of " << MAX_PACKED_BITS
       << " bits.";
    throw RangeError(ss.str());
  }
}

void ReversibleCircuit::append(ReversibleOp op) {
  const auto n = nQubits();
  if (op.target >= n) {
    throw RangeError("Target wire " + std::to_string(op.target) +
                     " outside circuit with " + std::to_string(n) +
                     " qubits.");
  }
  if (op.controls.size() != op.polarities.size()) {
    throw RangeError("Operation has " + std::to_string(op.controls.size()) +
                     " controls but " + std::to_string(op.polarities.size()) +
                     " polarities.");
  }
  for (const auto control : op.controls) {
    if (control >= n || control == op.target) {
      throw RangeError("Control wire " + std::to_string(control) +
                       " is invalid for target " + std::to_string(op.target) +
                       " in circuit with " + std::to_string(n) + " qubits.");
    }
  }
  operations_.emplace_back(std::move(op));
}

GateCost ReversibleCircuit::estimateCost() const {
  GateCost total;
  for (const auto& op : operations_) {
    switch (op.kind) {
    case GateKind::X:
      total += GateCost{1, 0, 0, 0, 0, 0};
      break;
    case GateKind::CX:
      total += GateCost{0, 1, 0, 0, 0, 0};
      break;
    case GateKind::MCX: {
      const auto k = op.controls.size();
      const auto toffoli = estimateMcxToffoliCount(k);
      total += GateCost{0,
                        0,
                        toffoli,
                        7 * toffoli,
                        std::max<std::size_t>(1, 3 * toffoli),
                        k > 2 ? k - 2 : 0};
      break;
    }
    default:
      throw UnsupportedGateError(
          "Unsupported gate type in estimator: " +
          std::to_string(static_cast<unsigned>(op.kind)));
    }
  }
  return total;
}

std::uint64_t ReversibleCircuit::simulate(const std::uint64_t x) const {
  if (x >= (std::uint64_t{1} << nInputBits_)) {
    std::stringstream ss;
    ss << "x=" << x << " outside n_input_bits=" << nInputBits_ << ".";
    throw RangeError(ss.str());
  }
  std::vector<std::uint8_t> wires(nQubits(), 0U);
  for (std::size_t i = 0; i < nInputBits_; ++i) {
    wires[i] = static_cast<std::uint8_t>((x >> i) & 1U);
  }
  for (const auto& op : operations_) {
    bool fires = true;
    for (std::size_t i = 0; i < op.controls.size(); ++i) {
      if ((wires[op.controls[i]] == 1U) != op.polarities[i]) {
        fires = false;
        break;
      }
    }
    if (fires) {
      wires[op.target] ^= 1U;
    }
  }
  std::uint64_t y = 0;
  for (std::size_t i = 0; i < nOutputBits_; ++i) {
    y |= static_cast<std::uint64_t>(wires[outputOffset() + i]) << i;
  }
  return y;
}

qc::QuantumComputation ReversibleCircuit::toQuantumComputation() const {
  qc::QuantumComputation qc;
  if (nInputBits_ > 0) {
    qc.addQubitRegister(nInputBits_, "x");
  }
  if (nOutputBits_ > 0) {
    qc.addQubitRegister(nOutputBits_, "y");
  }
  for (const auto& op : operations_) {
    qc::Controls controls;
    for (std::size_t i = 0; i < op.controls.size(); ++i) {
      controls.insert(qc::Control{op.controls[i],
                                  op.polarities[i] ? qc::Control::Type::Pos
                                                   : qc::Control::Type::Neg});
    }
    switch (op.kind) {
    case GateKind::X:
      qc.x(op.target);
      break;
    case GateKind::CX:
      qc.cx(*controls.begin(), op.target);
      break;
    case GateKind::MCX:
      qc.mcx(controls, op.target);
      break;
    default:
      throw UnsupportedGateError(
          "Unsupported gate type in export: " +
          std::to_string(static_cast<unsigned>(op.kind)));
    }
  }
  return qc;
}

nlohmann::json ReversibleCircuit::json() const {
  nlohmann::json j;
  j["n_input_bits"] = nInputBits_;
  j["n_output_bits"] = nOutputBits_;
  j["n_qubits"] = nQubits();
  auto ops = nlohmann::json::array();
  for (const auto& op : operations_) {
    ops.emplace_back(op.json());
  }
  j["operations"] = ops;
  j["metadata"] = metadata_;
  return j;
}
} // namespace qoracle::synthesis
