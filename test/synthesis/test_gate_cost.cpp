/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "ir/QuantumComputation.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/synthesis/GateCost.hpp"
#include "qoracle/synthesis/ReversibleCircuit.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <tuple>

namespace qoracle::synthesis {
TEST(GateCost, McxToffoliCount) {
  EXPECT_EQ(estimateMcxToffoliCount(0), 0U);
  EXPECT_EQ(estimateMcxToffoliCount(1), 0U);
  EXPECT_EQ(estimateMcxToffoliCount(2), 1U);
  EXPECT_EQ(estimateMcxToffoliCount(3), 3U);
  EXPECT_EQ(estimateMcxToffoliCount(5), 7U);
}

TEST(GateCost, CombineSumsCountersAndKeepsAncillaPeak) {
  const GateCost lhs{1, 2, 3, 21, 9, 4};
  const GateCost rhs{2, 1, 1, 7, 3, 1};
  const auto sum = lhs + rhs;
  EXPECT_EQ(sum, (GateCost{3, 3, 4, 28, 12, 4}));
  EXPECT_EQ(rhs + lhs, sum);
}

TEST(GateCost, JSON) {
  const GateCost cost{1, 2, 3, 21, 9, 1};
  const auto j = cost.json();
  EXPECT_EQ(j.at("x_count"), 1);
  EXPECT_EQ(j.at("cnot_count"), 2);
  EXPECT_EQ(j.at("toffoli_count"), 3);
  EXPECT_EQ(j.at("t_count"), 21);
  EXPECT_EQ(j.at("t_depth_estimate"), 9);
  EXPECT_EQ(j.at("ancilla_peak_estimate"), 1);
  std::stringstream ss;
  ss << cost;
  EXPECT_EQ(nlohmann::json::parse(ss.str()), j);
}

class ReversibleCircuitTest : public ::testing::Test {
protected:
  // 4 inputs, 1 output
  ReversibleCircuit circuit{4, 1};
};

TEST_F(ReversibleCircuitTest, EmptyCircuitHasNoCost) {
  EXPECT_TRUE(circuit.empty());
  EXPECT_EQ(circuit.estimateCost(), GateCost{});
}

TEST_F(ReversibleCircuitTest, AncillaPeakIsRunningMaximum) {
  circuit.append(ReversibleOp::mcx({0, 1, 2, 3}, {true, true, true, true}, 4));
  circuit.append(ReversibleOp::mcx({0, 1, 2}, {true, true, true}, 4));
  const auto cost = circuit.estimateCost();
  EXPECT_EQ(cost.toffoliCount, 5U + 3U);
  EXPECT_EQ(cost.tCount, 7U * 8U);
  EXPECT_EQ(cost.tDepthEstimate, 15U + 9U);
  EXPECT_EQ(cost.ancillaPeakEstimate, 2U);
}

TEST_F(ReversibleCircuitTest, SingleControlMcxHasUnitDepth) {
  circuit.append(ReversibleOp::mcx({0}, {true}, 4));
  const auto cost = circuit.estimateCost();
  EXPECT_EQ(cost.toffoliCount, 0U);
  EXPECT_EQ(cost.tCount, 0U);
  EXPECT_EQ(cost.tDepthEstimate, 1U);
  EXPECT_EQ(cost.ancillaPeakEstimate, 0U);
}

TEST_F(ReversibleCircuitTest, XAndCnotCounts) {
  circuit.append(ReversibleOp::x(0));
  circuit.append(ReversibleOp::cx(0, 4));
  circuit.append(ReversibleOp::cx(1, 4, false));
  circuit.append(ReversibleOp::x(0));
  EXPECT_EQ(circuit.estimateCost(), (GateCost{2, 2, 0, 0, 0, 0}));
}

TEST_F(ReversibleCircuitTest, UnsupportedGate) {
  auto op = ReversibleOp::x(0);
  op.kind = static_cast<GateKind>(7);
  circuit.append(op);
  EXPECT_THROW(std::ignore = circuit.estimateCost(), UnsupportedGateError);
}

TEST_F(ReversibleCircuitTest, GateKindNames) {
  EXPECT_EQ(toString(GateKind::X), "x");
  EXPECT_EQ(toString(GateKind::CX), "cx");
  EXPECT_EQ(toString(GateKind::MCX), "mcx");
  EXPECT_EQ(gateKindFromString("mcx"), GateKind::MCX);
  EXPECT_THROW(std::ignore = gateKindFromString("ccz"), UnsupportedGateError);
}

TEST_F(ReversibleCircuitTest, AppendRejectsInvalidWires) {
  EXPECT_THROW(circuit.append(ReversibleOp::x(5)), RangeError);
  EXPECT_THROW(circuit.append(ReversibleOp::cx(7, 4)), RangeError);
  EXPECT_THROW(circuit.append(ReversibleOp::cx(4, 4)), RangeError);
  EXPECT_THROW(circuit.append(ReversibleOp::mcx({0, 1}, {true}, 4)),
               RangeError);
  EXPECT_TRUE(circuit.empty());
}

TEST_F(ReversibleCircuitTest, SimulateHonorsPolarity) {
  // y = x_0 AND NOT x_1
  circuit.append(ReversibleOp::mcx({0, 1}, {true, false}, 4));
  EXPECT_EQ(circuit.simulate(0b0001), 1U);
  EXPECT_EQ(circuit.simulate(0b0011), 0U);
  EXPECT_EQ(circuit.simulate(0b0000), 0U);
  EXPECT_THROW(std::ignore = circuit.simulate(16), RangeError);
}

TEST_F(ReversibleCircuitTest, JSON) {
  circuit.append(ReversibleOp::mcx({0, 1}, {true, false}, 4));
  circuit.setMetadata("method", "sum_of_minterms");
  const auto j = circuit.json();
  EXPECT_EQ(j.at("n_input_bits"), 4);
  EXPECT_EQ(j.at("n_output_bits"), 1);
  EXPECT_EQ(j.at("n_qubits"), 5);
  ASSERT_EQ(j.at("operations").size(), 1U);
  const auto& op = j.at("operations").front();
  EXPECT_EQ(op.at("gate"), "mcx");
  EXPECT_EQ(op.at("controls"), nlohmann::json({0, 1}));
  EXPECT_EQ(op.at("control_values"), nlohmann::json({1, 0}));
  EXPECT_EQ(op.at("target"), 4);
  EXPECT_EQ(j.at("metadata").at("method"), "sum_of_minterms");
}

TEST_F(ReversibleCircuitTest, ToQuantumComputation) {
  circuit.append(ReversibleOp::x(0));
  circuit.append(ReversibleOp::cx(0, 4));
  circuit.append(ReversibleOp::mcx({0, 1, 2}, {true, false, true}, 4));
  const auto qc = circuit.toQuantumComputation();
  EXPECT_EQ(qc.getNqubits(), 5U);
  EXPECT_EQ(qc.getNops(), 3U);
  EXPECT_EQ(qc.at(2)->getNcontrols(), 3U);
}
} // namespace qoracle::synthesis
