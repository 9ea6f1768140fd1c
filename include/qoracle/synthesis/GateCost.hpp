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

#include <algorithm>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <ostream>

namespace qoracle::synthesis {
/**
 * Number of Toffoli gates in the ladder decomposition of an X gate with the
 * given number of controls (using nControls - 2 borrowed ancillas).
 */
[[nodiscard]] constexpr std::size_t
estimateMcxToffoliCount(const std::size_t nControls) {
  if (nControls <= 1) {
    return 0;
  }
  if (nControls == 2) {
    return 1;
  }
  return (2 * nControls) - 3;
}

/**
 * Logical resource summary of a reversible circuit.
 * @details All counters add up when costs are combined, except
 * ancillaPeakEstimate, which is a high-water mark and takes the maximum.
 */
struct GateCost {
  std::size_t xCount = 0;
  std::size_t cnotCount = 0;
  std::size_t toffoliCount = 0;
  std::size_t tCount = 0;
  std::size_t tDepthEstimate = 0;
  std::size_t ancillaPeakEstimate = 0;

  GateCost& operator+=(const GateCost& other) {
    xCount += other.xCount;
    cnotCount += other.cnotCount;
    toffoliCount += other.toffoliCount;
    tCount += other.tCount;
    tDepthEstimate += other.tDepthEstimate;
    ancillaPeakEstimate =
        std::max(ancillaPeakEstimate, other.ancillaPeakEstimate);
    return *this;
  }

  [[nodiscard]] friend GateCost operator+(GateCost lhs, const GateCost& rhs) {
    lhs += rhs;
    return lhs;
  }

  [[nodiscard]] friend bool operator==(const GateCost& lhs,
                                       const GateCost& rhs) {
    return lhs.xCount == rhs.xCount && lhs.cnotCount == rhs.cnotCount &&
           lhs.toffoliCount == rhs.toffoliCount && lhs.tCount == rhs.tCount &&
           lhs.tDepthEstimate == rhs.tDepthEstimate &&
           lhs.ancillaPeakEstimate == rhs.ancillaPeakEstimate;
  }
  [[nodiscard]] friend bool operator!=(const GateCost& lhs,
                                       const GateCost& rhs) {
    return !(lhs == rhs);
  }

  [[nodiscard]] nlohmann::json json() const {
    nlohmann::json j;
    j["x_count"] = xCount;
    j["cnot_count"] = cnotCount;
    j["toffoli_count"] = toffoliCount;
    j["t_count"] = tCount;
    j["t_depth_estimate"] = tDepthEstimate;
    j["ancilla_peak_estimate"] = ancillaPeakEstimate;
    return j;
  }

  friend std::ostream& operator<<(std::ostream& os, const GateCost& cost) {
    os << cost.json().dump(2);
    return os;
  }
};
} // namespace qoracle::synthesis
