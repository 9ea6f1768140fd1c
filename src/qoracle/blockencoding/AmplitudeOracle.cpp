/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qoracle/blockencoding/AmplitudeOracle.hpp"

#include "ir/Definitions.hpp"
#include "qoracle/Exceptions.hpp"
#include "qoracle/blockencoding/EntryOracle.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace qoracle::blockencoding {
FullDataLoadingAmplitudeOracle::FullDataLoadingAmplitudeOracle(
    EntryBinaryOracle entryOracle, const double alpha)
    : entryOracle_(std::move(entryOracle)), alpha_(alpha) {}

auto FullDataLoadingAmplitudeOracle::encode(const std::size_t row,
                                            const std::size_t col) const
    -> AmplitudeEncoding {
  if (!(alpha_ > 0.)) {
    throw ConfigurationError("alpha must be positive, got " +
                             std::to_string(alpha_) + ".");
  }
  AmplitudeEncoding encoding;
  encoding.value = entryOracle_.lookupValue(row, col);
  const auto ratio = std::abs(encoding.value) / alpha_;
  if (ratio > 1.) {
    SPDLOG_WARN("|A[{}, {}]| = {} exceeds alpha = {}; clamping to 1", row, col,
                std::abs(encoding.value), alpha_);
  }
  encoding.normalizedAbs = std::min(ratio, 1.);
  encoding.theta = 2. * std::asin(std::sqrt(encoding.normalizedAbs));
  encoding.phase = encoding.value >= 0. ? 0. : qc::PI;
  return encoding;
}
} // namespace qoracle::blockencoding
