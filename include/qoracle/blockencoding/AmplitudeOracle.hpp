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

#include "qoracle/blockencoding/EntryOracle.hpp"

#include <cstddef>

namespace qoracle::blockencoding {
/// Rotation and phase data derived from a single matrix entry.
struct AmplitudeEncoding {
  double value = 0.;
  /// min(|value| / alpha, 1)
  double normalizedAbs = 0.;
  /// 2 asin(sqrt(normalizedAbs)), in [0, pi]
  double theta = 0.;
  /// 0 for non-negative values, pi otherwise
  double phase = 0.;
};

/**
 * @brief Amplitude oracle built from binary entry loading.
 * @details This is the full data-loading variant: all entries are loaded
 * classically as fixed-point bit strings and then mapped to rotation and
 * phase data, normalized by alpha.
 */
class FullDataLoadingAmplitudeOracle {
  EntryBinaryOracle entryOracle_;
  double alpha_;

public:
  FullDataLoadingAmplitudeOracle(EntryBinaryOracle entryOracle, double alpha);

  /// @throws ConfigurationError if alpha is not positive
  [[nodiscard]] auto encode(std::size_t row, std::size_t col) const
      -> AmplitudeEncoding;

  [[nodiscard]] auto getEntryOracle() const -> const EntryBinaryOracle& {
    return entryOracle_;
  }
  [[nodiscard]] auto getAlpha() const -> double { return alpha_; }
};
} // namespace qoracle::blockencoding
