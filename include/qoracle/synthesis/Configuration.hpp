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

#include <cstddef>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/common.h>
#include <string>

namespace qoracle::synthesis {
/// Settings that govern how function forms are lowered to reversible circuits.
struct SynthConfig {
  /**
   * Upper bound on the input width of a callable that may be enumerated into
   * a truth table. The table has 2^n entries, so this bounds memory use.
   */
  std::size_t maxTruthTableInputBits = 12;
  /// Whether callables may be enumerated at all
  bool allowCallableEnumeration = true;
  /// Log level applied when a synthesizer is created
  spdlog::level::level_enum logLevel = spdlog::level::info;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SynthConfig,
                                              maxTruthTableInputBits,
                                              allowCallableEnumeration,
                                              logLevel);

  /**
   * Parse a configuration from a JSON document. Keys that are not present
   * keep their default values.
   * @throws nlohmann::json::exception if the document is malformed
   */
  [[nodiscard]] static auto fromJSONString(const std::string& str)
      -> SynthConfig {
    return nlohmann::json::parse(str).get<SynthConfig>();
  }

  [[nodiscard]] auto json() const -> nlohmann::json { return *this; }

  friend std::ostream& operator<<(std::ostream& os, const SynthConfig& config) {
    os << config.json().dump(2);
    return os;
  }
};
} // namespace qoracle::synthesis
