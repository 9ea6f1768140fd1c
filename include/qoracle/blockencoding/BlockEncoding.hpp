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
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace qoracle::blockencoding {
/// SDK-neutral description of a single operation, consumed by backends.
using OperationRecord = nlohmann::json;

struct BlockEncodingMetadata {
  std::string name;
  double alpha = 1.;
  std::size_t ancillaQubits = 0;
  std::map<std::string, double> logicalCostHint;
};

/// A query instance; the parameters carry runtime knobs of the query.
struct BlockEncodingQuery {
  std::int64_t step = 0;
  std::map<std::string, double> parameters;
};

/**
 * The Abstract Base Class of block encodings. Implementations are independent
 * of any concrete quantum SDK.
 */
class BlockEncoding {
public:
  virtual ~BlockEncoding() = default;

  [[nodiscard]] virtual auto metadata() const
      -> const BlockEncodingMetadata& = 0;

  [[nodiscard]] virtual auto query(const BlockEncodingQuery& request) const
      -> OperationRecord = 0;

  /// The record of the conjugate-transpose query.
  [[nodiscard]] virtual auto adjointQuery(const BlockEncodingQuery& request)
      const -> OperationRecord = 0;
};
} // namespace qoracle::blockencoding
