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

#include <stdexcept>
#include <string>

namespace qoracle {
/// Common base of all errors raised while building or compiling oracles.
class OracleException : public std::runtime_error {
public:
  explicit OracleException(const std::string& msg) : std::runtime_error(msg) {}
};

/// A generated index or value falls outside its declared domain.
class RangeError : public OracleException {
public:
  using OracleException::OracleException;
};

/// A lookup table is incomplete or has out-of-range keys or values.
class MalformedTableError : public OracleException {
public:
  using OracleException::OracleException;
};

/// An operation is disabled or a configured bound is exceeded.
class ConfigurationError : public OracleException {
public:
  using OracleException::OracleException;
};

/// Structural input (e.g., a dense matrix) is ill-formed.
class ShapeError : public OracleException {
public:
  using OracleException::OracleException;
};

/// A numeric value cannot be represented in the requested fixed-point width.
class OverflowError : public OracleException {
public:
  using OracleException::OracleException;
};

/// A function form holds no alternative the synthesizer can compile.
class UnsupportedFormTypeError : public OracleException {
public:
  using OracleException::OracleException;
};

/// A gate kind is unknown to the circuit model or its cost estimator.
class UnsupportedGateError : public OracleException {
public:
  using OracleException::OracleException;
};
} // namespace qoracle
