#pragma once

#include <stdexcept>
#include <string>

namespace aquifer {

// Base of every failure raised by the engine.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InvalidGridError : public Error {
public:
  using Error::Error;
};

class InvalidParameterError : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

// Iteration budget exhausted before the residual met the tolerance.
class NonConvergenceError : public Error {
public:
  NonConvergenceError(int iterations, double residual)
      : Error("steady solve did not converge in " + std::to_string(iterations) +
              " iterations (max residual " + std::to_string(residual) + ")"),
        iterations_(iterations), residual_(residual) {}

  int iterations() const { return iterations_; }
  double residual() const { return residual_; }

private:
  int iterations_ = 0;
  double residual_ = 0.0;
};

// The iterate could not be kept non-negative without the residual stalling.
class NonPhysicalStateError : public Error {
public:
  NonPhysicalStateError(int iteration, const std::string& what)
      : Error(what), iteration_(iteration) {}

  int iteration() const { return iteration_; }

private:
  int iteration_ = 0;
};

// NaN/Inf in a residual or Jacobian, or a singular linear system.
class NumericalInstabilityError : public Error {
public:
  using Error::Error;
};

} // namespace aquifer
