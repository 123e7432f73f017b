#pragma once

#include <stdexcept>
#include <string>

namespace RC
{

// Base class for every error raised by the library
class Error : public std::runtime_error
{
    public:
    using std::runtime_error::runtime_error;
};

// Input, target or layer shape mismatch
class ShapeError : public Error
{
    public:
    using Error::Error;
};

// Adjacent layers in a pipeline declare incompatible shapes
class IncompatibleShapeError : public ShapeError
{
    public:
    using ShapeError::ShapeError;
};

// Layer ordering violated, pipeline incomplete or model used before compile()
class CompositionError : public Error
{
    public:
    using Error::Error;
};

// Invalid hyperparameter or malformed configuration
class ConfigError : public Error
{
    public:
    using Error::Error;
};

class UnknownActivationError : public ConfigError
{
    public:
    using ConfigError::ConfigError;
};

class UnsupportedOptimizerError : public ConfigError
{
    public:
    using ConfigError::ConfigError;
};

class UnknownMetricError : public ConfigError
{
    public:
    using ConfigError::ConfigError;
};

// Degenerate weight sampling, e.g. zero spectral radius
class InitializationError : public Error
{
    public:
    using Error::Error;
};

// Regression system not solvable, even with regularisation
class SingularMatrixError : public Error
{
    public:
    using Error::Error;
};

// predict() / evaluate() called before fit()
class NotFittedError : public Error
{
    public:
    using Error::Error;
};

// File could not be read or written
class IOError : public Error
{
    public:
    using Error::Error;
};

} // namespace RC
