#pragma once

#include <stdexcept>
#include <string>

namespace maia
{

/// Base class of every error raised by the library.
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Caller-supplied input rejected before any tensor work (e.g. empty batch).
class InputError : public Error
{
public:
    using Error::Error;
};

/// Parallel batch inputs (positions, self ratings, opponent ratings) differ in length.
class LengthMismatch : public InputError
{
public:
    using InputError::InputError;
};

/// A position string is malformed or does not describe a legal standard chess position.
class ParseError : public InputError
{
public:
    using InputError::InputError;
};

/// Model weights, engine plan or move vocabulary could not be loaded.
class ModelLoadError : public Error
{
public:
    using Error::Error;
};

/// Tensor shapes disagree with the model contract.
class ShapeError : public Error
{
public:
    using Error::Error;
};

/// The inference backend failed while executing a batch.
class EngineError : public Error
{
public:
    using Error::Error;
};

/// The move table does not cover a legal move, or an index is out of range.
class InternalConsistencyError : public Error
{
public:
    using Error::Error;
};

/// A model configuration file or value is invalid.
class ConfigError : public Error
{
public:
    using Error::Error;
};

} // namespace maia
