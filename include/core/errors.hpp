#pragma once

#include <stdexcept>
#include <string>

// Base of every error raised by the model contract.
class ModelError : public std::runtime_error
{
public:
    explicit ModelError(const std::string &message) : std::runtime_error(message) {}
};

// Dimension disagreement: matrix vs. target, zero rows, or new data vs. the
// column count a model was fitted on.
class ShapeMismatch : public ModelError
{
public:
    explicit ShapeMismatch(const std::string &message) : ModelError(message) {}
};

// predict/transform called before a successful fit.
class NotFittedError : public ModelError
{
public:
    explicit NotFittedError(const std::string &message) : ModelError(message) {}
};

// Matrix representation outside a model's declared accepted set.
class UnsupportedFormatError : public ModelError
{
public:
    explicit UnsupportedFormatError(const std::string &message) : ModelError(message) {}
};

// Input holds no recognized matrix representation.
class TypeMismatch : public ModelError
{
public:
    explicit TypeMismatch(const std::string &message) : ModelError(message) {}
};

class InvalidPipelineError : public ModelError
{
public:
    explicit InvalidPipelineError(const std::string &message) : ModelError(message) {}
};
