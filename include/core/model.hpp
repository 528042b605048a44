#pragma once

#include <Eigen/Core>
#include <memory>
#include <optional>
#include <string>

#include "core/errors.hpp"
#include "core/matrix.hpp"

enum class ModelKind
{
    Estimator,
    Transformer,
    Decomposer
};

// Common surface of every model. Hyperparameters are fixed at construction;
// learned state lives in std::optional members of the concrete class and the
// model counts as fitted once `n_cols` is set. Instances are not thread-safe.
class Model
{
public:
    virtual ~Model() noexcept = default;

    virtual std::unique_ptr<Model> clone() const = 0;

    virtual std::string name() const = 0;
    virtual ModelKind kind() const = 0;
    virtual bool is_online() const { return false; }
    virtual FormatSupport format_support() const = 0;

    bool is_fitted() const { return n_cols.has_value(); }
    Eigen::Index n_features() const;

    // Drops all learned state, the model is unfitted afterwards.
    virtual void reset();

protected:
    std::optional<Eigen::Index> n_cols; // Column count established by the first fit

    // Format negotiation plus the zero-row check for fit-style operations.
    Matrix prepare_fit_input(const Matrix &X, const std::string &where) const;

    // NotFittedError, format negotiation and the column check for predict/transform.
    Matrix prepare_apply_input(const Matrix &X, const std::string &where) const;

    // For partial_fit: the column count must match the first call.
    Matrix prepare_partial_input(const Matrix &X, const std::string &where) const;
};

class Estimator : public Model
{
public:
    ModelKind kind() const override { return ModelKind::Estimator; }

    virtual void fit(const Matrix &X, const Eigen::VectorXd &y) = 0; // No const, fit overrides the learned parameters
    virtual Eigen::VectorXd predict(const Matrix &X) const = 0;      // One prediction per row of X

    virtual double MSE(const Matrix &X, const Eigen::VectorXd &y_true) const;
    virtual double R2(const Matrix &X, const Eigen::VectorXd &y_true) const;

protected:
    using Model::prepare_fit_input;
    Matrix prepare_fit_input(const Matrix &X, const Eigen::VectorXd &y, const std::string &where) const;
};

class Transformer : public Model
{
public:
    ModelKind kind() const override { return ModelKind::Transformer; }

    // Fits and applies in one step, the result has as many rows as X.
    virtual Matrix fit_transform(const Matrix &X) = 0;
    virtual Matrix transform(const Matrix &X) const = 0;
};

// Factorizes X ≈ P * Q. fit_transform returns P and keeps Q (rank x n_features),
// transform finds the least-squares P' with X ≈ P' * Q for new data.
class Decomposer : public Transformer
{
public:
    ModelKind kind() const override { return ModelKind::Decomposer; }

    Matrix transform(const Matrix &X) const override;

    const DenseMatrix &components() const;
    virtual Eigen::Index rank() const = 0;

    void reset() override;

protected:
    std::optional<DenseMatrix> Q; // Components, one per row

    // P' = X Q^T (Q Q^T)^{-1}, X already negotiated.
    DenseMatrix project(const Matrix &X) const;
};

class OnlineEstimator : public Estimator
{
public:
    bool is_online() const override { return true; }

    // Updates the learned state with one more batch instead of resetting it.
    virtual void partial_fit(const Matrix &X, const Eigen::VectorXd &y) = 0;
};

class OnlineTransformer : public Transformer
{
public:
    bool is_online() const override { return true; }

    virtual void partial_fit(const Matrix &X) = 0;
};

class OnlineDecomposer : public Decomposer
{
public:
    bool is_online() const override { return true; }

    virtual void partial_fit(const Matrix &X) = 0;
};
