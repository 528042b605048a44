#include "core/model.hpp"

#include <Eigen/Cholesky>
#include <Eigen/SparseCore>

Eigen::Index Model::n_features() const
{
    if (!n_cols.has_value())
    {
        throw NotFittedError(name() + "::n_features(): Model has not been fitted yet.");
    }
    return *n_cols;
}

void Model::reset()
{
    n_cols.reset();
}

Matrix Model::prepare_fit_input(const Matrix &X, const std::string &where) const
{
    Matrix input = MatrixConversion::convert_input(X, format_support(), where);
    if (input.rows() == 0)
    {
        throw ShapeMismatch(where + ": X has no rows.");
    }
    return input;
}

Matrix Model::prepare_apply_input(const Matrix &X, const std::string &where) const
{
    if (!is_fitted())
    {
        throw NotFittedError(where + ": Model has not been fitted yet.");
    }

    Matrix input = MatrixConversion::convert_input(X, format_support(), where);
    if (input.cols() != *n_cols)
    {
        throw ShapeMismatch(where + ": Dimension mismatch between X.cols() = " + std::to_string(input.cols()) + " and the " + std::to_string(*n_cols) + " features seen during fit.");
    }
    return input;
}

Matrix Model::prepare_partial_input(const Matrix &X, const std::string &where) const
{
    Matrix input = prepare_fit_input(X, where);
    if (n_cols.has_value() && input.cols() != *n_cols)
    {
        throw ShapeMismatch(where + ": Dimension mismatch between X.cols() = " + std::to_string(input.cols()) + " and the " + std::to_string(*n_cols) + " features of the previous batches.");
    }
    return input;
}

// ============================================================================
// Estimator
// ============================================================================

Matrix Estimator::prepare_fit_input(const Matrix &X, const Eigen::VectorXd &y, const std::string &where) const
{
    Matrix input = Model::prepare_fit_input(X, where);
    if (y.size() != input.rows())
    {
        throw ShapeMismatch(where + ": Dimension mismatch between y.size() = " + std::to_string(y.size()) + " and X.rows() = " + std::to_string(input.rows()));
    }
    return input;
}

double Estimator::MSE(const Matrix &X, const Eigen::VectorXd &y_true) const
{
    Eigen::VectorXd y_pred = predict(X);
    if (y_pred.size() != y_true.size())
    {
        throw ShapeMismatch(name() + "::MSE(X, y): Dimension mismatch between y.size() = " + std::to_string(y_true.size()) + " and X.rows() = " + std::to_string(y_pred.size()));
    }

    Eigen::VectorXd residuals = y_true - y_pred;

    return residuals.squaredNorm() / y_true.size();
}

double Estimator::R2(const Matrix &X, const Eigen::VectorXd &y_true) const
{
    Eigen::VectorXd y_pred = predict(X);
    if (y_pred.size() != y_true.size())
    {
        throw ShapeMismatch(name() + "::R2(X, y): Dimension mismatch between y.size() = " + std::to_string(y_true.size()) + " and X.rows() = " + std::to_string(y_pred.size()));
    }

    double ss_res = (y_true - y_pred).squaredNorm();
    double ss_tot = (y_true.array() - y_true.mean()).square().sum();
    if (ss_tot == 0.0)
    {
        // Constant target: perfect fit scores 1, anything else 0
        return ss_res == 0.0 ? 1.0 : 0.0;
    }

    return 1.0 - ss_res / ss_tot;
}

// ============================================================================
// Decomposer
// ============================================================================

const DenseMatrix &Decomposer::components() const
{
    if (!Q.has_value())
    {
        throw NotFittedError(name() + "::components(): Model has not been fitted yet.");
    }
    return *Q;
}

void Decomposer::reset()
{
    Transformer::reset();
    Q.reset();
}

Matrix Decomposer::transform(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, name() + "::transform(X)");
    return Matrix(project(input));
}

DenseMatrix Decomposer::project(const Matrix &X) const
{
    const DenseMatrix &basis = *Q;

    // Normal equations of min ||X - P' Q||_F:  (Q Q^T) P'^T = Q X^T
    DenseMatrix gram = basis * basis.transpose();
    DenseMatrix XQt;
    if (X.is_sparse())
    {
        XQt = X.sparse() * basis.transpose();
    }
    else
    {
        XQt = X.dense() * basis.transpose();
    }

    DenseMatrix Pt = gram.ldlt().solve(XQt.transpose());
    return Pt.transpose();
}
