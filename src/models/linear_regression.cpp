#include "models/linear_regression.hpp"

#include <Eigen/Cholesky>
#include <Eigen/SparseCore>
#include <stdexcept>

LinearRegression::LinearRegression(const LinearRegressionConfig &config) : config(config)
{
    if (config.alpha < 0.0)
    {
        throw std::invalid_argument("LinearRegression: alpha must be non-negative, got " + std::to_string(config.alpha));
    }
}

std::unique_ptr<Model> LinearRegression::clone() const
{
    return std::make_unique<LinearRegression>(*this);
}

void LinearRegression::reset()
{
    OnlineEstimator::reset();
    stats.reset();
    w.reset();
    b.reset();
}

void LinearRegression::fit(const Matrix &X, const Eigen::VectorXd &y)
{
    Matrix input = prepare_fit_input(X, y, "LinearRegression::fit(X, y)");

    reset();
    accumulate(input, y);
    solve();
}

void LinearRegression::partial_fit(const Matrix &X, const Eigen::VectorXd &y)
{
    Matrix input = prepare_partial_input(X, "LinearRegression::partial_fit(X, y)");
    if (y.size() != input.rows())
    {
        throw ShapeMismatch("LinearRegression::partial_fit(X, y): Dimension mismatch between y.size() = " + std::to_string(y.size()) + " and X.rows() = " + std::to_string(input.rows()));
    }

    accumulate(input, y);
    solve();
}

Eigen::VectorXd LinearRegression::predict(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, "LinearRegression::predict(X)");

    Eigen::VectorXd Y_pred;
    if (input.is_sparse())
    {
        Y_pred = input.sparse() * (*w);
    }
    else
    {
        Y_pred = input.dense() * (*w);
    }
    Y_pred.array() += *b;

    return Y_pred;
}

const Eigen::VectorXd &LinearRegression::coefficients() const
{
    if (!w.has_value())
    {
        throw NotFittedError("LinearRegression::coefficients(): Model has not been fitted yet.");
    }
    return *w;
}

double LinearRegression::intercept() const
{
    if (!b.has_value())
    {
        throw NotFittedError("LinearRegression::intercept(): Model has not been fitted yet.");
    }
    return *b;
}

void LinearRegression::accumulate(const Matrix &X, const Eigen::VectorXd &y)
{
    const Eigen::Index d = X.cols();
    if (!stats.has_value())
    {
        SufficientStatistics fresh;
        fresh.XtX = Eigen::MatrixXd::Zero(d, d);
        fresh.Xty = Eigen::VectorXd::Zero(d);
        fresh.x_sum = Eigen::VectorXd::Zero(d);
        stats = fresh;
    }

    if (X.is_sparse())
    {
        const SparseMatrix &S = X.sparse();
        SparseMatrix StS = S.transpose() * S;
        stats->XtX += Eigen::MatrixXd(StS);
        stats->Xty += S.transpose() * y;
        stats->x_sum += S.transpose() * Eigen::VectorXd::Ones(S.rows());
    }
    else
    {
        const DenseMatrix &D = X.dense();
        stats->XtX += D.transpose() * D;
        stats->Xty += D.transpose() * y;
        stats->x_sum += D.colwise().sum().transpose();
    }
    stats->y_sum += y.sum();
    stats->count += X.rows();

    n_cols = d;
}

void LinearRegression::solve()
{
    const Eigen::Index d = stats->XtX.rows();
    const double N = static_cast<double>(stats->count);

    Eigen::MatrixXd lhs = stats->XtX;
    Eigen::VectorXd rhs = stats->Xty;

    Eigen::VectorXd x_mean = Eigen::VectorXd::Zero(d);
    double y_mean = 0.0;
    if (config.fit_intercept)
    {
        // Centering through the statistics: X_c^T X_c = X^T X - N * mean * mean^T
        x_mean = stats->x_sum / N;
        y_mean = stats->y_sum / N;
        lhs -= N * x_mean * x_mean.transpose();
        rhs -= N * x_mean * y_mean;
    }
    lhs.diagonal().array() += config.alpha;

    w = lhs.ldlt().solve(rhs);
    b = config.fit_intercept ? y_mean - x_mean.dot(*w) : 0.0;
}
