#include "models/logistic_regression.hpp"

#include <Eigen/Cholesky>
#include <cmath>
#include <iostream>
#include <stdexcept>

LogisticRegression::LogisticRegression(const LogisticRegressionConfig &config) : config(config)
{
    if (config.alpha < 0.0)
    {
        throw std::invalid_argument("LogisticRegression: alpha must be non-negative, got " + std::to_string(config.alpha));
    }
    if (config.max_iterations <= 0)
    {
        throw std::invalid_argument("LogisticRegression: max_iterations must be positive, got " + std::to_string(config.max_iterations));
    }
}

std::unique_ptr<Model> LogisticRegression::clone() const
{
    return std::make_unique<LogisticRegression>(*this);
}

void LogisticRegression::reset()
{
    Estimator::reset();
    w.reset();
    b.reset();
    iterations_run = 0;
}

void LogisticRegression::fit(const Matrix &X, const Eigen::VectorXd &y)
{
    Matrix input = prepare_fit_input(X, y, "LogisticRegression::fit(X, y)");

    for (Eigen::Index i = 0; i < y.size(); ++i)
    {
        if (y(i) != 0.0 && y(i) != 1.0)
        {
            throw std::invalid_argument("LogisticRegression::fit(X, y): Labels must be 0 or 1, got y(" + std::to_string(i) + ") = " + std::to_string(y(i)));
        }
    }

    const DenseMatrix &D = input.dense();
    const Eigen::Index N = D.rows();
    const Eigen::Index d = D.cols();
    const Eigen::Index p = config.fit_intercept ? d + 1 : d;

    // Augmented column of 1s for the bias
    Eigen::MatrixXd X_prime(N, p);
    X_prime.leftCols(d) = D;
    if (config.fit_intercept)
        X_prime.col(d).setOnes();

    // The bias is not penalized
    Eigen::VectorXd penalty = Eigen::VectorXd::Constant(p, config.alpha);
    if (config.fit_intercept)
        penalty(d) = 0.0;

    // Penalized negative log-likelihood, log(1 + e^eta) evaluated without overflow
    auto objective = [&](const Eigen::VectorXd &beta)
    {
        Eigen::ArrayXd eta = (X_prime * beta).array();
        Eigen::ArrayXd softplus = eta.max(0.0) + (-eta.abs()).exp().log1p();
        return (softplus - y.array() * eta).sum() + 0.5 * (penalty.array() * beta.array().square()).sum();
    };

    Eigen::VectorXd beta = Eigen::VectorXd::Zero(p);
    double loss = objective(beta);
    bool converged = false;
    int it = 0;
    while (it < config.max_iterations && !converged)
    {
        Eigen::VectorXd eta = X_prime * beta;
        Eigen::VectorXd prob = (1.0 + (-eta.array()).exp()).inverse().matrix();
        Eigen::VectorXd weights = (prob.array() * (1.0 - prob.array())).matrix();

        Eigen::VectorXd gradient = X_prime.transpose() * (y - prob) - penalty.cwiseProduct(beta);
        Eigen::MatrixXd hessian = X_prime.transpose() * weights.asDiagonal() * X_prime;
        hessian.diagonal() += penalty;
        // Keeps the Newton system solvable when the classes are separable and alpha = 0
        hessian.diagonal().array() += 1e-10;

        Eigen::VectorXd step = hessian.ldlt().solve(gradient);

        // Damped Newton: halve the step until the objective decreases enough (Armijo)
        double t = 1.0;
        double new_loss = objective(beta + step);
        for (int halving = 0; halving < 30 && new_loss > loss - 1e-4 * t * gradient.dot(step); ++halving)
        {
            t *= 0.5;
            new_loss = objective(beta + t * step);
        }

        beta += t * step;
        loss = new_loss;
        ++it;

        if (config.verbose)
        {
            std::cout << "LogisticRegression::fit: iteration " << it << ", loss " << loss << ", step norm " << t * step.norm() << std::endl;
        }

        converged = t * step.norm() < config.tolerance;
    }

    if (!converged)
    {
        std::cerr << "LogisticRegression::fit: did not converge after " << it << " iterations." << std::endl;
    }

    w = beta.head(d);
    b = config.fit_intercept ? beta(d) : 0.0;
    iterations_run = it;
    n_cols = d;
}

Eigen::VectorXd LogisticRegression::decision_function(const DenseMatrix &X) const
{
    Eigen::VectorXd eta = X * (*w);
    eta.array() += *b;
    return eta;
}

Eigen::VectorXd LogisticRegression::predict_proba(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, "LogisticRegression::predict_proba(X)");
    Eigen::VectorXd eta = decision_function(input.dense());

    return (1.0 + (-eta.array()).exp()).inverse().matrix();
}

Eigen::VectorXd LogisticRegression::predict(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, "LogisticRegression::predict(X)");
    Eigen::VectorXd eta = decision_function(input.dense());

    return (eta.array() >= 0.0).cast<double>().matrix();
}

double LogisticRegression::accuracy(const Matrix &X, const Eigen::VectorXd &y_true) const
{
    Eigen::VectorXd y_pred = predict(X);
    if (y_pred.size() != y_true.size())
    {
        throw ShapeMismatch("LogisticRegression::accuracy(X, y): Dimension mismatch between y.size() = " + std::to_string(y_true.size()) + " and X.rows() = " + std::to_string(y_pred.size()));
    }

    return (y_pred.array() == y_true.array()).cast<double>().mean();
}

const Eigen::VectorXd &LogisticRegression::coefficients() const
{
    if (!w.has_value())
    {
        throw NotFittedError("LogisticRegression::coefficients(): Model has not been fitted yet.");
    }
    return *w;
}

double LogisticRegression::intercept() const
{
    if (!b.has_value())
    {
        throw NotFittedError("LogisticRegression::intercept(): Model has not been fitted yet.");
    }
    return *b;
}
