#include "models/huber_regression.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

HuberRegression::HuberRegression(const HuberRegressionConfig &config) : config(config)
{
    if (config.delta <= 0.0)
    {
        throw std::invalid_argument("HuberRegression: delta must be positive, got " + std::to_string(config.delta));
    }
}

std::unique_ptr<Model> HuberRegression::clone() const
{
    return std::make_unique<HuberRegression>(*this);
}

void HuberRegression::reset()
{
    Estimator::reset();
    w.reset();
    b.reset();
}

void HuberRegression::fit(const Matrix &X, const Eigen::VectorXd &y)
{
    Matrix input = prepare_fit_input(X, y, "HuberRegression::fit(X, y)");
    const DenseMatrix &D = input.dense();

    const int m = static_cast<int>(D.rows());
    const int num_features = static_cast<int>(D.cols());

    // Parameter vector: first num_features for weights, then bias.
    std::vector<double> parameters(num_features + 1, 0.0);

    ceres::Problem problem;
    for (int i = 0; i < m; ++i)
    {
        Eigen::VectorXd x = D.row(i).transpose();

        // The problem takes ownership of the cost and loss functions
        auto *cost_function = new ceres::DynamicAutoDiffCostFunction<HuberCostFunctor>(new HuberCostFunctor(x, y(i)));
        cost_function->SetNumResiduals(1);
        cost_function->AddParameterBlock(num_features + 1);

        ceres::LossFunction *loss_function = new ceres::HuberLoss(config.delta);

        problem.AddResidualBlock(cost_function, loss_function, parameters.data());
    }

    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.max_num_iterations = config.max_iterations;
    options.minimizer_progress_to_stdout = config.verbose;

    ceres::Solver::Summary summary;
    ceres::Solve(options, &problem, &summary);

    if (!summary.IsSolutionUsable())
    {
        throw std::runtime_error("HuberRegression::fit(X, y): Solver failed: " + summary.message);
    }
    if (summary.termination_type != ceres::CONVERGENCE)
    {
        std::cerr << "HuberRegression::fit: " << summary.message << std::endl;
    }
    if (config.verbose)
    {
        std::cout << summary.BriefReport() << std::endl;
    }

    Eigen::VectorXd w_new(num_features);
    for (int j = 0; j < num_features; ++j)
    {
        w_new(j) = parameters[j];
    }

    w = w_new;
    b = parameters[num_features];
    n_cols = num_features;
}

Eigen::VectorXd HuberRegression::predict(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, "HuberRegression::predict(X)");

    Eigen::VectorXd Y_pred = input.dense() * (*w);
    Y_pred.array() += *b;
    return Y_pred;
}

const Eigen::VectorXd &HuberRegression::coefficients() const
{
    if (!w.has_value())
    {
        throw NotFittedError("HuberRegression::coefficients(): Model has not been fitted yet.");
    }
    return *w;
}

double HuberRegression::intercept() const
{
    if (!b.has_value())
    {
        throw NotFittedError("HuberRegression::intercept(): Model has not been fitted yet.");
    }
    return *b;
}
