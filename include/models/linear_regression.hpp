#pragma once

#include <Eigen/Core>
#include <memory>
#include <optional>

#include "core/model.hpp"

struct LinearRegressionConfig
{
    bool fit_intercept = true;
    double alpha = 0.0; // Ridge penalty, the intercept is never penalized
};

// Least squares on the normal equations. The sufficient statistics are kept,
// so a sequence of partial_fit batches gives the same model as one fit on
// their concatenation.
class LinearRegression : public OnlineEstimator
{
public:
    explicit LinearRegression(const LinearRegressionConfig &config = {});

    void fit(const Matrix &X, const Eigen::VectorXd &y) override;
    void partial_fit(const Matrix &X, const Eigen::VectorXd &y) override;
    Eigen::VectorXd predict(const Matrix &X) const override;

    std::unique_ptr<Model> clone() const override;
    std::string name() const override { return "LinearRegression"; }
    FormatSupport format_support() const override { return FormatSupport::any(); }

    void reset() override;

    const Eigen::VectorXd &coefficients() const;
    double intercept() const;

    const LinearRegressionConfig &get_config() const { return config; }

private:
    struct SufficientStatistics
    {
        Eigen::MatrixXd XtX;
        Eigen::VectorXd Xty;
        Eigen::VectorXd x_sum;
        double y_sum = 0.0;
        Eigen::Index count = 0;
    };

    const LinearRegressionConfig config;

    std::optional<SufficientStatistics> stats;
    std::optional<Eigen::VectorXd> w; // Feature weights
    std::optional<double> b;          // Bias

    void accumulate(const Matrix &X, const Eigen::VectorXd &y);
    void solve();
};
