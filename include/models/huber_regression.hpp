#pragma once

#include <Eigen/Core>
#include <ceres/ceres.h>
#include <memory>
#include <optional>

#include "core/model.hpp"

struct HuberCostFunctor
{
    // Stores one observation: feature row and target.
    HuberCostFunctor(const Eigen::VectorXd &x, double y) : x_(x), y_(y) {}

    template <typename T>
    bool operator()(T const *const *parameters, T *residuals) const
    {
        // parameters[0] is the single parameter block [w, b].
        const T *param = parameters[0];
        T prediction = T(0);
        for (int j = 0; j < x_.size(); ++j)
        {
            prediction += param[j] * T(x_(j));
        }
        prediction += param[x_.size()];
        residuals[0] = T(y_) - prediction;
        return true;
    }

    const Eigen::VectorXd x_;
    const double y_;
};

struct HuberRegressionConfig
{
    double delta = 1.0; // Residuals beyond delta are penalized linearly
    int max_iterations = 100;
    bool verbose = false;
};

// Robust linear regression: the Huber loss is minimized with Ceres.
// Dense input only.
class HuberRegression : public Estimator
{
public:
    explicit HuberRegression(const HuberRegressionConfig &config = {});
    virtual ~HuberRegression() noexcept override = default;

    void fit(const Matrix &X, const Eigen::VectorXd &y) override;
    Eigen::VectorXd predict(const Matrix &X) const override;

    std::unique_ptr<Model> clone() const override;
    std::string name() const override { return "HuberRegression"; }
    FormatSupport format_support() const override { return FormatSupport::dense_only(); }

    void reset() override;

    const Eigen::VectorXd &coefficients() const;
    double intercept() const;

private:
    const HuberRegressionConfig config;

    std::optional<Eigen::VectorXd> w;
    std::optional<double> b;
};
