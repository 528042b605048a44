#pragma once

#include <Eigen/Core>
#include <memory>
#include <optional>

#include "core/model.hpp"

struct LogisticRegressionConfig
{
    double alpha = 1.0; // L2 penalty on the weights
    bool fit_intercept = true;
    int max_iterations = 100;
    double tolerance = 1e-8; // Stop once the Newton step is this small
    bool verbose = false;
};

// Binary classifier (labels 0 / 1) trained with iteratively reweighted least squares.
class LogisticRegression : public Estimator
{
public:
    explicit LogisticRegression(const LogisticRegressionConfig &config = {});

    void fit(const Matrix &X, const Eigen::VectorXd &y) override;

    // Class labels 0 / 1
    Eigen::VectorXd predict(const Matrix &X) const override;
    // P(y = 1 | x)
    Eigen::VectorXd predict_proba(const Matrix &X) const;

    double accuracy(const Matrix &X, const Eigen::VectorXd &y_true) const;

    std::unique_ptr<Model> clone() const override;
    std::string name() const override { return "LogisticRegression"; }
    FormatSupport format_support() const override { return FormatSupport::both(MatrixFormat::Dense); }

    void reset() override;

    const Eigen::VectorXd &coefficients() const;
    double intercept() const;
    int iterations() const { return iterations_run; }

private:
    const LogisticRegressionConfig config;

    std::optional<Eigen::VectorXd> w;
    std::optional<double> b;
    int iterations_run = 0;

    Eigen::VectorXd decision_function(const DenseMatrix &X) const;
};
