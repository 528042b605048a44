#pragma once

#include <Eigen/Core>
#include <memory>
#include <string>
#include <vector>

#include "core/model.hpp"

// Ordered chain of stages: transformers first, optionally one estimator at the
// end. Each stage's output is the next stage's input; row i of the input stays
// row i all the way through.
class Pipeline
{
public:
    Pipeline() = default;

    Pipeline &add(std::unique_ptr<Transformer> transformer);
    Pipeline &set_estimator(std::unique_ptr<Estimator> estimator);

    // Estimator-terminated pipelines
    // Stages are fitted on copies and swapped in together, a throwing stage
    // leaves the previous fit in place.
    void fit(const Matrix &X, const Eigen::VectorXd &y);
    Eigen::VectorXd predict(const Matrix &X) const;

    // Scores of the final estimator on the transformed X
    double MSE(const Matrix &X, const Eigen::VectorXd &y_true) const;
    double R2(const Matrix &X, const Eigen::VectorXd &y_true) const;

    // Transformer-only pipelines
    Matrix fit_transform(const Matrix &X);
    Matrix transform(const Matrix &X) const;

    bool is_fitted() const;
    bool has_estimator() const { return estimator != nullptr; }
    size_t size() const { return transformers.size() + (estimator ? 1 : 0); }

    // Stage i in chain order, the estimator is the last one
    const Model &stage(size_t i) const;

private:
    std::vector<std::unique_ptr<Transformer>> transformers;
    std::unique_ptr<Estimator> estimator;

    std::vector<std::unique_ptr<Transformer>> clone_transformers() const;
    Matrix transform_through(const Matrix &X, const std::string &where) const;

    void require_estimator(const std::string &where) const;
    void require_transformers_only(const std::string &where) const;
    static void check_rows(const Matrix &out, Eigen::Index expected, const Model &stage, const std::string &where);
};
