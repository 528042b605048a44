#include "core/pipeline.hpp"

#include <stdexcept>
#include <string>
#include <utility>

Pipeline &Pipeline::add(std::unique_ptr<Transformer> transformer)
{
    if (transformer == nullptr)
    {
        throw InvalidPipelineError("Pipeline::add(transformer): Stage can't be `nullptr`.");
    }
    if (estimator != nullptr)
    {
        throw InvalidPipelineError("Pipeline::add(" + transformer->name() + "): No stage can follow the final estimator " + estimator->name() + ".");
    }
    transformers.push_back(std::move(transformer));
    return *this;
}

Pipeline &Pipeline::set_estimator(std::unique_ptr<Estimator> new_estimator)
{
    if (new_estimator == nullptr)
    {
        throw InvalidPipelineError("Pipeline::set_estimator(estimator): Stage can't be `nullptr`.");
    }
    estimator = std::move(new_estimator);
    return *this;
}

void Pipeline::require_estimator(const std::string &where) const
{
    if (estimator == nullptr)
    {
        throw InvalidPipelineError(where + ": Pipeline has no final estimator.");
    }
}

void Pipeline::require_transformers_only(const std::string &where) const
{
    if (estimator != nullptr)
    {
        throw InvalidPipelineError(where + ": Pipeline ends in the estimator " + estimator->name() + ", use fit/predict.");
    }
    if (transformers.empty())
    {
        throw InvalidPipelineError(where + ": Pipeline is empty.");
    }
}

void Pipeline::check_rows(const Matrix &out, Eigen::Index expected, const Model &stage, const std::string &where)
{
    if (out.rows() != expected)
    {
        throw ShapeMismatch(where + ": Stage " + stage.name() + " returned " + std::to_string(out.rows()) + " rows for " + std::to_string(expected) + " input rows.");
    }
}

namespace
{
    // clone() of a T is a T
    template <typename T>
    std::unique_ptr<T> clone_stage(const T &stage)
    {
        return std::unique_ptr<T>(static_cast<T *>(stage.clone().release()));
    }
}

std::vector<std::unique_ptr<Transformer>> Pipeline::clone_transformers() const
{
    std::vector<std::unique_ptr<Transformer>> copies;
    copies.reserve(transformers.size());
    for (const auto &transformer : transformers)
    {
        copies.push_back(clone_stage(*transformer));
    }
    return copies;
}

Matrix Pipeline::transform_through(const Matrix &X, const std::string &where) const
{
    if (X.empty())
    {
        throw TypeMismatch(where + ": Input is neither a dense nor a sparse matrix.");
    }

    Matrix current = X;
    for (const auto &transformer : transformers)
    {
        current = transformer->transform(current);
        check_rows(current, X.rows(), *transformer, where);
    }
    return current;
}

void Pipeline::fit(const Matrix &X, const Eigen::VectorXd &y)
{
    require_estimator("Pipeline::fit(X, y)");
    if (X.empty())
    {
        throw TypeMismatch("Pipeline::fit(X, y): Input is neither a dense nor a sparse matrix.");
    }
    if (y.size() != X.rows())
    {
        throw ShapeMismatch("Pipeline::fit(X, y): Dimension mismatch between y.size() = " + std::to_string(y.size()) + " and X.rows() = " + std::to_string(X.rows()));
    }

    std::vector<std::unique_ptr<Transformer>> fitted = clone_transformers();
    std::unique_ptr<Estimator> fitted_estimator = clone_stage(*estimator);

    Matrix current = X;
    for (auto &transformer : fitted)
    {
        current = transformer->fit_transform(current);
        check_rows(current, X.rows(), *transformer, "Pipeline::fit(X, y)");
    }
    fitted_estimator->fit(current, y);

    transformers = std::move(fitted);
    estimator = std::move(fitted_estimator);
}

Eigen::VectorXd Pipeline::predict(const Matrix &X) const
{
    require_estimator("Pipeline::predict(X)");
    return estimator->predict(transform_through(X, "Pipeline::predict(X)"));
}

double Pipeline::MSE(const Matrix &X, const Eigen::VectorXd &y_true) const
{
    require_estimator("Pipeline::MSE(X, y)");
    return estimator->MSE(transform_through(X, "Pipeline::MSE(X, y)"), y_true);
}

double Pipeline::R2(const Matrix &X, const Eigen::VectorXd &y_true) const
{
    require_estimator("Pipeline::R2(X, y)");
    return estimator->R2(transform_through(X, "Pipeline::R2(X, y)"), y_true);
}

Matrix Pipeline::fit_transform(const Matrix &X)
{
    require_transformers_only("Pipeline::fit_transform(X)");
    if (X.empty())
    {
        throw TypeMismatch("Pipeline::fit_transform(X): Input is neither a dense nor a sparse matrix.");
    }

    std::vector<std::unique_ptr<Transformer>> fitted = clone_transformers();

    Matrix current = X;
    for (auto &transformer : fitted)
    {
        current = transformer->fit_transform(current);
        check_rows(current, X.rows(), *transformer, "Pipeline::fit_transform(X)");
    }

    transformers = std::move(fitted);
    return current;
}

Matrix Pipeline::transform(const Matrix &X) const
{
    require_transformers_only("Pipeline::transform(X)");
    return transform_through(X, "Pipeline::transform(X)");
}

bool Pipeline::is_fitted() const
{
    if (size() == 0)
        return false;
    for (const auto &transformer : transformers)
    {
        if (!transformer->is_fitted())
            return false;
    }
    return estimator == nullptr || estimator->is_fitted();
}

const Model &Pipeline::stage(size_t i) const
{
    if (i < transformers.size())
        return *transformers[i];
    if (i == transformers.size() && estimator != nullptr)
        return *estimator;
    throw std::out_of_range("Pipeline::stage(i): Index " + std::to_string(i) + " out of range for " + std::to_string(size()) + " stages.");
}
