#pragma once

#include <Eigen/Core>

#include "core/model.hpp"
#include "core/pipeline.hpp"

// Subject-first call form: Dispatch::predict(X, model) is model.predict(X).
// The fitting calls hand the model back, so stages compose without naming
// intermediates:
//
//   Dispatch::predict(Dispatch::fit_transform(X, svd), Dispatch::fit(Z, y, ols));
namespace Dispatch
{
    inline Estimator &fit(const Matrix &X, const Eigen::VectorXd &y, Estimator &model)
    {
        model.fit(X, y);
        return model;
    }

    inline Eigen::VectorXd predict(const Matrix &X, const Estimator &model)
    {
        return model.predict(X);
    }

    inline Matrix fit_transform(const Matrix &X, Transformer &model)
    {
        return model.fit_transform(X);
    }

    inline Matrix transform(const Matrix &X, const Transformer &model)
    {
        return model.transform(X);
    }

    inline OnlineEstimator &partial_fit(const Matrix &X, const Eigen::VectorXd &y, OnlineEstimator &model)
    {
        model.partial_fit(X, y);
        return model;
    }

    inline OnlineTransformer &partial_fit(const Matrix &X, OnlineTransformer &model)
    {
        model.partial_fit(X);
        return model;
    }

    inline OnlineDecomposer &partial_fit(const Matrix &X, OnlineDecomposer &model)
    {
        model.partial_fit(X);
        return model;
    }

    inline Pipeline &fit(const Matrix &X, const Eigen::VectorXd &y, Pipeline &pipeline)
    {
        pipeline.fit(X, y);
        return pipeline;
    }

    inline Eigen::VectorXd predict(const Matrix &X, const Pipeline &pipeline)
    {
        return pipeline.predict(X);
    }

    inline Matrix fit_transform(const Matrix &X, Pipeline &pipeline)
    {
        return pipeline.fit_transform(X);
    }

    inline Matrix transform(const Matrix &X, const Pipeline &pipeline)
    {
        return pipeline.transform(X);
    }
}
