#include <gtest/gtest.h>
#include "core/dispatch.hpp"
#include "core/data_generation.hpp"
#include "models/linear_regression.hpp"
#include "models/logistic_regression.hpp"
#include "models/standard_scaler.hpp"
#include "models/truncated_svd.hpp"
#include "models/incremental_svd.hpp"
#include <Eigen/Dense>
#include <memory>

TEST(DispatchTest, EstimatorCallsMatchDirectCalls)
{
    // 100 x 10 random integers with 100 binary labels
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(100, 10, 0, 20, 1);
    Eigen::VectorXd y = DataGeneration::binaryLabels(100, 2);

    LogisticRegression direct;
    direct.fit(X, y);
    Eigen::VectorXd expected = direct.predict(X);

    LogisticRegression subject;
    Estimator &fitted = Dispatch::fit(X, y, subject);
    ASSERT_EQ(&fitted, &subject);

    Eigen::VectorXd actual = Dispatch::predict(X, subject);
    ASSERT_EQ(actual.size(), 100);
    ASSERT_TRUE(expected == actual);
}

TEST(DispatchTest, FitResultFeedsPredict)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(50, 3, -5, 5, 3);
    Eigen::VectorXd y = DataGeneration::linearTargets(X, Eigen::Vector3d(1.0, 2.0, 3.0), -1.0, 0.0, 4);

    LinearRegression model;
    Eigen::VectorXd y_pred = Dispatch::predict(X, Dispatch::fit(X, y, model));

    ASSERT_NEAR((y_pred - y).norm(), 0.0, 1e-8);
}

TEST(DispatchTest, TransformerAndDecomposerCallsMatchDirectCalls)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(100, 10, 0, 20, 5);

    StandardScaler scaler_direct, scaler_subject;
    TruncatedSVD svd_direct(TruncatedSVDConfig{2}), svd_subject(TruncatedSVDConfig{2});

    Eigen::MatrixXd expected = svd_direct.fit_transform(scaler_direct.fit_transform(X)).to_dense();
    Eigen::MatrixXd actual = Dispatch::fit_transform(Dispatch::fit_transform(X, scaler_subject), svd_subject).to_dense();
    ASSERT_TRUE(expected == actual);

    Eigen::MatrixXd expected_new = svd_direct.transform(scaler_direct.transform(X)).to_dense();
    Eigen::MatrixXd actual_new = Dispatch::transform(Dispatch::transform(X, scaler_subject), svd_subject).to_dense();
    ASSERT_TRUE(expected_new == actual_new);
}

TEST(DispatchTest, PartialFitOverloadsReachTheOnlineModels)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(40, 4, -5, 5, 6);
    Eigen::VectorXd y = DataGeneration::linearTargets(X, Eigen::Vector4d(1.0, 0.0, -1.0, 2.0), 0.5, 0.1, 7);

    Eigen::MatrixXd X_top = X.topRows(20), X_bottom = X.bottomRows(20);
    Eigen::VectorXd y_top = y.head(20), y_bottom = y.tail(20);

    LinearRegression ols_direct, ols_subject;
    ols_direct.partial_fit(X_top, y_top);
    ols_direct.partial_fit(X_bottom, y_bottom);
    OnlineEstimator &ols_ref = Dispatch::partial_fit(X_top, y_top, ols_subject);
    ASSERT_EQ(&ols_ref, &ols_subject);
    Dispatch::partial_fit(X_bottom, y_bottom, ols_subject);
    ASSERT_TRUE(ols_direct.coefficients() == ols_subject.coefficients());

    StandardScaler scaler_direct, scaler_subject;
    scaler_direct.partial_fit(X);
    OnlineTransformer &scaler_ref = Dispatch::partial_fit(X, scaler_subject);
    ASSERT_EQ(&scaler_ref, &scaler_subject);
    ASSERT_TRUE(scaler_direct.mean() == scaler_subject.mean());

    IncrementalSVD isvd_direct(IncrementalSVDConfig{2}), isvd_subject(IncrementalSVDConfig{2});
    isvd_direct.partial_fit(X);
    OnlineDecomposer &isvd_ref = Dispatch::partial_fit(X, isvd_subject);
    ASSERT_EQ(&isvd_ref, &isvd_subject);
    ASSERT_TRUE(isvd_direct.singular_values() == isvd_subject.singular_values());
}

TEST(DispatchTest, PipelineCallsMatchDirectCalls)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(100, 10, 0, 20, 8);
    Eigen::VectorXd y = DataGeneration::binaryLabels(100, 9);

    auto make = []()
    {
        Pipeline pipeline;
        pipeline.add(std::make_unique<StandardScaler>())
            .add(std::make_unique<TruncatedSVD>(TruncatedSVDConfig{2}))
            .set_estimator(std::make_unique<LinearRegression>());
        return pipeline;
    };

    Pipeline direct = make();
    direct.fit(X, y);

    Pipeline subject = make();
    Eigen::VectorXd actual = Dispatch::predict(X, Dispatch::fit(X, y, subject));

    ASSERT_TRUE(direct.predict(X) == actual);

    Pipeline reduce;
    reduce.add(std::make_unique<StandardScaler>()).add(std::make_unique<TruncatedSVD>(TruncatedSVDConfig{3}));
    Matrix P = Dispatch::fit_transform(X, reduce);
    Eigen::MatrixXd P_new = Dispatch::transform(X, reduce).to_dense();
    ASSERT_TRUE(reduce.transform(X).to_dense() == P_new);
    ASSERT_NEAR((P.to_dense() - P_new).norm(), 0.0, 1e-8);
}

TEST(DispatchTest, ErrorsPropagateUnchanged)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(10, 3, 0, 5, 10);

    LinearRegression ols;
    EXPECT_THROW(Dispatch::predict(X, ols), NotFittedError);
    EXPECT_THROW(Dispatch::fit(X, Eigen::VectorXd::Zero(9), ols), ShapeMismatch);

    StandardScaler scaler;
    Matrix sparse(Matrix(X).to_sparse());
    EXPECT_THROW(Dispatch::fit_transform(sparse, scaler), UnsupportedFormatError);
}
