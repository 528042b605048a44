#include <gtest/gtest.h>
#include "core/data_generation.hpp"
#include "models/huber_regression.hpp"
#include "models/linear_regression.hpp"
#include <Eigen/Dense>
#include <memory>

TEST(HuberRegressionTest, RecoversCleanLinearModel)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(80, 3, -5, 5, 1);
    Eigen::Vector3d w(0.5, -1.0, 2.0);
    Eigen::VectorXd y = DataGeneration::linearTargets(X, w, 3.0, 0.0, 2);

    HuberRegression model;
    model.fit(X, y);

    for (int j = 0; j < 3; ++j)
    {
        ASSERT_NEAR(model.coefficients()(j), w(j), 1e-4);
    }
    ASSERT_NEAR(model.intercept(), 3.0, 1e-4);
    ASSERT_EQ(model.predict(X).size(), 80);
}

TEST(HuberRegressionTest, RobustToOutliers)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(100, 2, -10, 10, 3);
    Eigen::Vector2d w(1.0, -2.0);
    Eigen::VectorXd y = DataGeneration::linearTargets(X, w, 0.5, 0.05, 4);

    // Corrupt every tenth target
    for (int i = 0; i < y.size(); i += 10)
    {
        y(i) += 500.0;
    }

    HuberRegression huber;
    LinearRegression ols;
    huber.fit(X, y);
    ols.fit(X, y);

    double huber_error = (huber.coefficients() - w).norm();
    double ols_error = (ols.coefficients() - w).norm();

    ASSERT_LT(huber_error, 0.1);
    ASSERT_LT(huber_error, ols_error);
    ASSERT_NEAR(huber.intercept(), 0.5, 0.5);
}

TEST(HuberRegressionTest, ContractErrors)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(20, 2, 0, 5, 5);
    Eigen::VectorXd y = DataGeneration::linearTargets(X, Eigen::Vector2d(1.0, 1.0), 0.0, 0.0, 6);

    HuberRegression model;
    EXPECT_THROW(model.predict(X), NotFittedError);
    EXPECT_THROW(model.coefficients(), NotFittedError);
    EXPECT_THROW(model.fit(Matrix(Matrix(X).to_sparse()), y), UnsupportedFormatError);
    EXPECT_THROW(model.fit(X, Eigen::VectorXd::Zero(19)), ShapeMismatch);
    ASSERT_FALSE(model.is_fitted());

    model.fit(X, y);
    EXPECT_THROW(model.predict(DataGeneration::randomIntegerMatrix(4, 3, 0, 5, 7)), ShapeMismatch);
    ASSERT_FALSE(model.is_online());
    ASSERT_EQ(model.kind(), ModelKind::Estimator);
}

TEST(HuberRegressionTest, NonPositiveDeltaIsRejected)
{
    EXPECT_THROW(std::make_unique<HuberRegression>(HuberRegressionConfig{0.0}), std::invalid_argument);
    EXPECT_THROW(std::make_unique<HuberRegression>(HuberRegressionConfig{-2.0}), std::invalid_argument);
}
