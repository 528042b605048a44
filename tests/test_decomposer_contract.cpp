#include <gtest/gtest.h>
#include "core/model.hpp"
#include "core/data_generation.hpp"
#include "models/truncated_svd.hpp"
#include "models/incremental_svd.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>

std::vector<std::function<std::unique_ptr<Decomposer>(Eigen::Index)>> decomposerFactories()
{
    return {
        [](Eigen::Index k) -> std::unique_ptr<Decomposer> { return std::make_unique<TruncatedSVD>(TruncatedSVDConfig{k}); },
        [](Eigen::Index k) -> std::unique_ptr<Decomposer> { return std::make_unique<IncrementalSVD>(IncrementalSVDConfig{k}); },
    };
}

TEST(DecomposerContractTest, TransformBeforeFitIsNotFitted)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(10, 4, 0, 5, 1);

    for (auto &factory : decomposerFactories())
    {
        auto model = factory(2);
        EXPECT_THROW(model->transform(X), NotFittedError) << model->name();
        EXPECT_THROW(model->components(), NotFittedError) << model->name();
    }
}

TEST(DecomposerContractTest, RankTwoOfHundredByTen)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(100, 10, 0, 20, 2);

    for (auto &factory : decomposerFactories())
    {
        auto model = factory(2);
        Matrix P = model->fit_transform(X);

        ASSERT_EQ(P.rows(), 100) << model->name();
        ASSERT_EQ(P.cols(), 2) << model->name();
        ASSERT_EQ(model->components().rows(), 2);
        ASSERT_EQ(model->components().cols(), 10);

        Matrix P_new = model->transform(X);
        ASSERT_EQ(P_new.rows(), 100);
        ASSERT_EQ(P_new.cols(), 2);

        Eigen::MatrixXd diff = P.to_dense() - P_new.to_dense();
        for (int i = 0; i < diff.rows(); ++i)
        {
            for (int j = 0; j < diff.cols(); ++j)
            {
                ASSERT_NEAR(diff(i, j), 0.0, 1e-8) << model->name();
            }
        }
    }
}

TEST(DecomposerContractTest, RoundTripAcrossShapes)
{
    for (int d = 2; d < 9; ++d)
    {
        for (int k = 1; k <= d; ++k)
        {
            Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(30, d, -5, 5, 10 * d + k);

            for (auto &factory : decomposerFactories())
            {
                auto model = factory(k);
                Eigen::MatrixXd P = model->fit_transform(X).to_dense();
                Eigen::MatrixXd P_new = model->transform(X).to_dense();

                double relative = (P - P_new).norm() / std::max(P.norm(), 1.0);
                ASSERT_LT(relative, 1e-9) << model->name() << " d = " << d << " k = " << k;
            }
        }
    }
}

TEST(DecomposerContractTest, ReconstructsLowRankData)
{
    for (int k = 1; k < 5; ++k)
    {
        Eigen::MatrixXd X = DataGeneration::lowRankMatrix(40, 8, k, 0.0, k);

        for (auto &factory : decomposerFactories())
        {
            auto model = factory(k);
            Eigen::MatrixXd P = model->fit_transform(X).to_dense();
            Eigen::MatrixXd X_hat = P * model->components();

            ASSERT_NEAR((X - X_hat).norm() / X.norm(), 0.0, 1e-9) << model->name();
        }
    }
}

TEST(DecomposerContractTest, ComponentsAreOrthonormal)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(50, 6, -3, 3, 3);

    for (auto &factory : decomposerFactories())
    {
        auto model = factory(3);
        model->fit_transform(X);

        Eigen::MatrixXd QQt = model->components() * model->components().transpose();
        Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(3, 3);
        for (int i = 0; i < 3; ++i)
        {
            for (int j = 0; j < 3; ++j)
            {
                ASSERT_NEAR(QQt(i, j), identity(i, j), 1e-9);
            }
        }
    }
}

TEST(DecomposerContractTest, DifferentColumnCountIsShapeMismatch)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(100, 10, 0, 20, 4);
    Eigen::MatrixXd X_narrow = DataGeneration::randomIntegerMatrix(100, 9, 0, 20, 5);

    for (auto &factory : decomposerFactories())
    {
        auto model = factory(2);
        model->fit_transform(X);
        EXPECT_THROW(model->transform(X_narrow), ShapeMismatch) << model->name();
    }
}

TEST(DecomposerContractTest, ZeroRowsIsShapeMismatch)
{
    Eigen::MatrixXd X(0, 5);

    for (auto &factory : decomposerFactories())
    {
        auto model = factory(2);
        EXPECT_THROW(model->fit_transform(X), ShapeMismatch) << model->name();
        ASSERT_FALSE(model->is_fitted());
    }
}

TEST(DecomposerContractTest, RankAboveDataSizeIsShapeMismatch)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(20, 3, 0, 5, 6);

    for (auto &factory : decomposerFactories())
    {
        auto model = factory(4);
        EXPECT_THROW(model->fit_transform(X), ShapeMismatch) << model->name();
    }
}

TEST(DecomposerContractTest, SparseInputMatchesDense)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(60, 8, 0, 3, 7);
    Matrix sparse(Matrix(X).to_sparse());

    for (auto &factory : decomposerFactories())
    {
        auto denseModel = factory(3);
        auto sparseModel = factory(3);

        Eigen::MatrixXd P_dense = denseModel->fit_transform(X).to_dense();
        Eigen::MatrixXd P_sparse = sparseModel->fit_transform(sparse).to_dense();

        // Singular vectors are unique up to sign, compare |P|
        ASSERT_NEAR((P_dense.cwiseAbs() - P_sparse.cwiseAbs()).norm(), 0.0, 1e-8);
        ASSERT_NEAR((denseModel->transform(sparse).to_dense() - P_dense).norm(), 0.0, 1e-8);
    }
}

TEST(DecomposerContractTest, TransformProjectsNewDataOntoComponents)
{
    Eigen::MatrixXd X = DataGeneration::lowRankMatrix(40, 6, 2, 0.0, 8);

    TruncatedSVD svd(TruncatedSVDConfig{2});
    svd.fit_transform(X);

    // New rows from the same row space are reproduced exactly
    Eigen::MatrixXd coefficients = DataGeneration::randomIntegerMatrix(5, 2, -3, 3, 9);
    Eigen::MatrixXd X_new = coefficients * svd.components();

    Eigen::MatrixXd P_new = svd.transform(X_new).to_dense();
    ASSERT_NEAR((P_new - coefficients).norm(), 0.0, 1e-9);
}

TEST(TruncatedSVDTest, ExplainedVarianceIsSortedAndBounded)
{
    Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(80, 7, -4, 4, 11);

    TruncatedSVD svd(TruncatedSVDConfig{7});
    svd.fit_transform(X);

    Eigen::VectorXd ratio = svd.explained_variance_ratio();
    ASSERT_EQ(ratio.size(), 7);
    ASSERT_NEAR(ratio.sum(), 1.0, 1e-9);
    for (int i = 1; i < ratio.size(); ++i)
    {
        ASSERT_LE(ratio(i), ratio(i - 1) + 1e-12);
    }
    ASSERT_EQ(svd.kind(), ModelKind::Decomposer);
    ASSERT_FALSE(svd.is_online());
}

TEST(TruncatedSVDTest, NonPositiveRankIsRejected)
{
    EXPECT_THROW(std::make_unique<TruncatedSVD>(TruncatedSVDConfig{0}), std::invalid_argument);
    EXPECT_THROW(std::make_unique<IncrementalSVD>(IncrementalSVDConfig{-1}), std::invalid_argument);
}
