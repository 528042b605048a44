#include <Eigen/Core>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/data_generation.hpp"
#include "core/dispatch.hpp"
#include "core/pipeline.hpp"
#include "models/linear_regression.hpp"
#include "models/logistic_regression.hpp"
#include "models/standard_scaler.hpp"
#include "models/truncated_svd.hpp"

int rows = 100;       // Observations
int cols = 10;        // Features
int rank = 2;         // Components kept by the decomposition
unsigned int seed = 42;

int integer_lo = 0;
int integer_hi = 20;

void parseArguments(int argc, char **argv)
{
    // Positional overrides: rows cols rank seed
    if (argc > 1)
        rows = std::stoi(argv[1]);
    if (argc > 2)
        cols = std::stoi(argv[2]);
    if (argc > 3)
        rank = std::stoi(argv[3]);
    if (argc > 4)
        seed = static_cast<unsigned int>(std::stoul(argv[4]));
}

void runDecomposition(const Eigen::MatrixXd &X)
{
    TruncatedSVD svd(TruncatedSVDConfig{rank});

    Matrix P = svd.fit_transform(X);
    Matrix P_new = svd.transform(X);

    std::cout << "[DECOMPOSITION]" << std::endl;
    std::cout << "P: " << P.rows() << " x " << P.cols() << ", Q: " << svd.components().rows() << " x " << svd.components().cols() << std::endl;
    std::cout << "Explained variance ratio: " << svd.explained_variance_ratio().transpose() << std::endl;
    std::cout << "max |fit_transform - transform|: " << (P.dense() - P_new.dense()).cwiseAbs().maxCoeff() << std::endl;
}

void runPipeline(const Eigen::MatrixXd &X, const Eigen::VectorXd &y)
{
    Pipeline pipeline;
    pipeline.add(std::make_unique<StandardScaler>())
        .add(std::make_unique<TruncatedSVD>(TruncatedSVDConfig{rank}))
        .set_estimator(std::make_unique<LinearRegression>());

    pipeline.fit(X, y);
    Eigen::VectorXd direct = pipeline.predict(X);
    Eigen::VectorXd subjectFirst = Dispatch::predict(X, Dispatch::fit(X, y, pipeline));

    std::cout << "[PIPELINE] StandardScaler -> TruncatedSVD(" << rank << ") -> LinearRegression" << std::endl;
    std::cout << "Predictions: " << direct.size() << std::endl;
    std::cout << "MSE: " << pipeline.MSE(X, y) << ", R2: " << pipeline.R2(X, y) << std::endl;
    std::cout << "max |direct - subject-first|: " << (direct - subjectFirst).cwiseAbs().maxCoeff() << std::endl;
}

void runClassifier(const Eigen::MatrixXd &X, const Eigen::VectorXd &y)
{
    LogisticRegression classifier;
    Eigen::VectorXd labels = Dispatch::predict(X, Dispatch::fit(X, y, classifier));

    std::cout << "[CLASSIFIER] LogisticRegression" << std::endl;
    std::cout << "Iterations: " << classifier.iterations() << std::endl;
    std::cout << "Training accuracy: " << classifier.accuracy(X, y) << " (" << labels.size() << " labels)" << std::endl;
}

int main(int argc, char **argv)
{
    try
    {
        parseArguments(argc, argv);

        Eigen::MatrixXd X = DataGeneration::randomIntegerMatrix(rows, cols, integer_lo, integer_hi, seed);
        Eigen::VectorXd y = DataGeneration::binaryLabels(rows, seed + 1);

        std::cout << "Data: " << rows << " x " << cols << ", seed " << seed << std::endl;

        runDecomposition(X);
        std::cout << "--------------------------------" << std::endl;
        runPipeline(X, y);
        std::cout << "--------------------------------" << std::endl;
        runClassifier(X, y);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
