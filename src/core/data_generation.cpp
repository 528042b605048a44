#include "core/data_generation.hpp"

#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace DataGeneration
{
    Eigen::MatrixXd randomIntegerMatrix(int rows, int cols, int lo, int hi, unsigned int seed)
    {
        if (rows < 0 || cols < 0 || lo > hi)
        {
            throw std::invalid_argument("DataGeneration::randomIntegerMatrix: Invalid arguments (rows = " + std::to_string(rows) + ", cols = " + std::to_string(cols) + ", lo = " + std::to_string(lo) + ", hi = " + std::to_string(hi) + ")");
        }

        std::mt19937 generator(seed);
        std::uniform_int_distribution<int> dist(lo, hi);

        Eigen::MatrixXd X(rows, cols);
        for (int i = 0; i < rows; ++i)
        {
            for (int j = 0; j < cols; ++j)
            {
                X(i, j) = static_cast<double>(dist(generator));
            }
        }
        return X;
    }

    Eigen::VectorXd binaryLabels(int rows, unsigned int seed)
    {
        std::mt19937 generator(seed);
        std::bernoulli_distribution coin(0.5);

        Eigen::VectorXd y(rows);
        for (int i = 0; i < rows; ++i)
        {
            y(i) = coin(generator) ? 1.0 : 0.0;
        }
        return y;
    }

    Eigen::VectorXd linearTargets(const Eigen::MatrixXd &X, const Eigen::VectorXd &w, double b, double noise, unsigned int seed)
    {
        if (X.cols() != w.size())
        {
            throw std::invalid_argument("DataGeneration::linearTargets: Dimension mismatch between X.cols() = " + std::to_string(X.cols()) + " and w.size() = " + std::to_string(w.size()));
        }

        std::mt19937 generator(seed);
        std::normal_distribution<double> gaussianDist(0.0, noise > 0.0 ? noise : 1.0);

        Eigen::VectorXd y = X * w;
        y.array() += b;
        if (noise > 0.0)
        {
            for (Eigen::Index i = 0; i < y.size(); ++i)
            {
                y(i) += gaussianDist(generator);
            }
        }
        return y;
    }

    Eigen::MatrixXd lowRankMatrix(int rows, int cols, int rank, double noise, unsigned int seed)
    {
        if (rank <= 0 || rank > rows || rank > cols)
        {
            throw std::invalid_argument("DataGeneration::lowRankMatrix: rank = " + std::to_string(rank) + " must lie in [1, min(rows, cols)]");
        }

        std::mt19937 generator(seed);
        std::normal_distribution<double> gaussianDist(0.0, 1.0);

        Eigen::MatrixXd left(rows, rank);
        Eigen::MatrixXd right(rank, cols);
        for (int i = 0; i < left.size(); ++i)
            left(i) = gaussianDist(generator);
        for (int i = 0; i < right.size(); ++i)
            right(i) = gaussianDist(generator);

        Eigen::MatrixXd X = left * right;
        if (noise > 0.0)
        {
            for (int i = 0; i < X.size(); ++i)
                X(i) += noise * gaussianDist(generator);
        }
        return X;
    }

    Eigen::SparseMatrix<double> sparsify(const Eigen::MatrixXd &dense, double density, unsigned int seed)
    {
        if (density < 0.0 || density > 1.0)
        {
            throw std::invalid_argument("DataGeneration::sparsify: density must lie in [0, 1], got " + std::to_string(density));
        }

        std::mt19937 generator(seed);
        std::bernoulli_distribution keep(density);

        std::vector<Eigen::Triplet<double>> triplets;
        for (Eigen::Index j = 0; j < dense.cols(); ++j)
        {
            for (Eigen::Index i = 0; i < dense.rows(); ++i)
            {
                if (keep(generator) && dense(i, j) != 0.0)
                {
                    triplets.emplace_back(static_cast<int>(i), static_cast<int>(j), dense(i, j));
                }
            }
        }

        Eigen::SparseMatrix<double> S(dense.rows(), dense.cols());
        S.setFromTriplets(triplets.begin(), triplets.end());
        S.makeCompressed();
        return S;
    }
}
