#pragma once

#include <Eigen/Core>
#include <Eigen/SparseCore>

// Synthetic data for tests and the demo. Every generator takes an explicit
// seed, equal seeds give equal data.
namespace DataGeneration
{
    // Uniform integers in [lo, hi], stored as doubles
    Eigen::MatrixXd randomIntegerMatrix(int rows, int cols, int lo, int hi, unsigned int seed);

    // Fair coin 0 / 1 labels
    Eigen::VectorXd binaryLabels(int rows, unsigned int seed);

    // y = X w + b + gaussian noise
    Eigen::VectorXd linearTargets(const Eigen::MatrixXd &X, const Eigen::VectorXd &w, double b, double noise, unsigned int seed);

    // Gaussian factors multiplied out to an exactly rank-`rank` matrix, plus gaussian noise
    Eigen::MatrixXd lowRankMatrix(int rows, int cols, int rank, double noise, unsigned int seed);

    // Keeps each entry with probability `density`, zeroes the rest
    Eigen::SparseMatrix<double> sparsify(const Eigen::MatrixXd &dense, double density, unsigned int seed);
}
