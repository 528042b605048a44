#include "models/truncated_svd.hpp"

#include <Eigen/SVD>
#include <algorithm>
#include <stdexcept>

TruncatedSVD::TruncatedSVD(const TruncatedSVDConfig &config) : config(config)
{
    if (config.rank <= 0)
    {
        throw std::invalid_argument("TruncatedSVD: rank must be positive, got " + std::to_string(config.rank));
    }
}

std::unique_ptr<Model> TruncatedSVD::clone() const
{
    return std::make_unique<TruncatedSVD>(*this);
}

void TruncatedSVD::reset()
{
    Decomposer::reset();
    sigma.reset();
    total_energy.reset();
}

Matrix TruncatedSVD::fit_transform(const Matrix &X)
{
    Matrix input = prepare_fit_input(X, "TruncatedSVD::fit_transform(X)");
    const DenseMatrix &D = input.dense();

    const Eigen::Index k = config.rank;
    if (k > std::min(D.rows(), D.cols()))
    {
        throw ShapeMismatch("TruncatedSVD::fit_transform(X): rank = " + std::to_string(k) + " exceeds min(X.rows(), X.cols()) = " + std::to_string(std::min(D.rows(), D.cols())));
    }

    reset();

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(D, Eigen::ComputeThinU | Eigen::ComputeThinV);

    // Singular values come sorted in decreasing order
    Eigen::VectorXd s = svd.singularValues().head(k);
    DenseMatrix P = svd.matrixU().leftCols(k) * s.asDiagonal();

    Q = svd.matrixV().leftCols(k).transpose();
    sigma = s;
    total_energy = D.squaredNorm();
    n_cols = D.cols();

    return Matrix(P);
}

const Eigen::VectorXd &TruncatedSVD::singular_values() const
{
    if (!sigma.has_value())
    {
        throw NotFittedError("TruncatedSVD::singular_values(): Model has not been fitted yet.");
    }
    return *sigma;
}

Eigen::VectorXd TruncatedSVD::explained_variance_ratio() const
{
    const Eigen::VectorXd &s = singular_values();
    if (*total_energy == 0.0)
    {
        return Eigen::VectorXd::Zero(s.size());
    }
    return s.cwiseAbs2() / *total_energy;
}
