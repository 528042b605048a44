#include "models/incremental_svd.hpp"

#include <Eigen/SVD>
#include <stdexcept>

IncrementalSVD::IncrementalSVD(const IncrementalSVDConfig &config) : config(config)
{
    if (config.rank <= 0)
    {
        throw std::invalid_argument("IncrementalSVD: rank must be positive, got " + std::to_string(config.rank));
    }
}

std::unique_ptr<Model> IncrementalSVD::clone() const
{
    return std::make_unique<IncrementalSVD>(*this);
}

void IncrementalSVD::reset()
{
    OnlineDecomposer::reset();
    sigma.reset();
    count = 0;
}

Matrix IncrementalSVD::fit_transform(const Matrix &X)
{
    Matrix input = prepare_fit_input(X, "IncrementalSVD::fit_transform(X)");
    check_first_batch(input, "IncrementalSVD::fit_transform(X)");

    reset();
    partial_fit(input);
    return Matrix(project(input));
}

void IncrementalSVD::partial_fit(const Matrix &X)
{
    Matrix input = prepare_partial_input(X, "IncrementalSVD::partial_fit(X)");
    const DenseMatrix &D = input.dense();

    const Eigen::Index k = config.rank;

    // Later batches may be as small as one row, the stacked history supplies the other k
    Eigen::MatrixXd stacked;
    if (!Q.has_value())
    {
        check_first_batch(input, "IncrementalSVD::partial_fit(X)");
        stacked = D;
    }
    else
    {
        // Σ_k Q reproduces the Gram matrix of everything seen so far up to rank k
        stacked = Eigen::MatrixXd(k + D.rows(), D.cols());
        stacked.topRows(k) = sigma->asDiagonal() * (*Q);
        stacked.bottomRows(D.rows()) = D;
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(stacked, Eigen::ComputeThinV);

    sigma = svd.singularValues().head(k);
    Q = svd.matrixV().leftCols(k).transpose();
    count += D.rows();
    n_cols = D.cols();
}

void IncrementalSVD::check_first_batch(const Matrix &X, const std::string &where) const
{
    const Eigen::Index k = config.rank;
    if (X.rows() < k || X.cols() < k)
    {
        throw ShapeMismatch(where + ": The first batch needs at least rank = " + std::to_string(k) + " rows and columns, got " + std::to_string(X.rows()) + " x " + std::to_string(X.cols()));
    }
}

const Eigen::VectorXd &IncrementalSVD::singular_values() const
{
    if (!sigma.has_value())
    {
        throw NotFittedError("IncrementalSVD::singular_values(): Model has not been fitted yet.");
    }
    return *sigma;
}
