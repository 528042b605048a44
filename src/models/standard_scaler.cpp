#include "models/standard_scaler.hpp"

std::unique_ptr<Model> StandardScaler::clone() const
{
    return std::make_unique<StandardScaler>(*this);
}

void StandardScaler::reset()
{
    OnlineTransformer::reset();
    mu.reset();
    M2.reset();
    count = 0;
}

Matrix StandardScaler::fit_transform(const Matrix &X)
{
    Matrix input = prepare_fit_input(X, "StandardScaler::fit_transform(X)");

    reset();
    partial_fit(input);
    return transform(input);
}

void StandardScaler::partial_fit(const Matrix &X)
{
    Matrix input = prepare_partial_input(X, "StandardScaler::partial_fit(X)");
    const DenseMatrix &D = input.dense();

    const double n_b = static_cast<double>(D.rows());
    Eigen::VectorXd mean_b = D.colwise().mean().transpose();
    Eigen::VectorXd M2_b = (D.rowwise() - mean_b.transpose()).colwise().squaredNorm().transpose();

    if (!mu.has_value())
    {
        mu = mean_b;
        M2 = M2_b;
    }
    else
    {
        // Chan et al. pairwise update
        const double n_a = static_cast<double>(count);
        const double n = n_a + n_b;
        Eigen::VectorXd delta = mean_b - *mu;
        *mu += delta * (n_b / n);
        *M2 += M2_b + delta.cwiseAbs2() * (n_a * n_b / n);
    }

    count += D.rows();
    n_cols = D.cols();
}

Matrix StandardScaler::transform(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, "StandardScaler::transform(X)");

    DenseMatrix Z = input.dense();
    if (config.with_mean)
        Z.rowwise() -= mu->transpose();
    if (config.with_std)
        Z.array().rowwise() /= scale().transpose().array();

    return Matrix(Z);
}

Matrix StandardScaler::inverse_transform(const Matrix &X) const
{
    Matrix input = prepare_apply_input(X, "StandardScaler::inverse_transform(X)");

    DenseMatrix Z = input.dense();
    if (config.with_std)
        Z.array().rowwise() *= scale().transpose().array();
    if (config.with_mean)
        Z.rowwise() += mu->transpose();

    return Matrix(Z);
}

const Eigen::VectorXd &StandardScaler::mean() const
{
    if (!mu.has_value())
    {
        throw NotFittedError("StandardScaler::mean(): Model has not been fitted yet.");
    }
    return *mu;
}

Eigen::VectorXd StandardScaler::variance() const
{
    if (!M2.has_value())
    {
        throw NotFittedError("StandardScaler::variance(): Model has not been fitted yet.");
    }
    return *M2 / static_cast<double>(count);
}

Eigen::VectorXd StandardScaler::scale() const
{
    Eigen::VectorXd s = variance().cwiseSqrt();
    for (Eigen::Index j = 0; j < s.size(); ++j)
    {
        if (s(j) == 0.0)
            s(j) = 1.0;
    }
    return s;
}
