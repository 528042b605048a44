#pragma once

#include <Eigen/Core>
#include <memory>
#include <optional>

#include "core/model.hpp"

struct TruncatedSVDConfig
{
    Eigen::Index rank = 2; // Number of components kept
};

// Rank-k SVD, X ≈ (U_k Σ_k) V_k^T. fit_transform returns U_k Σ_k and keeps
// Q = V_k^T, which has orthonormal rows. Sparse input is densified.
class TruncatedSVD : public Decomposer
{
public:
    explicit TruncatedSVD(const TruncatedSVDConfig &config = {});

    Matrix fit_transform(const Matrix &X) override;

    std::unique_ptr<Model> clone() const override;
    std::string name() const override { return "TruncatedSVD"; }
    FormatSupport format_support() const override { return FormatSupport::both(MatrixFormat::Dense); }
    Eigen::Index rank() const override { return config.rank; }

    void reset() override;

    const Eigen::VectorXd &singular_values() const;
    Eigen::VectorXd explained_variance_ratio() const;

private:
    const TruncatedSVDConfig config;

    std::optional<Eigen::VectorXd> sigma;
    std::optional<double> total_energy; // ||X||_F^2 of the fitted data
};
