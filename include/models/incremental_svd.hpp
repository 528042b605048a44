#pragma once

#include <Eigen/Core>
#include <memory>
#include <optional>

#include "core/model.hpp"

struct IncrementalSVDConfig
{
    Eigen::Index rank = 2;
};

// Rank-k SVD kept up to date batch by batch. Every partial_fit stacks the
// compressed history Σ_k Q on top of the new rows and refactors, keeping the
// top k components. No mean centering. The first batch needs at least `rank`
// rows and columns, later ones any number of rows.
class IncrementalSVD : public OnlineDecomposer
{
public:
    explicit IncrementalSVD(const IncrementalSVDConfig &config = {});

    Matrix fit_transform(const Matrix &X) override;
    void partial_fit(const Matrix &X) override;

    std::unique_ptr<Model> clone() const override;
    std::string name() const override { return "IncrementalSVD"; }
    FormatSupport format_support() const override { return FormatSupport::both(MatrixFormat::Dense); }
    Eigen::Index rank() const override { return config.rank; }

    void reset() override;

    const Eigen::VectorXd &singular_values() const;
    Eigen::Index samples_seen() const { return count; }

private:
    const IncrementalSVDConfig config;

    std::optional<Eigen::VectorXd> sigma;
    Eigen::Index count = 0;

    void check_first_batch(const Matrix &X, const std::string &where) const;
};
