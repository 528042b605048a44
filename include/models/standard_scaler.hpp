#pragma once

#include <Eigen/Core>
#include <memory>
#include <optional>

#include "core/model.hpp"

struct StandardScalerConfig
{
    bool with_mean = true;
    bool with_std = true;
};

// Per-column standardization. Batches are merged with the pairwise
// mean / variance update, so partial_fit over batches equals one fit.
// Dense input only, centering would fill a sparse matrix anyway.
class StandardScaler : public OnlineTransformer
{
public:
    explicit StandardScaler(const StandardScalerConfig &config = {}) : config(config) {}

    Matrix fit_transform(const Matrix &X) override;
    void partial_fit(const Matrix &X) override;
    Matrix transform(const Matrix &X) const override;
    Matrix inverse_transform(const Matrix &X) const;

    std::unique_ptr<Model> clone() const override;
    std::string name() const override { return "StandardScaler"; }
    FormatSupport format_support() const override { return FormatSupport::dense_only(); }

    void reset() override;

    const Eigen::VectorXd &mean() const;
    Eigen::VectorXd variance() const;
    Eigen::VectorXd scale() const; // sqrt(variance), 1 for constant columns
    Eigen::Index samples_seen() const { return count; }

private:
    const StandardScalerConfig config;

    std::optional<Eigen::VectorXd> mu;
    std::optional<Eigen::VectorXd> M2; // Sum of squared deviations from mu
    Eigen::Index count = 0;
};
