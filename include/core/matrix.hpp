#pragma once

#include <Eigen/Core>
#include <Eigen/SparseCore>
#include <optional>
#include <string>
#include <utility>
#include <variant>

using DenseMatrix = Eigen::MatrixXd;
using SparseMatrix = Eigen::SparseMatrix<double>; // Compressed sparse column

enum class MatrixFormat
{
    Dense,
    Sparse
};

std::string to_string(MatrixFormat format);

// A 2-D numeric array held either dense or sparse. Rows are observations,
// columns are features. A default-constructed Matrix holds nothing and every
// accessor on it throws TypeMismatch.
class Matrix
{
public:
    Matrix() = default;
    Matrix(DenseMatrix dense) : data(std::move(dense)) {}
    Matrix(SparseMatrix sparse) : data(std::move(sparse)) {}

    bool empty() const { return std::holds_alternative<std::monostate>(data); }
    bool is_dense() const { return std::holds_alternative<DenseMatrix>(data); }
    bool is_sparse() const { return std::holds_alternative<SparseMatrix>(data); }

    MatrixFormat format() const;

    Eigen::Index rows() const;
    Eigen::Index cols() const;

    // Access to the held representation, TypeMismatch if it is the other one.
    const DenseMatrix &dense() const;
    const SparseMatrix &sparse() const;

    // Conversions between the two representations (copies).
    DenseMatrix to_dense() const;
    SparseMatrix to_sparse() const;

    Matrix converted(MatrixFormat target) const;

private:
    std::variant<std::monostate, DenseMatrix, SparseMatrix> data;
};

// Which representations a model accepts and which one it computes on.
// Without a preferred format the input is used as it arrives.
struct FormatSupport
{
    bool accepts_dense = true;
    bool accepts_sparse = true;
    std::optional<MatrixFormat> preferred = MatrixFormat::Dense;

    bool accepts(MatrixFormat format) const
    {
        return format == MatrixFormat::Dense ? accepts_dense : accepts_sparse;
    }

    static FormatSupport dense_only() { return {true, false, MatrixFormat::Dense}; }
    static FormatSupport sparse_only() { return {false, true, MatrixFormat::Sparse}; }
    static FormatSupport both(MatrixFormat preferred) { return {true, true, preferred}; }
    static FormatSupport any() { return {true, true, std::nullopt}; }
};

namespace MatrixConversion
{
    // Input negotiation every model runs before touching data:
    //   empty x                     -> TypeMismatch
    //   format not in support       -> UnsupportedFormatError
    //   otherwise                   -> x converted to support.preferred, if any
    // `where` prefixes the error message, e.g. "TruncatedSVD::fit_transform(X)".
    Matrix convert_input(const Matrix &x, const FormatSupport &support, const std::string &where);
}
