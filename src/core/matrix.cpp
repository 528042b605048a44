#include "core/matrix.hpp"
#include "core/errors.hpp"

#include <Eigen/SparseCore>

std::string to_string(MatrixFormat format)
{
    switch (format)
    {
    case MatrixFormat::Dense:
        return "dense";
    case MatrixFormat::Sparse:
        return "sparse";
    }
    return "unknown";
}

MatrixFormat Matrix::format() const
{
    if (is_dense())
        return MatrixFormat::Dense;
    if (is_sparse())
        return MatrixFormat::Sparse;
    throw TypeMismatch("Matrix::format(): Matrix holds neither a dense nor a sparse representation.");
}

Eigen::Index Matrix::rows() const
{
    if (is_dense())
        return std::get<DenseMatrix>(data).rows();
    if (is_sparse())
        return std::get<SparseMatrix>(data).rows();
    throw TypeMismatch("Matrix::rows(): Matrix holds neither a dense nor a sparse representation.");
}

Eigen::Index Matrix::cols() const
{
    if (is_dense())
        return std::get<DenseMatrix>(data).cols();
    if (is_sparse())
        return std::get<SparseMatrix>(data).cols();
    throw TypeMismatch("Matrix::cols(): Matrix holds neither a dense nor a sparse representation.");
}

const DenseMatrix &Matrix::dense() const
{
    if (!is_dense())
    {
        throw TypeMismatch("Matrix::dense(): Matrix does not hold a dense representation.");
    }
    return std::get<DenseMatrix>(data);
}

const SparseMatrix &Matrix::sparse() const
{
    if (!is_sparse())
    {
        throw TypeMismatch("Matrix::sparse(): Matrix does not hold a sparse representation.");
    }
    return std::get<SparseMatrix>(data);
}

DenseMatrix Matrix::to_dense() const
{
    if (is_dense())
        return std::get<DenseMatrix>(data);
    if (is_sparse())
        return DenseMatrix(std::get<SparseMatrix>(data));
    throw TypeMismatch("Matrix::to_dense(): Matrix holds neither a dense nor a sparse representation.");
}

SparseMatrix Matrix::to_sparse() const
{
    if (is_sparse())
        return std::get<SparseMatrix>(data);
    if (is_dense())
    {
        // Exact zeros are dropped, everything else is stored
        SparseMatrix S = std::get<DenseMatrix>(data).sparseView();
        S.makeCompressed();
        return S;
    }
    throw TypeMismatch("Matrix::to_sparse(): Matrix holds neither a dense nor a sparse representation.");
}

Matrix Matrix::converted(MatrixFormat target) const
{
    if (format() == target)
        return *this;
    if (target == MatrixFormat::Dense)
        return Matrix(to_dense());
    return Matrix(to_sparse());
}

namespace MatrixConversion
{
    Matrix convert_input(const Matrix &x, const FormatSupport &support, const std::string &where)
    {
        if (x.empty())
        {
            throw TypeMismatch(where + ": Input is neither a dense nor a sparse matrix.");
        }

        MatrixFormat format = x.format();
        if (!support.accepts(format))
        {
            throw UnsupportedFormatError(where + ": " + to_string(format) + " input is not accepted by this model.");
        }

        if (!support.preferred.has_value() || format == *support.preferred || !support.accepts(*support.preferred))
        {
            return x;
        }
        return x.converted(*support.preferred);
    }
}
