#include "runtime/matrix_ops.h"

#include <cmath>
#include <utility>

#include "runtime/runtime_error.h"

namespace dlscript::runtime {

namespace {
constexpr double kSingularEpsilon = 1e-12;

void RequireSameShape(const Matrix& a, const Matrix& b, const char* op, int line, int column) {
  if (!a.SameShape(b)) {
    throw RuntimeError(RuntimeErrorKind::kShape,
                       std::string(op) + " shape mismatch: " + a.ShapeString() + " vs " +
                           b.ShapeString(),
                       line, column);
  }
}
}  // namespace

Matrix Transpose(const Matrix& m) {
  Matrix out(m.cols, m.rows);
  for (size_t r = 0; r < m.rows; ++r) {
    for (size_t c = 0; c < m.cols; ++c) {
      out.at(c, r) = m.at(r, c);
    }
  }
  return out;
}

// Gauss-Jordan elimination with partial pivoting on [m | I].
Matrix Inverse(const Matrix& m, int line, int column) {
  if (m.rows != m.cols || m.rows == 0) {
    throw RuntimeError(RuntimeErrorKind::kShape,
                       "inverse requires a non-empty square matrix, got " + m.ShapeString(), line,
                       column);
  }
  const size_t n = m.rows;
  Matrix work = m;
  Matrix inv(n, n);
  for (size_t i = 0; i < n; ++i) inv.at(i, i) = 1.0;

  for (size_t col = 0; col < n; ++col) {
    size_t pivot = col;
    for (size_t r = col + 1; r < n; ++r) {
      if (std::fabs(work.at(r, col)) > std::fabs(work.at(pivot, col))) pivot = r;
    }
    if (std::fabs(work.at(pivot, col)) < kSingularEpsilon) {
      throw RuntimeError(RuntimeErrorKind::kShape, "inverse of a singular matrix", line, column);
    }
    if (pivot != col) {
      for (size_t c = 0; c < n; ++c) {
        std::swap(work.at(pivot, c), work.at(col, c));
        std::swap(inv.at(pivot, c), inv.at(col, c));
      }
    }
    const double scale = work.at(col, col);
    for (size_t c = 0; c < n; ++c) {
      work.at(col, c) /= scale;
      inv.at(col, c) /= scale;
    }
    for (size_t r = 0; r < n; ++r) {
      if (r == col) continue;
      const double factor = work.at(r, col);
      if (factor == 0.0) continue;
      for (size_t c = 0; c < n; ++c) {
        work.at(r, c) -= factor * work.at(col, c);
        inv.at(r, c) -= factor * inv.at(col, c);
      }
    }
  }
  return inv;
}

Matrix MatMult(const Matrix& a, const Matrix& b, int line, int column) {
  if (a.cols != b.rows) {
    throw RuntimeError(RuntimeErrorKind::kShape,
                       "matmult shape mismatch: " + a.ShapeString() + " vs " + b.ShapeString(),
                       line, column);
  }
  Matrix out(a.rows, b.cols);
  for (size_t i = 0; i < a.rows; ++i) {
    for (size_t k = 0; k < a.cols; ++k) {
      const double lhs = a.at(i, k);
      for (size_t j = 0; j < b.cols; ++j) {
        out.at(i, j) += lhs * b.at(k, j);
      }
    }
  }
  return out;
}

Matrix MatAdd(const Matrix& a, const Matrix& b, int line, int column) {
  RequireSameShape(a, b, "matadd", line, column);
  Matrix out = a;
  for (size_t i = 0; i < out.data.size(); ++i) out.data[i] += b.data[i];
  return out;
}

Matrix MatSub(const Matrix& a, const Matrix& b, int line, int column) {
  RequireSameShape(a, b, "matsub", line, column);
  Matrix out = a;
  for (size_t i = 0; i < out.data.size(); ++i) out.data[i] -= b.data[i];
  return out;
}

}  // namespace dlscript::runtime
