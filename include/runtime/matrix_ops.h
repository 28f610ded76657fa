#ifndef DLSCRIPT_RUNTIME_MATRIX_OPS_H_
#define DLSCRIPT_RUNTIME_MATRIX_OPS_H_

#include "runtime/value.h"

namespace dlscript::runtime {

// Shape-checked matrix kernels. Each throws RuntimeError{kShape} at (line, column) when the
// operands are incompatible.

Matrix Transpose(const Matrix& m);
Matrix Inverse(const Matrix& m, int line, int column);
Matrix MatMult(const Matrix& a, const Matrix& b, int line, int column);
Matrix MatAdd(const Matrix& a, const Matrix& b, int line, int column);
Matrix MatSub(const Matrix& a, const Matrix& b, int line, int column);

}  // namespace dlscript::runtime

#endif  // DLSCRIPT_RUNTIME_MATRIX_OPS_H_
