#ifndef DLSCRIPT_RUNTIME_VALUE_H_
#define DLSCRIPT_RUNTIME_VALUE_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "parser/ast.h"

namespace dlscript::runtime {

class Environment;

enum class ValueKind { kNone, kNumber, kString, kList, kMatrix, kFunction };

const char* ValueKindName(ValueKind kind);

/// User function closure: shared body plus the environment it was defined in.
struct Function {
  std::string name;
  std::vector<std::string> parameters;
  std::shared_ptr<const parser::FunctionBody> body;
  std::shared_ptr<Environment> defining_env;
};

/// Rectangular row-major grid of doubles.
struct Matrix {
  size_t rows = 0;
  size_t cols = 0;
  std::vector<double> data;

  Matrix() = default;
  Matrix(size_t r, size_t c, double fill = 0.0) : rows(r), cols(c), data(r * c, fill) {}

  double& at(size_t r, size_t c) { return data[r * cols + c]; }
  double at(size_t r, size_t c) const { return data[r * cols + c]; }
  bool SameShape(const Matrix& other) const { return rows == other.rows && cols == other.cols; }
  /// "RxC".
  std::string ShapeString() const;
};

/// Runtime value. Values are never mutated after construction; operations build new ones.
struct Value {
  ValueKind kind = ValueKind::kNone;
  // Storage for different kinds; only the one matching `kind` is meaningful.
  double number = 0.0;
  std::string str;
  std::vector<Value> list;
  Matrix matrix;
  std::shared_ptr<Function> function;

  static Value None() { return Value{}; }
  static Value Number(double v) {
    Value val;
    val.kind = ValueKind::kNumber;
    val.number = v;
    return val;
  }
  static Value String(std::string v) {
    Value val;
    val.kind = ValueKind::kString;
    val.str = std::move(v);
    return val;
  }
  static Value List(std::vector<Value> elems) {
    Value val;
    val.kind = ValueKind::kList;
    val.list = std::move(elems);
    return val;
  }
  static Value MatrixValue(Matrix m) {
    Value val;
    val.kind = ValueKind::kMatrix;
    val.matrix = std::move(m);
    return val;
  }
  /// Convenience constructor for function values.
  static Value Func(std::shared_ptr<Function> fn) {
    Value val;
    val.kind = ValueKind::kFunction;
    val.function = std::move(fn);
    return val;
  }

  bool IsNumber() const { return kind == ValueKind::kNumber; }
  bool IsString() const { return kind == ValueKind::kString; }
  bool IsList() const { return kind == ValueKind::kList; }
  bool IsMatrix() const { return kind == ValueKind::kMatrix; }
  bool IsFunction() const { return kind == ValueKind::kFunction; }
  bool IsNone() const { return kind == ValueKind::kNone; }

  /// Formats the value for display in the REPL; strings are quoted.
  std::string ToString() const;
  /// Formats the value for print(): like ToString() but a top-level string is written raw.
  std::string DisplayString() const;
};

/// Structural equality; values of different kinds are never equal.
bool ValuesEqual(const Value& lhs, const Value& rhs);

/// Truthiness used by conditions without a comparison operator.
bool IsTruthy(const Value& value);

/// Formats a number the way the interpreter prints it ("3", "0.5", "1e+20").
std::string FormatNumber(double value);

}  // namespace dlscript::runtime

#endif  // DLSCRIPT_RUNTIME_VALUE_H_
