#include "runtime/value.h"

#include <iomanip>
#include <sstream>

namespace dlscript::runtime {

const char* ValueKindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNone:
      return "none";
    case ValueKind::kNumber:
      return "number";
    case ValueKind::kString:
      return "string";
    case ValueKind::kList:
      return "list";
    case ValueKind::kMatrix:
      return "matrix";
    case ValueKind::kFunction:
      return "function";
  }
  return "unknown";
}

std::string Matrix::ShapeString() const {
  return std::to_string(rows) + "x" + std::to_string(cols);
}

std::string FormatNumber(double value) {
  std::ostringstream oss;
  oss << std::setprecision(15) << value;
  return oss.str();
}

std::string Value::ToString() const {
  switch (kind) {
    case ValueKind::kNone:
      return "none";
    case ValueKind::kNumber:
      return FormatNumber(number);
    case ValueKind::kString:
      return "\"" + str + "\"";
    case ValueKind::kList: {
      std::ostringstream oss;
      oss << "[";
      for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << list[i].ToString();
      }
      oss << "]";
      return oss.str();
    }
    case ValueKind::kMatrix: {
      std::ostringstream oss;
      oss << "[";
      for (size_t r = 0; r < matrix.rows; ++r) {
        if (r > 0) oss << ", ";
        oss << "[";
        for (size_t c = 0; c < matrix.cols; ++c) {
          if (c > 0) oss << ", ";
          oss << FormatNumber(matrix.at(r, c));
        }
        oss << "]";
      }
      oss << "]";
      return oss.str();
    }
    case ValueKind::kFunction: {
      if (!function) return "<function>";
      return "<function " + function->name + "/" + std::to_string(function->parameters.size()) +
             ">";
    }
  }
  return "<unknown>";
}

std::string Value::DisplayString() const {
  if (kind == ValueKind::kString) {
    return str;
  }
  return ToString();
}

bool ValuesEqual(const Value& lhs, const Value& rhs) {
  if (lhs.kind != rhs.kind) {
    return false;
  }
  switch (lhs.kind) {
    case ValueKind::kNone:
      return true;
    case ValueKind::kNumber:
      return lhs.number == rhs.number;
    case ValueKind::kString:
      return lhs.str == rhs.str;
    case ValueKind::kList:
      if (lhs.list.size() != rhs.list.size()) return false;
      for (size_t i = 0; i < lhs.list.size(); ++i) {
        if (!ValuesEqual(lhs.list[i], rhs.list[i])) return false;
      }
      return true;
    case ValueKind::kMatrix:
      return lhs.matrix.SameShape(rhs.matrix) && lhs.matrix.data == rhs.matrix.data;
    case ValueKind::kFunction:
      return lhs.function == rhs.function;
  }
  return false;
}

bool IsTruthy(const Value& value) {
  switch (value.kind) {
    case ValueKind::kNone:
      return false;
    case ValueKind::kNumber:
      return value.number != 0.0;
    case ValueKind::kString:
      return !value.str.empty();
    case ValueKind::kList:
      return !value.list.empty();
    case ValueKind::kMatrix:
      return !value.matrix.data.empty();
    case ValueKind::kFunction:
      return true;
  }
  return false;
}

}  // namespace dlscript::runtime
