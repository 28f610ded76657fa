#include "parser/ast.h"

namespace dlscript::parser {

const char* BinaryOpSymbol(BinaryOp op) {
  switch (op) {
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSub:
      return "-";
    case BinaryOp::kMul:
      return "*";
    case BinaryOp::kDiv:
      return "/";
    case BinaryOp::kMod:
      return "%";
    case BinaryOp::kPow:
      return "^";
  }
  return "?";
}

const char* TrigFuncName(TrigFunc func) {
  switch (func) {
    case TrigFunc::kSin:
      return "sin";
    case TrigFunc::kCos:
      return "cos";
    case TrigFunc::kTan:
      return "tan";
    case TrigFunc::kSqrt:
      return "sqrt";
  }
  return "?";
}

const char* MatrixOpName(MatrixOpKind kind) {
  switch (kind) {
    case MatrixOpKind::kTranspose:
      return "transpose";
    case MatrixOpKind::kInverse:
      return "inverse";
    case MatrixOpKind::kMatMult:
      return "matmult";
    case MatrixOpKind::kMatAdd:
      return "matadd";
    case MatrixOpKind::kMatSub:
      return "matsub";
  }
  return "?";
}

const char* RelOpSymbol(RelOp op) {
  switch (op) {
    case RelOp::kEq:
      return "==";
    case RelOp::kNe:
      return "!=";
    case RelOp::kLt:
      return "<";
    case RelOp::kLe:
      return "<=";
    case RelOp::kGt:
      return ">";
    case RelOp::kGe:
      return ">=";
  }
  return "?";
}

}  // namespace dlscript::parser
