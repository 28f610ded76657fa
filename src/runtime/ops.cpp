#include "runtime/ops.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "runtime/matrix_ops.h"

namespace dlscript::runtime {

namespace {

std::string Describe(const Value& v) {
  return ValueKindName(v.kind);
}

double RequireNumber(const Value& v, const std::string& context, int line, int column) {
  if (!v.IsNumber()) {
    throw RuntimeError(RuntimeErrorKind::kTypeMismatch,
                       context + " expects a number, got " + Describe(v), line, column);
  }
  return v.number;
}

Value Power(double base, double exponent, int line, int column) {
  if (base == 0.0 && exponent < 0.0) {
    throw RuntimeError(RuntimeErrorKind::kDomain, "zero raised to a negative power", line,
                       column);
  }
  double result = std::pow(base, exponent);
  if (std::isnan(result) && !std::isnan(base) && !std::isnan(exponent)) {
    throw RuntimeError(RuntimeErrorKind::kDomain,
                       "power " + FormatNumber(base) + " ^ " + FormatNumber(exponent) +
                           " is not a real number",
                       line, column);
  }
  return Value::Number(result);
}

bool Compare(parser::RelOp op, const Value& lhs, const Value& rhs, int line, int column) {
  using parser::RelOp;
  if (op == RelOp::kEq) return ValuesEqual(lhs, rhs);
  if (op == RelOp::kNe) return !ValuesEqual(lhs, rhs);
  int order = 0;
  if (lhs.IsNumber() && rhs.IsNumber()) {
    order = lhs.number < rhs.number ? -1 : (lhs.number > rhs.number ? 1 : 0);
    if (std::isnan(lhs.number) || std::isnan(rhs.number)) return false;
  } else if (lhs.IsString() && rhs.IsString()) {
    order = lhs.str.compare(rhs.str);
  } else {
    throw RuntimeError(RuntimeErrorKind::kTypeMismatch,
                       std::string("cannot order ") + Describe(lhs) + " and " + Describe(rhs) +
                           " with '" + parser::RelOpSymbol(op) + "'",
                       line, column);
  }
  switch (op) {
    case RelOp::kLt:
      return order < 0;
    case RelOp::kLe:
      return order <= 0;
    case RelOp::kGt:
      return order > 0;
    case RelOp::kGe:
      return order >= 0;
    default:
      break;
  }
  return false;
}

// True when `value` holds a function whose defining environment is `frame` or nested in it.
bool CapturesFrame(const Value& value, const Environment* frame) {
  if (value.IsFunction() && value.function) {
    for (const Environment* env = value.function->defining_env.get(); env != nullptr;
         env = env->parent().get()) {
      if (env == frame) return true;
    }
    return false;
  }
  if (value.IsList()) {
    for (const auto& elem : value.list) {
      if (CapturesFrame(elem, frame)) return true;
    }
  }
  return false;
}

// A function defined inside a call frame points back at that frame, so the frame has to drop
// its bindings on exit unless the result still needs them.
class CallFrameScope {
 public:
  explicit CallFrameScope(std::shared_ptr<Environment> frame) : frame_(std::move(frame)) {}
  ~CallFrameScope() {
    if (!keep_) frame_->Clear();
  }
  CallFrameScope(const CallFrameScope&) = delete;
  CallFrameScope& operator=(const CallFrameScope&) = delete;

  void KeepIfCaptured(const Value& result) { keep_ = CapturesFrame(result, frame_.get()); }

 private:
  std::shared_ptr<Environment> frame_;
  bool keep_ = false;
};

}  // namespace

Evaluator::Evaluator(std::shared_ptr<Environment> env, builtin::Dispatcher* dispatcher)
    : env_(std::move(env)), dispatcher_(dispatcher) {
  if (!env_) {
    env_ = std::make_shared<Environment>();
  }
}

std::optional<Value> Evaluator::ExecuteStatements(const parser::StatementList& statements) {
  std::optional<Value> last;
  for (const auto& stmt : statements) {
    last = EvaluateStatement(*stmt);
  }
  return last;
}

std::optional<Value> Evaluator::EvaluateStatement(const parser::Statement& stmt) {
  if (const auto* assign = dynamic_cast<const parser::AssignmentStatement*>(&stmt)) {
    return EvaluateAssignment(*assign);
  }
  if (const auto* expr_stmt = dynamic_cast<const parser::ExpressionStatement*>(&stmt)) {
    return Evaluate(*expr_stmt->expr);
  }
  if (const auto* if_stmt = dynamic_cast<const parser::IfStatement*>(&stmt)) {
    EvaluateIf(*if_stmt);
    return std::nullopt;
  }
  if (const auto* while_stmt = dynamic_cast<const parser::WhileStatement*>(&stmt)) {
    EvaluateWhile(*while_stmt);
    return std::nullopt;
  }
  if (const auto* for_stmt = dynamic_cast<const parser::ForStatement*>(&stmt)) {
    EvaluateFor(*for_stmt);
    return std::nullopt;
  }
  if (const auto* func = dynamic_cast<const parser::FunctionStatement*>(&stmt)) {
    EvaluateFunction(*func);
    return std::nullopt;
  }
  throw std::logic_error("Unknown statement type");
}

Value Evaluator::Evaluate(const parser::Expression& expr) {
  if (const auto* num = dynamic_cast<const parser::NumberLiteral*>(&expr)) {
    return Value::Number(num->value);
  }
  if (const auto* str_lit = dynamic_cast<const parser::StringLiteral*>(&expr)) {
    return Value::String(str_lit->value);
  }
  if (const auto* binary = dynamic_cast<const parser::BinaryExpression*>(&expr)) {
    return EvaluateBinary(*binary);
  }
  if (const auto* identifier = dynamic_cast<const parser::Identifier*>(&expr)) {
    return EvaluateIdentifier(*identifier);
  }
  if (const auto* call = dynamic_cast<const parser::CallExpression*>(&expr)) {
    return EvaluateCall(*call);
  }
  if (const auto* unary = dynamic_cast<const parser::UnaryExpression*>(&expr)) {
    return EvaluateUnary(*unary);
  }
  if (const auto* group = dynamic_cast<const parser::GroupingExpression*>(&expr)) {
    return Evaluate(*group->inner);
  }
  if (const auto* list = dynamic_cast<const parser::ListLiteral*>(&expr)) {
    return EvaluateList(*list);
  }
  if (const auto* matrix_op = dynamic_cast<const parser::MatrixOpExpression*>(&expr)) {
    return EvaluateMatrixOp(*matrix_op);
  }
  if (const auto* trig = dynamic_cast<const parser::TrigExpression*>(&expr)) {
    return EvaluateTrig(*trig);
  }
  throw std::logic_error("Unknown expression type");
}

bool Evaluator::EvaluateCondition(const parser::Condition& condition) {
  Value lhs = Evaluate(*condition.lhs);
  if (!condition.op.has_value()) {
    return IsTruthy(lhs);
  }
  Value rhs = Evaluate(*condition.rhs);
  return Compare(*condition.op, lhs, rhs, condition.line, condition.column);
}

Value Evaluator::EvaluateUnary(const parser::UnaryExpression& expr) {
  Value operand = Evaluate(*expr.operand);
  switch (expr.op) {
    case parser::UnaryOp::kNegate:
      return Value::Number(-RequireNumber(operand, "unary '-'", expr.line, expr.column));
  }
  throw std::logic_error("Unhandled unary operator");
}

Value Evaluator::EvaluateBinary(const parser::BinaryExpression& expr) {
  Value lhs = Evaluate(*expr.lhs);
  Value rhs = Evaluate(*expr.rhs);
  const std::string symbol = parser::BinaryOpSymbol(expr.op);
  if (expr.op == parser::BinaryOp::kAdd && lhs.IsString() && rhs.IsString()) {
    return Value::String(lhs.str + rhs.str);
  }
  if (!lhs.IsNumber() || !rhs.IsNumber()) {
    throw RuntimeError(RuntimeErrorKind::kTypeMismatch,
                       "operator '" + symbol + "' expects numbers, got " + Describe(lhs) +
                           " and " + Describe(rhs),
                       expr.line, expr.column);
  }
  const double a = lhs.number;
  const double b = rhs.number;
  switch (expr.op) {
    case parser::BinaryOp::kAdd:
      return Value::Number(a + b);
    case parser::BinaryOp::kSub:
      return Value::Number(a - b);
    case parser::BinaryOp::kMul:
      return Value::Number(a * b);
    case parser::BinaryOp::kDiv:
      if (b == 0.0) {
        throw RuntimeError(RuntimeErrorKind::kDivisionByZero, "Division by zero", expr.line,
                           expr.column);
      }
      return Value::Number(a / b);
    case parser::BinaryOp::kMod:
      if (b == 0.0) {
        throw RuntimeError(RuntimeErrorKind::kDivisionByZero, "Remainder by zero", expr.line,
                           expr.column);
      }
      return Value::Number(std::fmod(a, b));
    case parser::BinaryOp::kPow:
      return Power(a, b, expr.line, expr.column);
  }
  throw std::logic_error("Unhandled binary operator");
}

Value Evaluator::EvaluateTrig(const parser::TrigExpression& expr) {
  const std::string name = parser::TrigFuncName(expr.func);
  const double x = RequireNumber(Evaluate(*expr.argument), name, expr.line, expr.column);
  double result = 0.0;
  switch (expr.func) {
    case parser::TrigFunc::kSin:
      result = std::sin(x);
      break;
    case parser::TrigFunc::kCos:
      result = std::cos(x);
      break;
    case parser::TrigFunc::kTan:
      result = std::tan(x);
      break;
    case parser::TrigFunc::kSqrt:
      if (x < 0.0) {
        throw RuntimeError(RuntimeErrorKind::kDomain,
                           "sqrt of negative number " + FormatNumber(x), expr.line, expr.column);
      }
      result = std::sqrt(x);
      break;
  }
  if (std::isnan(result) && !std::isnan(x)) {
    throw RuntimeError(RuntimeErrorKind::kDomain, name + " is undefined at " + FormatNumber(x),
                       expr.line, expr.column);
  }
  return Value::Number(result);
}

Value Evaluator::EvaluateIdentifier(const parser::Identifier& identifier) {
  auto value = env_->Get(identifier.name);
  if (!value.has_value()) {
    throw RuntimeError(RuntimeErrorKind::kUndefinedVariable,
                       "Undefined variable: " + identifier.name, identifier.line,
                       identifier.column);
  }
  return value.value();
}

// Rows all bracketed -> matrix, rows all bare -> list, anything else is a shape error.
Value Evaluator::EvaluateList(const parser::ListLiteral& literal) {
  if (literal.rows.empty()) {
    return Value::List({});
  }
  size_t bracketed = 0;
  for (const auto& row : literal.rows) {
    if (row.bracketed) ++bracketed;
  }
  if (bracketed == 0) {
    std::vector<Value> elems;
    elems.reserve(literal.rows.size());
    for (const auto& row : literal.rows) {
      elems.push_back(Evaluate(*row.elements.front()));
    }
    return Value::List(std::move(elems));
  }
  if (bracketed != literal.rows.size()) {
    throw RuntimeError(RuntimeErrorKind::kShape,
                       "List literal mixes bracketed rows and bare elements", literal.line,
                       literal.column);
  }
  const size_t cols = literal.rows.front().elements.size();
  Matrix m(literal.rows.size(), cols);
  for (size_t r = 0; r < literal.rows.size(); ++r) {
    const auto& row = literal.rows[r];
    if (row.elements.size() != cols) {
      throw RuntimeError(RuntimeErrorKind::kShape,
                         "Matrix row " + std::to_string(r) + " has " +
                             std::to_string(row.elements.size()) + " elements, expected " +
                             std::to_string(cols),
                         row.line, row.column);
    }
    for (size_t c = 0; c < cols; ++c) {
      const auto& element = *row.elements[c];
      m.at(r, c) = RequireNumber(Evaluate(element), "matrix element", element.line,
                                 element.column);
    }
  }
  return Value::MatrixValue(std::move(m));
}

const Matrix& Evaluator::RequireMatrix(const Value& value,
                                       const parser::MatrixOpExpression& expr) {
  if (!value.IsMatrix()) {
    throw RuntimeError(RuntimeErrorKind::kTypeMismatch,
                       std::string(parser::MatrixOpName(expr.kind)) + " expects a matrix, got " +
                           Describe(value),
                       expr.line, expr.column);
  }
  return value.matrix;
}

Value Evaluator::EvaluateMatrixOp(const parser::MatrixOpExpression& expr) {
  std::vector<Value> operands;
  operands.reserve(expr.operands.size());
  for (const auto& operand : expr.operands) {
    operands.push_back(Evaluate(*operand));
  }
  const Matrix& a = RequireMatrix(operands[0], expr);
  switch (expr.kind) {
    case parser::MatrixOpKind::kTranspose:
      return Value::MatrixValue(Transpose(a));
    case parser::MatrixOpKind::kInverse:
      return Value::MatrixValue(Inverse(a, expr.line, expr.column));
    case parser::MatrixOpKind::kMatMult:
      return Value::MatrixValue(
          MatMult(a, RequireMatrix(operands[1], expr), expr.line, expr.column));
    case parser::MatrixOpKind::kMatAdd:
      return Value::MatrixValue(
          MatAdd(a, RequireMatrix(operands[1], expr), expr.line, expr.column));
    case parser::MatrixOpKind::kMatSub:
      return Value::MatrixValue(
          MatSub(a, RequireMatrix(operands[1], expr), expr.line, expr.column));
  }
  throw std::logic_error("Unhandled matrix operation");
}

Value Evaluator::EvaluateCall(const parser::CallExpression& call) {
  std::vector<Value> args;
  args.reserve(call.args.size());
  for (const auto& arg : call.args) {
    args.push_back(Evaluate(*arg));
  }
  if (call.category == parser::CallCategory::kUser) {
    return CallUser(call, std::move(args));
  }
  return CallBuiltin(call, std::move(args));
}

Value Evaluator::CallUser(const parser::CallExpression& call, std::vector<Value> args) {
  const std::string& name = call.callee;
  auto found = env_->Get(name);
  if (!found.has_value()) {
    throw RuntimeError(RuntimeErrorKind::kUndefinedFunction, "Undefined function: " + name,
                       call.line, call.column);
  }
  if (!found->IsFunction() || found->function == nullptr) {
    throw RuntimeError(RuntimeErrorKind::kTypeMismatch,
                       "'" + name + "' is a " + Describe(*found) + ", not a function", call.line,
                       call.column);
  }
  auto fn = found->function;
  if (fn->parameters.size() != args.size()) {
    throw RuntimeError(RuntimeErrorKind::kArity,
                       name + " expects " + std::to_string(fn->parameters.size()) +
                           " arguments, got " + std::to_string(args.size()),
                       call.line, call.column);
  }
  auto frame = std::make_shared<Environment>(fn->defining_env);
  for (size_t i = 0; i < args.size(); ++i) {
    frame->Define(fn->parameters[i], args[i]);
  }
  CallFrameScope scope(frame);
  Evaluator fn_evaluator(frame, dispatcher_);
  fn_evaluator.ExecuteStatements(fn->body->statements);
  Value result = fn_evaluator.Evaluate(*fn->body->return_expr);
  scope.KeepIfCaptured(result);
  return result;
}

Value Evaluator::CallBuiltin(const parser::CallExpression& call, std::vector<Value> args) {
  if (dispatcher_ == nullptr) {
    throw RuntimeError(util::Status::Unavailable("no dispatcher configured"),
                       call.callee + ": no dispatcher configured", call.line, call.column);
  }
  util::StatusOr<Value> result = dispatcher_->Dispatch(call.category, call.callee, args);
  if (!result.ok()) {
    throw RuntimeError(result.status(), call.callee + " failed: " + result.status().ToString(),
                       call.line, call.column);
  }
  return result.value();
}

void Evaluator::EvaluateIf(const parser::IfStatement& stmt) {
  if (EvaluateCondition(stmt.condition)) {
    ExecuteStatements(stmt.then_block);
  } else if (stmt.else_block.has_value()) {
    ExecuteStatements(*stmt.else_block);
  }
}

// No iteration cap: a loop whose condition never turns false runs until the host stops it.
void Evaluator::EvaluateWhile(const parser::WhileStatement& stmt) {
  while (EvaluateCondition(stmt.condition)) {
    ExecuteStatements(stmt.body);
  }
}

void Evaluator::EvaluateFor(const parser::ForStatement& stmt) {
  EvaluateAssignment(*stmt.init);
  while (EvaluateCondition(stmt.condition)) {
    ExecuteStatements(stmt.body);
    EvaluateAssignment(*stmt.step);
  }
}

void Evaluator::EvaluateFunction(const parser::FunctionStatement& stmt) {
  auto fn = std::make_shared<Function>();
  fn->name = stmt.name;
  fn->parameters = stmt.parameters;
  fn->body = stmt.body;
  fn->defining_env = env_;
  env_->Define(stmt.name, Value::Func(fn));
}

Value Evaluator::EvaluateAssignment(const parser::AssignmentStatement& stmt) {
  Value value = Evaluate(*stmt.value);
  env_->Define(stmt.name, value);
  return value;
}

}  // namespace dlscript::runtime
