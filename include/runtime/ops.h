#ifndef DLSCRIPT_RUNTIME_OPS_H_
#define DLSCRIPT_RUNTIME_OPS_H_

#include <memory>
#include <optional>
#include <vector>

#include "builtin/dispatch.h"
#include "parser/ast.h"
#include "runtime/environment.h"
#include "runtime/runtime_error.h"
#include "runtime/value.h"

namespace dlscript::runtime {

class Evaluator {
 public:
  /// Evaluates AST nodes in `env`. Built-in ml/io/plot calls go through `dispatcher` (not owned,
  /// may be null when the program makes no such calls).
  Evaluator(std::shared_ptr<Environment> env, builtin::Dispatcher* dispatcher);

  /// Runs a statement sequence in the current frame and stops at the first RuntimeError.
  /// Returns the final statement's value; control statements have none.
  std::optional<Value> ExecuteStatements(const parser::StatementList& statements);

  /// Executes one statement; assignments and expression statements yield their value.
  std::optional<Value> EvaluateStatement(const parser::Statement& stmt);

  /// Dispatches to the appropriate visitor for the expression kind.
  Value Evaluate(const parser::Expression& expr);

  /// Evaluates a loop/branch condition to a boolean.
  bool EvaluateCondition(const parser::Condition& condition);

 private:
  Value EvaluateUnary(const parser::UnaryExpression& expr);
  Value EvaluateBinary(const parser::BinaryExpression& expr);
  Value EvaluateTrig(const parser::TrigExpression& expr);
  Value EvaluateIdentifier(const parser::Identifier& identifier);
  Value EvaluateList(const parser::ListLiteral& literal);
  Value EvaluateMatrixOp(const parser::MatrixOpExpression& expr);
  Value EvaluateCall(const parser::CallExpression& call);
  Value CallUser(const parser::CallExpression& call, std::vector<Value> args);
  Value CallBuiltin(const parser::CallExpression& call, std::vector<Value> args);
  const Matrix& RequireMatrix(const Value& value, const parser::MatrixOpExpression& expr);

  void EvaluateIf(const parser::IfStatement& stmt);
  void EvaluateWhile(const parser::WhileStatement& stmt);
  void EvaluateFor(const parser::ForStatement& stmt);
  void EvaluateFunction(const parser::FunctionStatement& stmt);
  Value EvaluateAssignment(const parser::AssignmentStatement& stmt);

  std::shared_ptr<Environment> env_;
  builtin::Dispatcher* dispatcher_;
};

}  // namespace dlscript::runtime

#endif  // DLSCRIPT_RUNTIME_OPS_H_
