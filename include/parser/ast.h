#ifndef DLSCRIPT_PARSER_AST_H_
#define DLSCRIPT_PARSER_AST_H_

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "builtin/keywords.h"

// AST nodes for expressions and statements.

namespace dlscript::parser {

using builtin::CallCategory;

enum class UnaryOp { kNegate };
enum class BinaryOp { kAdd, kSub, kMul, kDiv, kMod, kPow };
enum class TrigFunc { kSin, kCos, kTan, kSqrt };
enum class MatrixOpKind { kTranspose, kInverse, kMatMult, kMatAdd, kMatSub };
enum class RelOp { kEq, kNe, kLt, kLe, kGt, kGe };

const char* BinaryOpSymbol(BinaryOp op);
const char* TrigFuncName(TrigFunc func);
const char* MatrixOpName(MatrixOpKind kind);
const char* RelOpSymbol(RelOp op);

struct Expression {
  virtual ~Expression() = default;
  int line = 0;
  int column = 0;
};

/// Numeric literal value. NUMBER and FLOAT tokens share one runtime kind.
struct NumberLiteral : public Expression {
  NumberLiteral(double v, bool is_int_token, std::string lex)
      : value(v), is_integer_token(is_int_token), lexeme(std::move(lex)) {}
  double value;
  bool is_integer_token;
  std::string lexeme;
};

/// String literal, quotes stripped.
struct StringLiteral : public Expression {
  explicit StringLiteral(std::string v) : value(std::move(v)) {}
  std::string value;
};

/// Unary expression such as negation.
struct UnaryExpression : public Expression {
  UnaryExpression(UnaryOp o, std::unique_ptr<Expression> expr) : op(o), operand(std::move(expr)) {}
  UnaryOp op;
  std::unique_ptr<Expression> operand;
};

/// Binary expression for arithmetic operators.
struct BinaryExpression : public Expression {
  BinaryExpression(BinaryOp o, std::unique_ptr<Expression> lhs_expr,
                   std::unique_ptr<Expression> rhs_expr)
      : op(o), lhs(std::move(lhs_expr)), rhs(std::move(rhs_expr)) {}
  BinaryOp op;
  std::unique_ptr<Expression> lhs;
  std::unique_ptr<Expression> rhs;
};

/// sin/cos/tan/sqrt applied to one expression.
struct TrigExpression : public Expression {
  TrigExpression(TrigFunc f, std::unique_ptr<Expression> arg)
      : func(f), argument(std::move(arg)) {}
  TrigFunc func;
  std::unique_ptr<Expression> argument;
};

/// Named identifier reference.
struct Identifier : public Expression {
  explicit Identifier(std::string n) : name(std::move(n)) {}
  std::string name;
};

/// Parenthesized expression.
struct GroupingExpression : public Expression {
  explicit GroupingExpression(std::unique_ptr<Expression> e) : inner(std::move(e)) {}
  std::unique_ptr<Expression> inner;
};

/// One entry of a bracketed literal: either a bracketed row `[a, b]` or a bare expression.
/// A bare row always holds exactly one element.
struct ListRow {
  bool bracketed = false;
  std::vector<std::unique_ptr<Expression>> elements;
  int line = 0;
  int column = 0;
};

/// `[...]` literal. Whether it denotes a list or a matrix is decided by the evaluator.
struct ListLiteral : public Expression {
  explicit ListLiteral(std::vector<ListRow> r) : rows(std::move(r)) {}
  std::vector<ListRow> rows;
};

/// transpose/inverse/matmult/matadd/matsub with their fixed operand count.
struct MatrixOpExpression : public Expression {
  MatrixOpExpression(MatrixOpKind k, std::vector<std::unique_ptr<Expression>> ops)
      : kind(k), operands(std::move(ops)) {}
  MatrixOpKind kind;
  std::vector<std::unique_ptr<Expression>> operands;
};

/// Function call with positional arguments.
struct CallExpression : public Expression {
  CallExpression(CallCategory cat, std::string callee_name,
                 std::vector<std::unique_ptr<Expression>> arguments)
      : category(cat), callee(std::move(callee_name)), args(std::move(arguments)) {}
  CallCategory category;
  std::string callee;
  std::vector<std::unique_ptr<Expression>> args;
};

/// Loop/branch condition: a comparison, or a truthiness test when `op` is empty.
struct Condition {
  std::unique_ptr<Expression> lhs;
  std::optional<RelOp> op;
  std::unique_ptr<Expression> rhs;
  int line = 0;
  int column = 0;
};

struct Statement {
  virtual ~Statement() = default;
  int line = 0;
  int column = 0;
};

using StatementList = std::vector<std::unique_ptr<Statement>>;

/// Expression used as a statement.
struct ExpressionStatement : public Statement {
  explicit ExpressionStatement(std::unique_ptr<Expression> e) : expr(std::move(e)) {}
  std::unique_ptr<Expression> expr;
};

/// Assignment to a named identifier.
struct AssignmentStatement : public Statement {
  AssignmentStatement(std::string n, std::unique_ptr<Expression> v)
      : name(std::move(n)), value(std::move(v)) {}
  std::string name;
  std::unique_ptr<Expression> value;
};

/// Conditional statement with optional else block.
struct IfStatement : public Statement {
  IfStatement(Condition cond, StatementList then_stmts, std::optional<StatementList> else_stmts)
      : condition(std::move(cond)),
        then_block(std::move(then_stmts)),
        else_block(std::move(else_stmts)) {}
  Condition condition;
  StatementList then_block;
  std::optional<StatementList> else_block;
};

/// While loop with a condition and body.
struct WhileStatement : public Statement {
  WhileStatement(Condition cond, StatementList body_stmts)
      : condition(std::move(cond)), body(std::move(body_stmts)) {}
  Condition condition;
  StatementList body;
};

/// For loop: init runs once, step after every body pass.
struct ForStatement : public Statement {
  ForStatement(std::unique_ptr<AssignmentStatement> init_stmt, Condition cond,
               std::unique_ptr<AssignmentStatement> step_stmt, StatementList body_stmts)
      : init(std::move(init_stmt)),
        condition(std::move(cond)),
        step(std::move(step_stmt)),
        body(std::move(body_stmts)) {}
  std::unique_ptr<AssignmentStatement> init;
  Condition condition;
  std::unique_ptr<AssignmentStatement> step;
  StatementList body;
};

/// Statements of a function followed by its mandatory return expression. Shared between the
/// definition node and every function value created from it.
struct FunctionBody {
  StatementList statements;
  std::unique_ptr<Expression> return_expr;
};

/// Function definition statement.
struct FunctionStatement : public Statement {
  FunctionStatement(std::string n, std::vector<std::string> params,
                    std::shared_ptr<const FunctionBody> b)
      : name(std::move(n)), parameters(std::move(params)), body(std::move(b)) {}
  std::string name;
  std::vector<std::string> parameters;
  std::shared_ptr<const FunctionBody> body;
};

/// A parsed source file.
struct Program {
  StatementList statements;
};

}  // namespace dlscript::parser

#endif  // DLSCRIPT_PARSER_AST_H_
