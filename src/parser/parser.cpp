#include "parser/parser.h"

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dlscript::parser {

namespace {
using lexer::TokenType;

std::optional<BinaryOp> AdditiveOp(TokenType type) {
  if (type == TokenType::kPlus) return BinaryOp::kAdd;
  if (type == TokenType::kMinus) return BinaryOp::kSub;
  return std::nullopt;
}

std::optional<BinaryOp> MultiplicativeOp(TokenType type) {
  if (type == TokenType::kStar) return BinaryOp::kMul;
  if (type == TokenType::kSlash) return BinaryOp::kDiv;
  if (type == TokenType::kPercent) return BinaryOp::kMod;
  return std::nullopt;
}

std::optional<RelOp> RelationalOp(TokenType type) {
  switch (type) {
    case TokenType::kEqualEqual:
      return RelOp::kEq;
    case TokenType::kBangEqual:
      return RelOp::kNe;
    case TokenType::kLess:
      return RelOp::kLt;
    case TokenType::kLessEqual:
      return RelOp::kLe;
    case TokenType::kGreater:
      return RelOp::kGt;
    case TokenType::kGreaterEqual:
      return RelOp::kGe;
    default:
      return std::nullopt;
  }
}

std::optional<TrigFunc> TrigFor(TokenType type) {
  switch (type) {
    case TokenType::kSin:
      return TrigFunc::kSin;
    case TokenType::kCos:
      return TrigFunc::kCos;
    case TokenType::kTan:
      return TrigFunc::kTan;
    case TokenType::kSqrt:
      return TrigFunc::kSqrt;
    default:
      return std::nullopt;
  }
}

std::optional<MatrixOpKind> MatrixOpFor(TokenType type) {
  switch (type) {
    case TokenType::kTranspose:
      return MatrixOpKind::kTranspose;
    case TokenType::kInverse:
      return MatrixOpKind::kInverse;
    case TokenType::kMatMult:
      return MatrixOpKind::kMatMult;
    case TokenType::kMatAdd:
      return MatrixOpKind::kMatAdd;
    case TokenType::kMatSub:
      return MatrixOpKind::kMatSub;
    default:
      return std::nullopt;
  }
}

const std::vector<TokenType>& ExpressionStarts() {
  static const std::vector<TokenType> kStarts = [] {
    std::vector<TokenType> starts = {
        TokenType::kIdentifier, TokenType::kNumber, TokenType::kFloat, TokenType::kString,
        TokenType::kLParen,     TokenType::kLBracket, TokenType::kMinus, TokenType::kSin,
        TokenType::kCos,        TokenType::kTan,    TokenType::kSqrt};
    for (const auto& info : builtin::BuiltinKeywords()) {
      starts.push_back(info.token);
    }
    return starts;
  }();
  return kStarts;
}

template <typename T>
T Located(T node, const lexer::Token& tok) {
  node->line = tok.line;
  node->column = tok.column;
  return node;
}

constexpr char kReturnPlacement[] =
    "'return' is only allowed as the last statement of a function body";
}  // namespace

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)), pos_(0) {
  if (tokens_.empty() || tokens_.back().type != TokenType::kEof) {
    int line = tokens_.empty() ? 1 : tokens_.back().line;
    int column = tokens_.empty() ? 1 : tokens_.back().column;
    tokens_.push_back(lexer::Token{TokenType::kEof, "", line, column});
  }
}

const lexer::Token& Parser::Peek() const {
  return tokens_[pos_];
}

const lexer::Token& Parser::Next() const {
  if (pos_ + 1 < tokens_.size()) {
    return tokens_[pos_ + 1];
  }
  return tokens_.back();
}

const lexer::Token& Parser::Previous() const {
  return tokens_[pos_ == 0 ? 0 : pos_ - 1];
}

lexer::Token Parser::Advance() {
  if (Peek().type != TokenType::kEof) {
    ++pos_;
  }
  return Previous();
}

bool Parser::Check(TokenType type) const {
  return Peek().type == type;
}

bool Parser::Match(TokenType type) {
  if (Check(type)) {
    Advance();
    return true;
  }
  return false;
}

const lexer::Token& Parser::Consume(TokenType type, const std::string& message) {
  if (Check(type)) {
    Advance();
    return Previous();
  }
  Fail(message, {type});
}

void Parser::Fail(const std::string& message, std::vector<TokenType> expected) const {
  const auto& tok = Peek();
  std::string found = lexer::TokenTypeName(tok.type);
  if (tok.type != TokenType::kEof && !tok.lexeme.empty()) {
    found += " \"" + tok.lexeme + "\"";
  }
  throw ParseError(message + ", found " + found, std::move(expected), tok.type, tok.line,
                   tok.column);
}

Program Parser::ParseProgram() {
  Program program;
  program.statements = StatementListRule();
  if (Check(TokenType::kReturn)) {
    Fail(kReturnPlacement, {TokenType::kEof});
  }
  Consume(TokenType::kEof, "Expected end of input");
  return program;
}

std::unique_ptr<Expression> Parser::ParseExpression() {
  auto expr = ExpressionRule();
  Consume(TokenType::kEof, "Unexpected tokens after expression");
  return expr;
}

StatementList Parser::StatementListRule() {
  StatementList statements;
  while (!Check(TokenType::kRBrace) && !Check(TokenType::kEof) && !Check(TokenType::kReturn)) {
    statements.push_back(StatementRule());
  }
  return statements;
}

StatementList Parser::BracedBlock(const std::string& context) {
  Consume(TokenType::kLBrace, "Expected '{' to open " + context);
  StatementList statements = StatementListRule();
  if (Check(TokenType::kReturn)) {
    Fail(kReturnPlacement, {TokenType::kRBrace});
  }
  Consume(TokenType::kRBrace, "Expected '}' to close " + context);
  return statements;
}

std::unique_ptr<Statement> Parser::StatementRule() {
  switch (Peek().type) {
    case TokenType::kIf:
      return IfStatementRule();
    case TokenType::kFor:
      return ForStatementRule();
    case TokenType::kWhile:
      return WhileStatementRule();
    case TokenType::kDef:
      return FunctionStatementRule();
    default:
      break;
  }
  if (Check(TokenType::kIdentifier) && Next().type == TokenType::kEqual) {
    auto assign = AssignmentRule();
    Consume(TokenType::kSemicolon, "Expected ';' after assignment");
    return assign;
  }
  const lexer::Token start = Peek();
  auto expr = ExpressionRule();
  Consume(TokenType::kSemicolon, "Expected ';' after expression");
  return Located(std::make_unique<ExpressionStatement>(std::move(expr)), start);
}

std::unique_ptr<AssignmentStatement> Parser::AssignmentRule() {
  const lexer::Token name = Consume(TokenType::kIdentifier, "Expected variable name");
  Consume(TokenType::kEqual, "Expected '=' in assignment");
  auto value = ExpressionRule();
  return Located(std::make_unique<AssignmentStatement>(name.lexeme, std::move(value)), name);
}

std::unique_ptr<Statement> Parser::IfStatementRule() {
  const lexer::Token start = Advance();  // 'if'
  Consume(TokenType::kLParen, "Expected '(' after 'if'");
  Condition condition = ConditionRule();
  Consume(TokenType::kRParen, "Expected ')' after condition");
  StatementList then_block = BracedBlock("'if' block");
  std::optional<StatementList> else_block;
  if (Match(TokenType::kElse)) {
    else_block = BracedBlock("'else' block");
  }
  return Located(std::make_unique<IfStatement>(std::move(condition), std::move(then_block),
                                               std::move(else_block)),
                 start);
}

std::unique_ptr<Statement> Parser::ForStatementRule() {
  const lexer::Token start = Advance();  // 'for'
  Consume(TokenType::kLParen, "Expected '(' after 'for'");
  auto init = AssignmentRule();
  Consume(TokenType::kSemicolon, "Expected ';' after for-loop initializer");
  Condition condition = ConditionRule();
  Consume(TokenType::kSemicolon, "Expected ';' after for-loop condition");
  auto step = AssignmentRule();
  Consume(TokenType::kRParen, "Expected ')' after for-loop step");
  StatementList body = BracedBlock("'for' body");
  return Located(std::make_unique<ForStatement>(std::move(init), std::move(condition),
                                                std::move(step), std::move(body)),
                 start);
}

std::unique_ptr<Statement> Parser::WhileStatementRule() {
  const lexer::Token start = Advance();  // 'while'
  Consume(TokenType::kLParen, "Expected '(' after 'while'");
  Condition condition = ConditionRule();
  Consume(TokenType::kRParen, "Expected ')' after condition");
  StatementList body = BracedBlock("'while' body");
  return Located(std::make_unique<WhileStatement>(std::move(condition), std::move(body)), start);
}

std::unique_ptr<Statement> Parser::FunctionStatementRule() {
  const lexer::Token start = Advance();  // 'def'
  const lexer::Token name = Consume(TokenType::kIdentifier, "Expected function name after 'def'");
  Consume(TokenType::kLParen, "Expected '(' after function name");
  std::vector<std::string> params;
  if (!Match(TokenType::kRParen)) {
    while (true) {
      params.push_back(Consume(TokenType::kIdentifier, "Expected parameter name").lexeme);
      if (Match(TokenType::kRParen)) {
        break;
      }
      if (!Check(TokenType::kComma)) {
        Fail("Expected ',' or ')' in parameter list", {TokenType::kComma, TokenType::kRParen});
      }
      Advance();
    }
  }
  Consume(TokenType::kLBrace, "Expected '{' to open function body");
  auto body = std::make_shared<FunctionBody>();
  body->statements = StatementListRule();
  Consume(TokenType::kReturn, "Function body must end with a return statement");
  body->return_expr = ExpressionRule();
  Consume(TokenType::kSemicolon, "Expected ';' after return expression");
  Consume(TokenType::kRBrace, "Expected '}' after return statement");
  return Located(std::make_unique<FunctionStatement>(name.lexeme, std::move(params),
                                                     std::move(body)),
                 start);
}

Condition Parser::ConditionRule() {
  Condition condition;
  condition.line = Peek().line;
  condition.column = Peek().column;
  condition.lhs = ExpressionRule();
  if (auto op = RelationalOp(Peek().type)) {
    Advance();
    condition.op = op;
    condition.rhs = ExpressionRule();
  }
  return condition;
}

std::unique_ptr<Expression> Parser::ExpressionRule() {
  auto expr = Term();
  while (auto op = AdditiveOp(Peek().type)) {
    const lexer::Token tok = Advance();
    auto rhs = Term();
    expr = Located(std::make_unique<BinaryExpression>(*op, std::move(expr), std::move(rhs)), tok);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Term() {
  auto expr = Factor();
  while (auto op = MultiplicativeOp(Peek().type)) {
    const lexer::Token tok = Advance();
    auto rhs = Factor();
    expr = Located(std::make_unique<BinaryExpression>(*op, std::move(expr), std::move(rhs)), tok);
  }
  return expr;
}

// '^' folds to the left like the other levels: 2 ^ 3 ^ 2 is (2 ^ 3) ^ 2.
std::unique_ptr<Expression> Parser::Factor() {
  auto expr = Base();
  while (Check(TokenType::kCaret)) {
    const lexer::Token tok = Advance();
    auto rhs = Base();
    expr = Located(
        std::make_unique<BinaryExpression>(BinaryOp::kPow, std::move(expr), std::move(rhs)), tok);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Base() {
  const lexer::Token tok = Peek();
  switch (tok.type) {
    case TokenType::kNumber:
    case TokenType::kFloat: {
      Advance();
      double value = std::strtod(tok.lexeme.c_str(), nullptr);
      return Located(std::make_unique<NumberLiteral>(value, tok.type == TokenType::kNumber,
                                                     tok.lexeme),
                     tok);
    }
    case TokenType::kString:
      Advance();
      return Located(std::make_unique<StringLiteral>(tok.lexeme), tok);
    case TokenType::kIdentifier:
      if (Next().type == TokenType::kLParen) {
        return UserCall();
      }
      Advance();
      return Located(std::make_unique<Identifier>(tok.lexeme), tok);
    case TokenType::kLParen: {
      Advance();
      auto inner = ExpressionRule();
      Consume(TokenType::kRParen, "Expected ')' after expression");
      return Located(std::make_unique<GroupingExpression>(std::move(inner)), tok);
    }
    case TokenType::kLBracket:
      return ListLiteralRule();
    case TokenType::kMinus: {
      Advance();
      auto operand = Base();
      return Located(std::make_unique<UnaryExpression>(UnaryOp::kNegate, std::move(operand)),
                     tok);
    }
    default:
      break;
  }
  if (TrigFor(tok.type).has_value()) {
    return TrigRule();
  }
  if (MatrixOpFor(tok.type).has_value()) {
    return MatrixOpRule();
  }
  if (builtin::FindKeyword(tok.type) != nullptr) {
    return BuiltinCall();
  }
  Fail("Expected expression", ExpressionStarts());
}

// A row starting with '[' is a bracketed row unless it is the empty list `[]`; anything else is
// one bare expression.
std::unique_ptr<Expression> Parser::ListLiteralRule() {
  const lexer::Token open = Advance();  // '['
  std::vector<ListRow> rows;
  if (!Match(TokenType::kRBracket)) {
    while (true) {
      ListRow row;
      row.line = Peek().line;
      row.column = Peek().column;
      if (Check(TokenType::kLBracket) && Next().type == TokenType::kRBracket) {
        // `[]` as a row is the empty-list expression, not an empty matrix row.
        const lexer::Token empty_open = Advance();
        Advance();
        row.elements.push_back(
            Located(std::make_unique<ListLiteral>(std::vector<ListRow>{}), empty_open));
      } else if (Match(TokenType::kLBracket)) {
        row.bracketed = true;
        row.elements.push_back(ExpressionRule());
        while (Match(TokenType::kComma)) {
          row.elements.push_back(ExpressionRule());
        }
        Consume(TokenType::kRBracket, "Expected ']' to close matrix row");
      } else {
        row.elements.push_back(ExpressionRule());
      }
      rows.push_back(std::move(row));
      if (Match(TokenType::kRBracket)) {
        break;
      }
      if (!Check(TokenType::kComma)) {
        Fail("Expected ',' or ']' in list", {TokenType::kComma, TokenType::kRBracket});
      }
      Advance();
    }
  }
  return Located(std::make_unique<ListLiteral>(std::move(rows)), open);
}

std::unique_ptr<Expression> Parser::MatrixOpRule() {
  const lexer::Token tok = Advance();
  const auto* info = builtin::FindKeyword(tok.type);
  const std::string name = info->name;
  Consume(TokenType::kLParen, "Expected '(' after '" + name + "'");
  std::vector<std::unique_ptr<Expression>> operands;
  for (int i = 0; i < info->arity; ++i) {
    if (i > 0) {
      Consume(TokenType::kComma, "'" + name + "' expects " + std::to_string(info->arity) +
                                     " operands");
    }
    operands.push_back(ExpressionRule());
  }
  Consume(TokenType::kRParen, "Expected ')' after '" + name + "' operands");
  return Located(std::make_unique<MatrixOpExpression>(*MatrixOpFor(tok.type), std::move(operands)),
                 tok);
}

std::unique_ptr<Expression> Parser::TrigRule() {
  const lexer::Token tok = Advance();
  Consume(TokenType::kLParen, "Expected '(' after '" + tok.lexeme + "'");
  auto arg = ExpressionRule();
  Consume(TokenType::kRParen, "Expected ')' after '" + tok.lexeme + "' argument");
  return Located(std::make_unique<TrigExpression>(*TrigFor(tok.type), std::move(arg)), tok);
}

std::unique_ptr<Expression> Parser::UserCall() {
  const lexer::Token name = Advance();
  Consume(TokenType::kLParen, "Expected '(' after function name");
  std::vector<std::unique_ptr<Expression>> args;
  if (!Match(TokenType::kRParen)) {
    while (true) {
      args.push_back(ExpressionRule());
      if (Match(TokenType::kRParen)) {
        break;
      }
      if (!Check(TokenType::kComma)) {
        Fail("Expected ',' or ')' in argument list", {TokenType::kComma, TokenType::kRParen});
      }
      Advance();
    }
  }
  return Located(
      std::make_unique<CallExpression>(CallCategory::kUser, name.lexeme, std::move(args)), name);
}

// ml/io/plot keyword calls. Arity is fixed by the keyword table; read_file and write_file take
// a string literal path.
std::unique_ptr<Expression> Parser::BuiltinCall() {
  const lexer::Token tok = Advance();
  const auto* info = builtin::FindKeyword(tok.type);
  const std::string name = info->name;
  const CallCategory category = *builtin::ResolveBuiltinCategory(name);
  const bool path_first = tok.type == TokenType::kReadFile || tok.type == TokenType::kWriteFile;
  Consume(TokenType::kLParen, "Expected '(' after '" + name + "'");
  std::vector<std::unique_ptr<Expression>> args;
  for (int i = 0; i < info->arity; ++i) {
    if (i > 0) {
      Consume(TokenType::kComma,
              "'" + name + "' expects " + std::to_string(info->arity) + " arguments");
    }
    if (i == 0 && path_first) {
      const lexer::Token path =
          Consume(TokenType::kString, "'" + name + "' expects a string literal path");
      args.push_back(Located(std::make_unique<StringLiteral>(path.lexeme), path));
      continue;
    }
    args.push_back(ExpressionRule());
  }
  Consume(TokenType::kRParen, "'" + name + "' expects " + std::to_string(info->arity) +
                                  " arguments; expected ')'");
  return Located(std::make_unique<CallExpression>(category, name, std::move(args)), tok);
}

Program ParseSource(const std::string& source) {
  Parser parser(lexer::Tokenize(source));
  return parser.ParseProgram();
}

}  // namespace dlscript::parser
