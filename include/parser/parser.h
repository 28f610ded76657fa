#ifndef DLSCRIPT_PARSER_PARSER_H_
#define DLSCRIPT_PARSER_PARSER_H_

#include <memory>
#include <string>
#include <vector>

#include "lexer/lexer.h"
#include "parser/ast.h"
#include "util/error.h"

namespace dlscript::parser {

/// Raised on the first token that does not fit the grammar.
class ParseError : public util::Error {
 public:
  ParseError(const std::string& message, std::vector<lexer::TokenType> expected,
             lexer::TokenType found, int line, int column)
      : util::Error(message, line, column), expected_(std::move(expected)), found_(found) {}

  /// Token kinds that would have been accepted at the failure point.
  const std::vector<lexer::TokenType>& expected() const { return expected_; }
  /// Token kind actually found.
  lexer::TokenType found() const { return found_; }

 private:
  std::vector<lexer::TokenType> expected_;
  lexer::TokenType found_;
};

class Parser {
 public:
  /// Builds a parser over a token sequence terminated by kEof (see lexer::Tokenize).
  explicit Parser(std::vector<lexer::Token> tokens);

  /// Parses a whole program and throws ParseError on syntax issues.
  Program ParseProgram();

  /// Parses a single expression that must span all remaining tokens.
  std::unique_ptr<Expression> ParseExpression();

 private:
  const lexer::Token& Peek() const;
  const lexer::Token& Next() const;
  const lexer::Token& Previous() const;
  lexer::Token Advance();
  bool Check(lexer::TokenType type) const;
  bool Match(lexer::TokenType type);
  const lexer::Token& Consume(lexer::TokenType type, const std::string& message);
  [[noreturn]] void Fail(const std::string& message, std::vector<lexer::TokenType> expected) const;

  std::unique_ptr<Statement> StatementRule();
  StatementList StatementListRule();
  StatementList BracedBlock(const std::string& context);
  std::unique_ptr<AssignmentStatement> AssignmentRule();
  std::unique_ptr<Statement> IfStatementRule();
  std::unique_ptr<Statement> ForStatementRule();
  std::unique_ptr<Statement> WhileStatementRule();
  std::unique_ptr<Statement> FunctionStatementRule();
  Condition ConditionRule();
  std::unique_ptr<Expression> ExpressionRule();
  std::unique_ptr<Expression> Term();
  std::unique_ptr<Expression> Factor();
  std::unique_ptr<Expression> Base();
  std::unique_ptr<Expression> ListLiteralRule();
  std::unique_ptr<Expression> MatrixOpRule();
  std::unique_ptr<Expression> TrigRule();
  std::unique_ptr<Expression> UserCall();
  std::unique_ptr<Expression> BuiltinCall();

  std::vector<lexer::Token> tokens_;
  size_t pos_;
};

/// Convenience: tokenizes and parses a whole program.
Program ParseSource(const std::string& source);

}  // namespace dlscript::parser

#endif  // DLSCRIPT_PARSER_PARSER_H_
