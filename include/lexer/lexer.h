#ifndef DLSCRIPT_LEXER_LEXER_H_
#define DLSCRIPT_LEXER_LEXER_H_

#include <string>
#include <vector>

#include "lexer/token.h"
#include "util/error.h"

namespace dlscript::lexer {

/// Raised on a character no token rule accepts.
class LexError : public util::Error {
 public:
  LexError(const std::string& message, char unexpected, int line, int column)
      : util::Error(message, line, column), unexpected_(unexpected) {}

  /// The offending character ('\0' when the input ended inside a token).
  char unexpected_char() const { return unexpected_; }

 private:
  char unexpected_;
};

class Lexer {
 public:
  /// Initializes a lexer over the provided source string.
  explicit Lexer(const std::string& source);

  /// Returns the next token, throwing LexError on malformed input.
  Token NextToken();

 private:
  char Peek() const;
  char PeekNext() const;
  char Advance();
  bool IsAtEnd() const;
  void SkipWhitespaceAndComments();
  Token NumberToken();
  Token IdentifierToken();
  Token StringToken();

  std::string source_;
  size_t index_;
  int line_;
  int column_;
};

/// Lexes the whole source; the returned sequence always ends with a kEof token.
std::vector<Token> Tokenize(const std::string& source);

}  // namespace dlscript::lexer

#endif  // DLSCRIPT_LEXER_LEXER_H_
