#include "lexer/lexer.h"

#include <cctype>
#include <unordered_map>

#include "builtin/keywords.h"

namespace dlscript::lexer {

namespace {
const std::unordered_map<std::string, TokenType>& ReservedWords() {
  static const std::unordered_map<std::string, TokenType> kWords = [] {
    std::unordered_map<std::string, TokenType> words = {
        {"if", TokenType::kIf},         {"else", TokenType::kElse},
        {"for", TokenType::kFor},       {"while", TokenType::kWhile},
        {"def", TokenType::kDef},       {"return", TokenType::kReturn},
        {"sin", TokenType::kSin},       {"cos", TokenType::kCos},
        {"tan", TokenType::kTan},       {"sqrt", TokenType::kSqrt},
    };
    for (const auto& info : builtin::BuiltinKeywords()) {
      words.emplace(info.name, info.token);
    }
    return words;
  }();
  return kWords;
}

bool IsIdentifierStart(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
}

bool IsIdentifierPart(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::string Quoted(char ch) {
  return std::string("'") + ch + "'";
}
}  // namespace

std::string TokenTypeName(TokenType type) {
  switch (type) {
    case TokenType::kEof:
      return "end of input";
    case TokenType::kNumber:
      return "number";
    case TokenType::kFloat:
      return "float";
    case TokenType::kString:
      return "string";
    case TokenType::kIdentifier:
      return "identifier";
    case TokenType::kIf:
      return "'if'";
    case TokenType::kElse:
      return "'else'";
    case TokenType::kFor:
      return "'for'";
    case TokenType::kWhile:
      return "'while'";
    case TokenType::kDef:
      return "'def'";
    case TokenType::kReturn:
      return "'return'";
    case TokenType::kSin:
      return "'sin'";
    case TokenType::kCos:
      return "'cos'";
    case TokenType::kTan:
      return "'tan'";
    case TokenType::kSqrt:
      return "'sqrt'";
    case TokenType::kEqual:
      return "'='";
    case TokenType::kPlus:
      return "'+'";
    case TokenType::kMinus:
      return "'-'";
    case TokenType::kStar:
      return "'*'";
    case TokenType::kSlash:
      return "'/'";
    case TokenType::kPercent:
      return "'%'";
    case TokenType::kCaret:
      return "'^'";
    case TokenType::kEqualEqual:
      return "'=='";
    case TokenType::kBangEqual:
      return "'!='";
    case TokenType::kLess:
      return "'<'";
    case TokenType::kLessEqual:
      return "'<='";
    case TokenType::kGreater:
      return "'>'";
    case TokenType::kGreaterEqual:
      return "'>='";
    case TokenType::kLParen:
      return "'('";
    case TokenType::kRParen:
      return "')'";
    case TokenType::kLBrace:
      return "'{'";
    case TokenType::kRBrace:
      return "'}'";
    case TokenType::kLBracket:
      return "'['";
    case TokenType::kRBracket:
      return "']'";
    case TokenType::kComma:
      return "','";
    case TokenType::kSemicolon:
      return "';'";
    default:
      break;
  }
  if (const auto* info = builtin::FindKeyword(type)) {
    return std::string("'") + info->name + "'";
  }
  return "token";
}

Lexer::Lexer(const std::string& source) : source_(source), index_(0), line_(1), column_(1) {}

char Lexer::Peek() const {
  if (index_ >= source_.size()) {
    return '\0';
  }
  return source_[index_];
}

char Lexer::PeekNext() const {
  if (index_ + 1 >= source_.size()) {
    return '\0';
  }
  return source_[index_ + 1];
}

char Lexer::Advance() {
  char ch = Peek();
  ++index_;
  if (ch == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return ch;
}

bool Lexer::IsAtEnd() const {
  return index_ >= source_.size();
}

void Lexer::SkipWhitespaceAndComments() {
  while (!IsAtEnd()) {
    char ch = Peek();
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
      Advance();
    } else if (ch == '/' && PeekNext() == '/') {
      while (!IsAtEnd() && Peek() != '\n') {
        Advance();
      }
    } else {
      break;
    }
  }
}

Token Lexer::NumberToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  while (IsDigit(Peek())) {
    lexeme.push_back(Advance());
  }
  if (Peek() != '.') {
    return Token{TokenType::kNumber, lexeme, token_line, token_column};
  }
  if (!IsDigit(PeekNext())) {
    // "3." matches neither NUMBER nor FLOAT.
    throw LexError("Unexpected character " + Quoted('.') + " after number", '.', line_, column_);
  }
  lexeme.push_back(Advance());
  while (IsDigit(Peek())) {
    lexeme.push_back(Advance());
  }
  return Token{TokenType::kFloat, lexeme, token_line, token_column};
}

Token Lexer::IdentifierToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  while (IsIdentifierPart(Peek())) {
    lexeme.push_back(Advance());
  }
  const auto& words = ReservedWords();
  auto it = words.find(lexeme);
  if (it != words.end()) {
    return Token{it->second, lexeme, token_line, token_column};
  }
  return Token{TokenType::kIdentifier, lexeme, token_line, token_column};
}

Token Lexer::StringToken() {
  int token_line = line_;
  int token_column = column_;
  Advance();  // opening quote
  std::string text;
  while (!IsAtEnd() && Peek() != '"') {
    text.push_back(Advance());
  }
  if (IsAtEnd()) {
    throw LexError("Unterminated string literal", '"', token_line, token_column);
  }
  Advance();  // closing quote
  return Token{TokenType::kString, text, token_line, token_column};
}

Token Lexer::NextToken() {
  SkipWhitespaceAndComments();
  int token_line = line_;
  int token_column = column_;

  if (IsAtEnd()) {
    return Token{TokenType::kEof, "", token_line, token_column};
  }

  char ch = Peek();
  if (IsDigit(ch)) {
    return NumberToken();
  }
  if (IsIdentifierStart(ch)) {
    return IdentifierToken();
  }
  if (ch == '"') {
    return StringToken();
  }

  Advance();
  auto single = [&](TokenType type) {
    return Token{type, std::string(1, ch), token_line, token_column};
  };
  auto pair = [&](TokenType two, TokenType one) {
    if (Peek() == '=') {
      Advance();
      return Token{two, std::string(1, ch) + "=", token_line, token_column};
    }
    return single(one);
  };
  switch (ch) {
    case '+':
      return single(TokenType::kPlus);
    case '-':
      return single(TokenType::kMinus);
    case '*':
      return single(TokenType::kStar);
    case '/':
      return single(TokenType::kSlash);
    case '%':
      return single(TokenType::kPercent);
    case '^':
      return single(TokenType::kCaret);
    case '(':
      return single(TokenType::kLParen);
    case ')':
      return single(TokenType::kRParen);
    case '{':
      return single(TokenType::kLBrace);
    case '}':
      return single(TokenType::kRBrace);
    case '[':
      return single(TokenType::kLBracket);
    case ']':
      return single(TokenType::kRBracket);
    case ',':
      return single(TokenType::kComma);
    case ';':
      return single(TokenType::kSemicolon);
    case '=':
      return pair(TokenType::kEqualEqual, TokenType::kEqual);
    case '<':
      return pair(TokenType::kLessEqual, TokenType::kLess);
    case '>':
      return pair(TokenType::kGreaterEqual, TokenType::kGreater);
    case '!':
      if (Peek() == '=') {
        Advance();
        return Token{TokenType::kBangEqual, "!=", token_line, token_column};
      }
      break;
    default:
      break;
  }
  throw LexError("Unexpected character " + Quoted(ch), ch, token_line, token_column);
}

std::vector<Token> Tokenize(const std::string& source) {
  Lexer lexer(source);
  std::vector<Token> tokens;
  while (true) {
    tokens.push_back(lexer.NextToken());
    if (tokens.back().type == TokenType::kEof) {
      break;
    }
  }
  return tokens;
}

}  // namespace dlscript::lexer
