#ifndef DLSCRIPT_LEXER_TOKEN_H_
#define DLSCRIPT_LEXER_TOKEN_H_

#include <string>

namespace dlscript::lexer {

enum class TokenType {
  kEof,
  kNumber,
  kFloat,
  kString,
  kIdentifier,
  // Control keywords.
  kIf,
  kElse,
  kFor,
  kWhile,
  kDef,
  kReturn,
  // Machine-learning keywords.
  kLinearRegression,
  kMlpClassifier,
  kNeuralNetwork,
  kPredict,
  kTrain,
  kKmeans,
  kFitPredict,
  kGetCentroids,
  kAutoencoder,
  kEncode,
  kDecode,
  kReconstruct,
  kReconstructionError,
  // Matrix keywords.
  kTranspose,
  kInverse,
  kMatMult,
  kMatAdd,
  kMatSub,
  // IO keywords.
  kReadFile,
  kWriteFile,
  kPrint,
  // Plot keywords.
  kPlot,
  kScatter,
  kHistogram,
  // Trigonometric keywords.
  kSin,
  kCos,
  kTan,
  kSqrt,
  // Operators.
  kEqual,
  kPlus,
  kMinus,
  kStar,
  kSlash,
  kPercent,
  kCaret,
  kEqualEqual,
  kBangEqual,
  kLess,
  kLessEqual,
  kGreater,
  kGreaterEqual,
  // Punctuation.
  kLParen,
  kRParen,
  kLBrace,
  kRBrace,
  kLBracket,
  kRBracket,
  kComma,
  kSemicolon,
};

/// A lexical token with type, original lexeme, and source location.
struct Token {
  TokenType type;
  std::string lexeme;
  int line;
  int column;
};

/// Human-readable token kind used in diagnostics ("identifier", "';'", "'kmeans'").
std::string TokenTypeName(TokenType type);

}  // namespace dlscript::lexer

#endif  // DLSCRIPT_LEXER_TOKEN_H_
