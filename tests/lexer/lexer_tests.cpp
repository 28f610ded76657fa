#include <string>
#include <vector>

#include "test_util.h"

namespace test {

namespace {

std::vector<lx::TokenType> Types(const std::string& source) {
  std::vector<lx::TokenType> types;
  for (const auto& tok : lx::Tokenize(source)) {
    types.push_back(tok.type);
  }
  return types;
}

bool LexFailsAt(const std::string& source, char expected_char, int line, int column) {
  try {
    lx::Tokenize(source);
  } catch (const lx::LexError& err) {
    return err.unexpected_char() == expected_char && err.line() == line &&
           err.column() == column;
  }
  return false;
}

}  // namespace

void RunLexerTests(TestContext* ctx) {
  lx::Lexer lex("+ - * / % ^ ( ) , foo 123");
  std::vector<lx::TokenType> types;
  while (true) {
    auto tok = lex.NextToken();
    types.push_back(tok.type);
    if (tok.type == lx::TokenType::kEof) {
      break;
    }
  }
  std::vector<lx::TokenType> expected = {
      lx::TokenType::kPlus,   lx::TokenType::kMinus,  lx::TokenType::kStar,
      lx::TokenType::kSlash,  lx::TokenType::kPercent, lx::TokenType::kCaret,
      lx::TokenType::kLParen, lx::TokenType::kRParen, lx::TokenType::kComma,
      lx::TokenType::kIdentifier, lx::TokenType::kNumber, lx::TokenType::kEof};
  ExpectTrue(types == expected, "basic_tokenization", ctx);

  ExpectTrue(Types("== != <= >= < > =") ==
                 std::vector<lx::TokenType>{lx::TokenType::kEqualEqual,
                                            lx::TokenType::kBangEqual,
                                            lx::TokenType::kLessEqual,
                                            lx::TokenType::kGreaterEqual,
                                            lx::TokenType::kLess,
                                            lx::TokenType::kGreater,
                                            lx::TokenType::kEqual,
                                            lx::TokenType::kEof},
             "relational_operators", ctx);

  auto nums = lx::Tokenize("42 3.25");
  ExpectTrue(nums[0].type == lx::TokenType::kNumber && nums[0].lexeme == "42", "integer_token",
             ctx);
  ExpectTrue(nums[1].type == lx::TokenType::kFloat && nums[1].lexeme == "3.25", "float_token",
             ctx);

  auto str = lx::Tokenize("\"data.csv\"");
  ExpectTrue(str[0].type == lx::TokenType::kString && str[0].lexeme == "data.csv",
             "string_token_strips_quotes", ctx);

  ExpectTrue(Types("if else for while def return") ==
                 std::vector<lx::TokenType>{lx::TokenType::kIf, lx::TokenType::kElse,
                                            lx::TokenType::kFor, lx::TokenType::kWhile,
                                            lx::TokenType::kDef, lx::TokenType::kReturn,
                                            lx::TokenType::kEof},
             "control_keywords", ctx);
  ExpectTrue(Types("kmeans print scatter transpose sqrt") ==
                 std::vector<lx::TokenType>{lx::TokenType::kKmeans, lx::TokenType::kPrint,
                                            lx::TokenType::kScatter, lx::TokenType::kTranspose,
                                            lx::TokenType::kSqrt, lx::TokenType::kEof},
             "builtin_keywords_are_reserved", ctx);
  ExpectTrue(Types("kmeans_x printer _tmp") ==
                 std::vector<lx::TokenType>{lx::TokenType::kIdentifier,
                                            lx::TokenType::kIdentifier,
                                            lx::TokenType::kIdentifier, lx::TokenType::kEof},
             "keyword_prefix_is_identifier", ctx);

  auto positioned = lx::Tokenize("x = 1;\n  y = x ^ 2; // trailing comment\n");
  ExpectTrue(positioned[0].line == 1 && positioned[0].column == 1, "token_position_first", ctx);
  ExpectTrue(positioned[4].lexeme == "y" && positioned[4].line == 2 && positioned[4].column == 3,
             "token_position_second_line", ctx);
  ExpectTrue(positioned.back().type == lx::TokenType::kEof && positioned.size() == 11,
             "comment_skipped", ctx);

  ExpectTrue(lx::Tokenize("").size() == 1, "empty_source_is_eof", ctx);
  ExpectTrue(LexFailsAt("x = 3 @ 4;", '@', 1, 7), "unexpected_character", ctx);
  ExpectTrue(LexFailsAt("x = 3.;", '.', 1, 6), "dangling_decimal_point", ctx);
  ExpectTrue(LexFailsAt("x = !y;", '!', 1, 5), "lone_bang", ctx);
  ExpectTrue(LexFailsAt("s = \"open;", '"', 1, 5), "unterminated_string", ctx);

  ExpectTrue(lx::TokenTypeName(lx::TokenType::kKmeans).find("kmeans") != std::string::npos,
             "token_type_name_for_keyword", ctx);
}

}  // namespace test
