#ifndef DLSCRIPT_BUILTIN_KEYWORDS_H_
#define DLSCRIPT_BUILTIN_KEYWORDS_H_

#include <optional>
#include <string>
#include <vector>

#include "lexer/token.h"

namespace dlscript::builtin {

/// Who implements a call: the program itself or one of the injected subsystems.
enum class CallCategory { kUser, kMl, kIo, kPlot };

/// Keyword families. kMatrix calls are computed by the evaluator and never dispatched.
enum class KeywordFamily { kMl, kIo, kPlot, kMatrix };

/// One built-in call keyword with its fixed arity.
struct KeywordInfo {
  const char* name;
  lexer::TokenType token;
  KeywordFamily family;
  int arity;
};

const char* CallCategoryName(CallCategory category);
const char* KeywordFamilyName(KeywordFamily family);

/// Every built-in call keyword, ml first, then io, plot and matrix.
const std::vector<KeywordInfo>& BuiltinKeywords();

/// Looks up a built-in call keyword by lexeme or by token type; nullptr when absent.
const KeywordInfo* FindKeyword(const std::string& name);
const KeywordInfo* FindKeyword(lexer::TokenType token);

/// Resolves the dispatch category of a built-in callee by checking the ml, io and plot tables
/// in that order. Matrix keywords and unknown names yield std::nullopt.
std::optional<CallCategory> ResolveBuiltinCategory(const std::string& name);

}  // namespace dlscript::builtin

#endif  // DLSCRIPT_BUILTIN_KEYWORDS_H_
