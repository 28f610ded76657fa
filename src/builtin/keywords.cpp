#include "builtin/keywords.h"

namespace dlscript::builtin {

namespace {
using lexer::TokenType;

const std::vector<KeywordInfo>& Table() {
  static const std::vector<KeywordInfo> kTable = {
      {"linear_regression", TokenType::kLinearRegression, KeywordFamily::kMl, 2},
      {"mlp_classifier", TokenType::kMlpClassifier, KeywordFamily::kMl, 3},
      {"neural_network", TokenType::kNeuralNetwork, KeywordFamily::kMl, 3},
      {"predict", TokenType::kPredict, KeywordFamily::kMl, 2},
      {"train", TokenType::kTrain, KeywordFamily::kMl, 2},
      {"kmeans", TokenType::kKmeans, KeywordFamily::kMl, 2},
      {"fit_predict", TokenType::kFitPredict, KeywordFamily::kMl, 2},
      {"get_centroids", TokenType::kGetCentroids, KeywordFamily::kMl, 1},
      {"autoencoder", TokenType::kAutoencoder, KeywordFamily::kMl, 2},
      {"encode", TokenType::kEncode, KeywordFamily::kMl, 2},
      {"decode", TokenType::kDecode, KeywordFamily::kMl, 2},
      {"reconstruct", TokenType::kReconstruct, KeywordFamily::kMl, 2},
      {"reconstruction_error", TokenType::kReconstructionError, KeywordFamily::kMl, 2},
      {"read_file", TokenType::kReadFile, KeywordFamily::kIo, 1},
      {"write_file", TokenType::kWriteFile, KeywordFamily::kIo, 2},
      {"print", TokenType::kPrint, KeywordFamily::kIo, 1},
      {"plot", TokenType::kPlot, KeywordFamily::kPlot, 1},
      {"scatter", TokenType::kScatter, KeywordFamily::kPlot, 2},
      {"histogram", TokenType::kHistogram, KeywordFamily::kPlot, 1},
      {"transpose", TokenType::kTranspose, KeywordFamily::kMatrix, 1},
      {"inverse", TokenType::kInverse, KeywordFamily::kMatrix, 1},
      {"matmult", TokenType::kMatMult, KeywordFamily::kMatrix, 2},
      {"matadd", TokenType::kMatAdd, KeywordFamily::kMatrix, 2},
      {"matsub", TokenType::kMatSub, KeywordFamily::kMatrix, 2},
  };
  return kTable;
}

const KeywordInfo* FindInFamily(const std::string& name, KeywordFamily family) {
  for (const auto& info : Table()) {
    if (info.family == family && name == info.name) {
      return &info;
    }
  }
  return nullptr;
}
}  // namespace

const char* CallCategoryName(CallCategory category) {
  switch (category) {
    case CallCategory::kUser:
      return "user";
    case CallCategory::kMl:
      return "ml";
    case CallCategory::kIo:
      return "io";
    case CallCategory::kPlot:
      return "plot";
  }
  return "unknown";
}

const char* KeywordFamilyName(KeywordFamily family) {
  switch (family) {
    case KeywordFamily::kMl:
      return "ml";
    case KeywordFamily::kIo:
      return "io";
    case KeywordFamily::kPlot:
      return "plot";
    case KeywordFamily::kMatrix:
      return "matrix";
  }
  return "unknown";
}

const std::vector<KeywordInfo>& BuiltinKeywords() {
  return Table();
}

const KeywordInfo* FindKeyword(const std::string& name) {
  for (const auto& info : Table()) {
    if (name == info.name) {
      return &info;
    }
  }
  return nullptr;
}

const KeywordInfo* FindKeyword(lexer::TokenType token) {
  for (const auto& info : Table()) {
    if (info.token == token) {
      return &info;
    }
  }
  return nullptr;
}

std::optional<CallCategory> ResolveBuiltinCategory(const std::string& name) {
  if (FindInFamily(name, KeywordFamily::kMl) != nullptr) return CallCategory::kMl;
  if (FindInFamily(name, KeywordFamily::kIo) != nullptr) return CallCategory::kIo;
  if (FindInFamily(name, KeywordFamily::kPlot) != nullptr) return CallCategory::kPlot;
  return std::nullopt;
}

}  // namespace dlscript::builtin
