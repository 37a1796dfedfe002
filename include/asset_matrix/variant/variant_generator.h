#pragma once
//
// Per-asset strategy variants
// Rewrites the data-source reference of a strategy source so that it reads
// the dataset of one asset. Best-effort textual rewrite, not a parser.
//

#include <asset_matrix/core/test_result.h>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace asset_matrix::variant {

// Placeholder substituted with the asset's dataset path in replacement templates
inline constexpr std::string_view DATA_PATH_PLACEHOLDER = "{data_path}";

struct RewriteRule {
  std::string name;
  std::regex pattern;
  std::string replacement_template;
};

// Ordered rule list. Every matching rule is applied, in this order.
const std::vector<RewriteRule> &DefaultRewriteRules();

struct RewriteOutcome {
  std::string text;
  std::vector<std::string> applied_rules;
  bool injected{false};
};

struct Variant {
  Asset asset;
  std::filesystem::path path;
};

class VariantGenerator {
public:
  VariantGenerator();
  explicit VariantGenerator(std::vector<RewriteRule> rules);

  // Pure rewrite of the source text, no I/O
  [[nodiscard]] RewriteOutcome Rewrite(const std::string &sourceText,
                                       const Asset &asset) const;

  // Rewrite and materialize <strategy-stem>_<symbol><ext> under outputDir.
  // Throws std::runtime_error if the file cannot be written.
  Variant Generate(const std::string &sourceText,
                   const std::filesystem::path &strategyPath,
                   const Asset &asset,
                   const std::filesystem::path &outputDir) const;

  static std::filesystem::path
  VariantFileName(const std::filesystem::path &strategyPath,
                  const std::string &symbol);

private:
  std::vector<RewriteRule> m_rules;
};

// Renders a replacement template for std::regex_replace, escaping '$'
std::string RenderReplacement(const std::string &replacementTemplate,
                              const std::string &dataPath);

// Index of the first line after the leading header block
// (blank lines, '#' comments, import/from lines)
size_t FindHeaderEnd(const std::vector<std::string> &lines);

std::string InjectDataPath(const std::string &sourceText, const Asset &asset);

std::string ReadSourceFile(const std::filesystem::path &path);

} // namespace asset_matrix::variant
