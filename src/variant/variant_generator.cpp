//
// Per-asset strategy variants
//
#include <asset_matrix/variant/variant_generator.h>
#include <format>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace asset_matrix::variant {

namespace {
std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    const auto pos = text.find('\n', start);
    if (pos == std::string::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

std::string JoinLines(const std::vector<std::string> &lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out += '\n';
    out += lines[i];
  }
  return out;
}

bool IsBlank(const std::string &line) {
  return line.find_first_not_of(" \t\r\f\v") == std::string::npos;
}
} // namespace

const std::vector<RewriteRule> &DefaultRewriteRules() {
  static const std::vector<RewriteRule> rules{
      // data_path = "..." / data_path = '...'
      {"data_path_assignment",
       std::regex(R"(data_path\s*=\s*["'].*?["'])"),
       R"(data_path = "{data_path}")"},
      // pd.read_csv("...") / pd.read_csv('...')
      {"read_csv_call",
       std::regex(R"(pd\.read_csv\(["'].*?["']\))"),
       R"(pd.read_csv("{data_path}"))"},
      // data = pd.read_csv("...")
      {"read_csv_bound",
       std::regex(R"(data\s*=\s*pd\.read_csv\(["'].*?["']\))"),
       R"(data = pd.read_csv("{data_path}"))"},
  };
  return rules;
}

std::string RenderReplacement(const std::string &replacementTemplate,
                              const std::string &dataPath) {
  std::string escaped;
  escaped.reserve(dataPath.size());
  for (const char c : dataPath) {
    if (c == '$') escaped += '$';
    escaped += c;
  }

  std::string rendered = replacementTemplate;
  const auto pos = rendered.find(DATA_PATH_PLACEHOLDER);
  if (pos != std::string::npos) {
    rendered.replace(pos, DATA_PATH_PLACEHOLDER.size(), escaped);
  }
  return rendered;
}

size_t FindHeaderEnd(const std::vector<std::string> &lines) {
  size_t end = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    if (line.starts_with("import ") || line.starts_with("from ") ||
        line.starts_with('#') || IsBlank(line)) {
      end = i + 1;
    } else {
      break;
    }
  }
  return end;
}

std::string InjectDataPath(const std::string &sourceText, const Asset &asset) {
  auto lines = SplitLines(sourceText);
  const auto headerEnd = FindHeaderEnd(lines);

  const std::vector<std::string> injected{
      "",
      std::format("# Data path for {} (injected by Multi-Asset Tester)", asset.symbol),
      std::format(R"(data_path = "{}")", asset.data_path.string()),
      ""};
  lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(headerEnd),
               injected.begin(), injected.end());
  return JoinLines(lines);
}

VariantGenerator::VariantGenerator() : m_rules(DefaultRewriteRules()) {}

VariantGenerator::VariantGenerator(std::vector<RewriteRule> rules)
    : m_rules(std::move(rules)) {}

RewriteOutcome VariantGenerator::Rewrite(const std::string &sourceText,
                                         const Asset &asset) const {
  RewriteOutcome outcome{.text = sourceText};
  const auto dataPath = asset.data_path.string();

  for (const auto &rule : m_rules) {
    if (!std::regex_search(outcome.text, rule.pattern)) {
      continue;
    }
    outcome.text = std::regex_replace(
        outcome.text, rule.pattern,
        RenderReplacement(rule.replacement_template, dataPath));
    outcome.applied_rules.push_back(rule.name);
  }

  if (outcome.applied_rules.empty()) {
    outcome.text = InjectDataPath(sourceText, asset);
    outcome.injected = true;
  }
  return outcome;
}

fs::path VariantGenerator::VariantFileName(const fs::path &strategyPath,
                                           const std::string &symbol) {
  return std::format("{}_{}{}", strategyPath.stem().string(), symbol,
                     strategyPath.extension().string());
}

Variant VariantGenerator::Generate(const std::string &sourceText,
                                   const fs::path &strategyPath,
                                   const Asset &asset,
                                   const fs::path &outputDir) const {
  std::error_code ec;
  fs::create_directories(outputDir, ec);
  if (ec) {
    throw std::runtime_error(std::format("Failed to create variant directory {}: {}",
                                         outputDir.string(), ec.message()));
  }

  const auto outcome = Rewrite(sourceText, asset);
  if (outcome.injected) {
    SPDLOG_WARN("[{} @ {}] No data path found in {}, injecting declaration",
                strategyPath.stem().string(), asset.symbol,
                strategyPath.filename().string());
  }

  const auto variantPath = outputDir / VariantFileName(strategyPath, asset.symbol);
  std::ofstream file(variantPath, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error(
        std::format("Failed to open variant for writing: {}", variantPath.string()));
  }
  file << outcome.text;
  file.close();
  if (!file) {
    throw std::runtime_error(
        std::format("Failed to write variant: {}", variantPath.string()));
  }

  SPDLOG_DEBUG("[{} @ {}] Created variant {}", strategyPath.stem().string(),
               asset.symbol, variantPath.filename().string());
  return Variant{.asset = asset, .path = variantPath};
}

std::string ReadSourceFile(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open strategy source: {}", path.string()));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

} // namespace asset_matrix::variant
