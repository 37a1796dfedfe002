//
// Dataset discovery
//
#include <asset_matrix/catalog/asset_catalog.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace asset_matrix::catalog {

AssetMap DiscoverAssets(const fs::path &directory, std::string_view extension) {
  AssetMap assets;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    SPDLOG_WARN("Data directory not found: {}", directory.string());
    return assets;
  }

  for (const auto &entry : fs::directory_iterator(directory, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const auto &path = entry.path();
    if (path.extension() != extension) {
      continue;
    }
    assets.insert_or_assign(path.stem().string(), path);
  }
  if (ec) {
    SPDLOG_WARN("Error while listing {}: {}", directory.string(), ec.message());
  }

  SPDLOG_INFO("Discovered {} asset data files in {}", assets.size(),
              directory.string());
  for (const auto &[symbol, path] : assets) {
    std::error_code sizeEc;
    const auto bytes = fs::file_size(path, sizeEc);
    SPDLOG_INFO("  - {}: {} ({:.1f} MB)", symbol, path.filename().string(),
                sizeEc ? 0.0 : static_cast<double>(bytes) / (1024.0 * 1024.0));
  }
  return assets;
}

std::vector<Asset> ToAssets(const AssetMap &assets) {
  std::vector<Asset> result;
  result.reserve(assets.size());
  for (const auto &[symbol, path] : assets) {
    result.push_back(Asset{.symbol = symbol, .data_path = path});
  }
  return result;
}

std::vector<std::string> Symbols(const AssetMap &assets) {
  std::vector<std::string> symbols;
  symbols.reserve(assets.size());
  for (const auto &[symbol, path] : assets) {
    symbols.push_back(symbol);
  }
  return symbols;
}

} // namespace asset_matrix::catalog
