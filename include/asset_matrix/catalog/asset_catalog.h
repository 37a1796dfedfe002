#pragma once
//
// Dataset discovery: one file per asset, named <SYMBOL><extension>
//

#include <asset_matrix/core/constants.h>
#include <asset_matrix/core/test_result.h>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace asset_matrix::catalog {

// Ordered by symbol so task submission order is deterministic
using AssetMap = std::map<std::string, std::filesystem::path>;

/**
 * @brief Enumerate the datasets found directly inside @p directory.
 *
 * Non-recursive. The symbol is the filename stem (BTC-USD-15m.csv -> BTC-USD-15m).
 * A missing directory is logged as a warning and yields an empty map.
 */
AssetMap DiscoverAssets(const std::filesystem::path &directory,
                        std::string_view extension = DEFAULT_DATASET_EXTENSION);

std::vector<Asset> ToAssets(const AssetMap &assets);

// Symbols in map order
std::vector<std::string> Symbols(const AssetMap &assets);

} // namespace asset_matrix::catalog
