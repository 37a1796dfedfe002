//
// Unit tests for JSON persistence of matrix runs
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <asset_matrix/report/result_store.h>
#include "../test_workspace.h"

using namespace asset_matrix;
using namespace asset_matrix::report;
using asset_matrix::test::TestWorkspace;
using Catch::Matchers::ContainsSubstring;

namespace {

ResultFile SampleRun() {
    TestResult btc("Momentum", Asset{.symbol = "BTC-USD", .data_path = "/data/BTC-USD.csv"});
    MetricsRecord metrics;
    metrics.sharpe = 1.85;
    metrics.return_pct = 12.4;
    btc.MarkSucceeded(metrics, "Sharpe Ratio 1.85\nReturn [%] 12.4\n", "");
    btc.SetExecutionTime(3.25);
    btc.SetTimestamp("2025-03-14T09:26:53.589793Z");

    TestResult eth("Momentum", Asset{.symbol = "ETH-USD", .data_path = "/data/ETH-USD.csv"});
    eth.MarkFailed("Exit code 1: ZeroDivisionError: division by zero",
                   "Traceback (most recent call last):\nZeroDivisionError: division by zero\n");
    eth.SetExecutionTime(0.5);

    return ResultFile{.timestamp = "2025-03-14T09:26:53",
                      .strategy = "Momentum",
                      .total_tests = 2,
                      .assets_tested = {"BTC-USD", "ETH-USD"},
                      .max_workers = 4,
                      .timeout = 300,
                      .conda_env = "tflow",
                      .results = {btc, eth}};
}

} // namespace

TEST_CASE("Result file serialization", "[report][json]") {
    const auto original = SampleRun();
    const auto json = SerializeResultFile(original);

    SECTION("Absent metrics are omitted") {
        REQUIRE_THAT(json, ContainsSubstring("\"sharpe\""));
        REQUIRE_THAT(json, ContainsSubstring("\"return\""));
        REQUIRE(json.find("max_drawdown") == std::string::npos);
        REQUIRE(json.find("win_rate") == std::string::npos);
    }

    SECTION("Tested assets are written as a symbol list") {
        REQUIRE_THAT(json, ContainsSubstring("\"assets_tested\""));
        REQUIRE_THAT(json, ContainsSubstring("\"BTC-USD\""));
        REQUIRE(json.find("\"assets_tested\": 2") == std::string::npos);
    }

    SECTION("Status is written as a lowercase string") {
        REQUIRE_THAT(json, ContainsSubstring("\"success\""));
        REQUIRE_THAT(json, ContainsSubstring("\"failed\""));
    }

    SECTION("Parsing restores every field") {
        const auto parsed = ParseResultFile(json);

        REQUIRE(parsed.timestamp == original.timestamp);
        REQUIRE(parsed.strategy == "Momentum");
        REQUIRE(parsed.total_tests == 2);
        REQUIRE(parsed.assets_tested == std::vector<std::string>{"BTC-USD", "ETH-USD"});
        REQUIRE(parsed.max_workers == 4);
        REQUIRE(parsed.timeout == 300);
        REQUIRE(parsed.conda_env == "tflow");
        REQUIRE(parsed.results.size() == 2);

        const auto& btc = parsed.results[0];
        REQUIRE(btc.GetStatus() == TestStatus::Success);
        REQUIRE(btc.GetAsset() == "BTC-USD");
        REQUIRE(btc.GetDataPath() == "/data/BTC-USD.csv");
        REQUIRE(btc.GetMetrics() == original.results[0].GetMetrics());
        REQUIRE(btc.GetExecutionTime() == 3.25);
        REQUIRE(btc.GetTimestamp() == "2025-03-14T09:26:53.589793Z");
        REQUIRE(btc.GetStdout() == original.results[0].GetStdout());
        REQUIRE_FALSE(btc.GetError().has_value());

        const auto& eth = parsed.results[1];
        REQUIRE(eth.GetStatus() == TestStatus::Failed);
        REQUIRE(eth.GetError() == "Exit code 1: ZeroDivisionError: division by zero");
        REQUIRE(eth.GetMetrics().Empty());
        REQUIRE_THAT(eth.GetStderr().value_or(""), ContainsSubstring("Traceback"));
    }

    SECTION("Captured output can be dropped") {
        const auto compact = SerializeResultFile(original, false);
        REQUIRE(compact.find("Traceback") == std::string::npos);
        REQUIRE(compact.find("Return [%] 12.4") == std::string::npos);

        const auto parsed = ParseResultFile(compact);
        REQUIRE_FALSE(parsed.results[0].GetStdout().has_value());
        REQUIRE(parsed.results[0].GetMetrics().sharpe == 1.85);
    }
}

TEST_CASE("Result file parsing", "[report][json]") {

    SECTION("Hand-written file with nulls and extra keys") {
        const std::string json = R"({
            "timestamp": "2025-03-14T09:26:53",
            "strategy": "Breakout",
            "total_tests": 1,
            "assets_tested": ["SOL-USD", "XRP-USD"],
            "max_workers": 8,
            "timeout": 600,
            "conda_env": "research",
            "hostname": "workstation",
            "results": [{
                "strategy": "Breakout",
                "asset": "SOL-USD",
                "data_path": "/data/SOL-USD.csv",
                "status": "timeout",
                "error": "Timed out after 600s",
                "metrics": {"sharpe": 3.0},
                "execution_time": 600.1,
                "timestamp": "2025-03-14T09:36:53.000000Z",
                "stdout": null
            }]
        })";

        const auto parsed = ParseResultFile(json);
        REQUIRE(parsed.conda_env == "research");
        REQUIRE(parsed.assets_tested == std::vector<std::string>{"SOL-USD", "XRP-USD"});
        REQUIRE(parsed.results.size() == 1);
        REQUIRE(parsed.results[0].GetStatus() == TestStatus::Timeout);
        // metrics only accompany a success
        REQUIRE(parsed.results[0].GetMetrics().Empty());
        REQUIRE_FALSE(parsed.results[0].GetStdout().has_value());
    }

    SECTION("Malformed JSON throws") {
        REQUIRE_THROWS_WITH(ParseResultFile("{\"strategy\": "),
                            ContainsSubstring("Failed to parse result file"));
    }

    SECTION("Unknown status throws") {
        REQUIRE_THROWS_WITH(
            ParseResultFile(R"({"results": [{"status": "crashed"}]})"),
            ContainsSubstring("Invalid test status"));
    }
}

TEST_CASE("Result file IO", "[report][io]") {
    TestWorkspace workspace;
    const auto path = workspace.Root() / "results" / "nested" / "Momentum.json";

    WriteResultFile(path, SampleRun());
    REQUIRE(std::filesystem::exists(path));

    const auto loaded = ReadResultFile(path);
    REQUIRE(loaded.results.size() == 2);
    REQUIRE(loaded.results[1].GetAsset() == "ETH-USD");

    REQUIRE_THROWS_WITH(ReadResultFile(workspace.Root() / "missing.json"),
                        ContainsSubstring("Results file not found"));
}

TEST_CASE("Result file for a run with no assets", "[report][io]") {
    TestWorkspace workspace;
    const auto path = workspace.Root() / "results" / "Empty.json";

    WriteResultFile(path, ResultFile{.timestamp = "2025-03-14T09:26:53",
                                     .strategy = "Momentum",
                                     .total_tests = 0,
                                     .max_workers = 4,
                                     .timeout = 300,
                                     .conda_env = "tflow"});
    REQUIRE(std::filesystem::exists(path));

    const auto loaded = ReadResultFile(path);
    REQUIRE(loaded.total_tests == 0);
    REQUIRE(loaded.assets_tested.empty());
    REQUIRE(loaded.results.empty());
}

TEST_CASE("DefaultResultPath", "[report][io]") {
    using namespace std::chrono;
    const auto when = sys_days{year{2025} / March / 14} + hours{9} + minutes{26} + seconds{53} +
                      milliseconds{589};

    const auto path = DefaultResultPath("results", "MomentumStrategy_BT", when);

    REQUIRE(path.parent_path().string() == "results");
    REQUIRE(path.filename().string() == "MomentumStrategy_BT_20250314_092653.json");
}
