//
// Unit tests for CondaProcessRunner
// Uses /bin/sh as the launcher so no conda installation is needed.
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "runner/conda_process_runner.h"
#include "../test_workspace.h"

#include <filesystem>

using namespace asset_matrix;
using namespace asset_matrix::runner;
using asset_matrix::test::TestWorkspace;
using Catch::Matchers::ContainsSubstring;

namespace {
CondaProcessRunner ShellRunner() {
    CondaProcessRunner runner;
    runner.SetLauncher({"/bin/sh"});
    runner.SetPollInterval(std::chrono::milliseconds{10});
    return runner;
}
} // namespace

TEST_CASE("CondaProcessRunner command line", "[runner]") {

    SECTION("Default launcher runs python inside the conda environment") {
        CondaProcessRunner runner;
        REQUIRE(runner.BuildCommand("/tmp/v/Momentum_BTC.py", "tflow") ==
                std::vector<std::string>{"conda", "run", "-n", "tflow", "python", "/tmp/v/Momentum_BTC.py"});
    }

    SECTION("Custom python interpreter") {
        CondaProcessRunner runner("python3.11");
        REQUIRE(runner.BuildCommand("/x.py", "research").at(4) == "python3.11");
    }

    SECTION("Environment token is substituted anywhere in the launcher") {
        CondaProcessRunner runner;
        runner.SetLauncher({"/opt/envs/{env}/bin/python", "{env}", "-u"});
        REQUIRE(runner.BuildCommand("/x.py", "tflow") ==
                std::vector<std::string>{"/opt/envs/{env}/bin/python", "tflow", "-u", "/x.py"});
    }

    SECTION("Empty launcher is rejected") {
        CondaProcessRunner runner;
        REQUIRE_THROWS_AS(runner.SetLauncher({}), std::invalid_argument);
    }
}

TEST_CASE("CondaProcessRunner execution", "[runner][process]") {
    TestWorkspace workspace;
    auto runner = ShellRunner();

    SECTION("Zero exit is a success with captured output") {
        auto script = workspace.Write("ok.sh",
            "echo 'Sharpe Ratio    1.85'\n"
            "echo 'Return [%]   12.40'\n"
            "echo 'FutureWarning: deprecated' >&2\n");

        auto outcome = runner.Execute(script, "tflow", std::chrono::seconds{10});

        REQUIRE(outcome.success);
        REQUIRE_FALSE(outcome.timed_out);
        REQUIRE_FALSE(outcome.error.has_value());
        REQUIRE_THAT(outcome.stdout_text, ContainsSubstring("Sharpe Ratio    1.85"));
        REQUIRE(outcome.stderr_text == "FutureWarning: deprecated\n");
        REQUIRE(std::filesystem::exists(script.string() + ".stdout"));
        REQUIRE(std::filesystem::exists(script.string() + ".stderr"));
    }

    SECTION("Non-zero exit carries the last stderr line") {
        auto script = workspace.Write("fail.sh",
            "echo 'Traceback (most recent call last):' >&2\n"
            "echo '  File \"strategy.py\", line 12' >&2\n"
            "echo 'ZeroDivisionError: division by zero' >&2\n"
            "echo '' >&2\n"
            "exit 3\n");

        auto outcome = runner.Execute(script, "tflow", std::chrono::seconds{10});

        REQUIRE_FALSE(outcome.success);
        REQUIRE_FALSE(outcome.timed_out);
        REQUIRE(outcome.error == "Exit code 3: ZeroDivisionError: division by zero");
        REQUIRE_THAT(outcome.stderr_text, ContainsSubstring("Traceback"));
    }

    SECTION("Non-zero exit without stderr") {
        auto script = workspace.Write("silent.sh", "exit 2\n");
        auto outcome = runner.Execute(script, "tflow", std::chrono::seconds{10});
        REQUIRE(outcome.error == "Exit code 2");
    }

    SECTION("Overrunning process is killed at the deadline") {
        auto script = workspace.Write("slow.sh", "echo started\nsleep 30\necho finished\n");

        const auto start = std::chrono::steady_clock::now();
        auto outcome = runner.Execute(script, "tflow", std::chrono::seconds{1});
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(outcome.timed_out);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error == "Timed out after 1s");
        REQUIRE_THAT(outcome.stdout_text, ContainsSubstring("started"));
        REQUIRE_FALSE(outcome.stdout_text.find("finished") != std::string::npos);
        REQUIRE(elapsed < std::chrono::seconds{10});
    }

    SECTION("Process killed by a signal") {
        auto script = workspace.Write("killed.sh", "kill -9 $$\n");
        auto outcome = runner.Execute(script, "tflow", std::chrono::seconds{10});
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error == "Killed by signal 9");
    }

    SECTION("Missing launcher binary") {
        runner.SetLauncher({"/nonexistent/asset_matrix/python"});
        auto script = workspace.Write("any.py", "print(1)\n");
        auto outcome = runner.Execute(script, "tflow", std::chrono::seconds{10});
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error == "Failed to launch /nonexistent/asset_matrix/python");
    }

    SECTION("Unwritable capture location throws") {
        REQUIRE_THROWS_AS(
            runner.Execute(workspace.Root() / "no_such_dir" / "x.sh", "tflow", std::chrono::seconds{1}),
            std::runtime_error);
    }
}

TEST_CASE("LastNonBlankLine", "[runner]") {
    REQUIRE(LastNonBlankLine("").empty());
    REQUIRE(LastNonBlankLine("\n  \n").empty());
    REQUIRE(LastNonBlankLine("single") == "single");
    REQUIRE(LastNonBlankLine("first\n  ValueError: bad\n\n") == "ValueError: bad");
}
