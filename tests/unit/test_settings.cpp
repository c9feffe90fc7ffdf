#include <catch2/catch_test_macros.hpp>

#include "IniConfig.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <sstream>

TEST_CASE("Settings places config.ini under the override directory") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    Settings settings;
    const auto expected_dir = temp.path() / "KeyProbe";
    CHECK(settings.get_config_path() == (expected_dir / "config.ini").string());
    CHECK(settings.get_config_dir() == expected_dir.string());
    CHECK(settings.get_log_dir() == (expected_dir / "logs").string());
}

TEST_CASE("Settings falls back to XDG_CONFIG_HOME") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", std::nullopt);
    EnvVarGuard xdg("XDG_CONFIG_HOME", temp.path().string());

    Settings settings;
    CHECK(settings.get_config_path() == (temp.path() / "KeyProbe" / "config.ini").string());
}

TEST_CASE("Settings uses built-in defaults without a config file") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    Settings settings;
    CHECK_FALSE(settings.load());
    CHECK(settings.get_model() == ProbeDefaults::kModel);
    CHECK(settings.get_endpoint_template() == ProbeDefaults::kEndpointTemplate);
    CHECK(settings.get_concurrency() == 20);
    CHECK(settings.get_timeout_seconds() == 10);
    CHECK(settings.get_retry_policy().max_attempts == 3);
    CHECK(settings.get_retry_policy().initial_backoff_seconds == 1.0);
    CHECK(settings.get_retry_policy().backoff_factor == 2.0);
    CHECK(settings.get_results_file() == "results.csv");
    CHECK(settings.get_success_file() == "success.txt");
    CHECK(settings.get_log_level() == "info");
}

TEST_CASE("Settings round-trips through save and load") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    Settings writer;
    writer.set_model("gemini-2.0-flash");
    writer.set_concurrency(8);
    writer.set_timeout_seconds(25);
    RetryPolicy policy;
    policy.max_attempts = 5;
    policy.initial_backoff_seconds = 0.5;
    policy.backoff_factor = 1.5;
    writer.set_retry_policy(policy);
    writer.set_results_file("out/report.csv");
    writer.set_success_file("out/ok.txt");
    writer.set_log_level("debug");
    REQUIRE(writer.save());
    REQUIRE(std::filesystem::exists(writer.get_config_path()));

    Settings reader;
    REQUIRE(reader.load());
    CHECK(reader.get_model() == "gemini-2.0-flash");
    CHECK(reader.get_concurrency() == 8);
    CHECK(reader.get_timeout_seconds() == 25);
    CHECK(reader.get_retry_policy().max_attempts == 5);
    CHECK(reader.get_retry_policy().initial_backoff_seconds == 0.5);
    CHECK(reader.get_retry_policy().backoff_factor == 1.5);
    CHECK(reader.get_results_file() == "out/report.csv");
    CHECK(reader.get_success_file() == "out/ok.txt");
    CHECK(reader.get_log_level() == "debug");
}

TEST_CASE("Settings ignores invalid numeric values") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    write_text_file(temp.path() / "KeyProbe" / "config.ini",
                    "[Probe]\n"
                    "EndpointTemplate = https://proxy.example/generate\n"
                    "Concurrency = 0\n"
                    "TimeoutSeconds = soon\n"
                    "[Retry]\n"
                    "MaxAttempts = 4x\n"
                    "InitialBackoffSeconds = -1\n"
                    "BackoffFactor = 0.5\n");

    Settings settings;
    REQUIRE(settings.load());
    CHECK(settings.get_endpoint_template() == ProbeDefaults::kEndpointTemplate);
    CHECK(settings.get_concurrency() == ProbeDefaults::kConcurrency);
    CHECK(settings.get_timeout_seconds() == ProbeDefaults::kTimeoutSeconds);
    CHECK(settings.get_retry_policy().max_attempts == ProbeDefaults::kMaxAttempts);
    CHECK(settings.get_retry_policy().initial_backoff_seconds == ProbeDefaults::kInitialBackoffSeconds);
    CHECK(settings.get_retry_policy().backoff_factor == ProbeDefaults::kBackoffFactor);
}

TEST_CASE("Settings rejects non-finite and oversized backoff values") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    SECTION("infinity and an enormous factor") {
        write_text_file(temp.path() / "KeyProbe" / "config.ini",
                        "[Retry]\n"
                        "InitialBackoffSeconds = inf\n"
                        "BackoffFactor = 1e300\n");
    }
    SECTION("nan and values just past the limits") {
        write_text_file(temp.path() / "KeyProbe" / "config.ini",
                        "[Retry]\n"
                        "InitialBackoffSeconds = 300.5\n"
                        "BackoffFactor = nan\n");
    }

    Settings settings;
    REQUIRE(settings.load());
    CHECK(settings.get_retry_policy().initial_backoff_seconds == ProbeDefaults::kInitialBackoffSeconds);
    CHECK(settings.get_retry_policy().backoff_factor == ProbeDefaults::kBackoffFactor);
}

TEST_CASE("Settings accepts backoff values at the upper limits") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    write_text_file(temp.path() / "KeyProbe" / "config.ini",
                    "[Retry]\nInitialBackoffSeconds = 300\nBackoffFactor = 10\n");

    Settings settings;
    REQUIRE(settings.load());
    CHECK(settings.get_retry_policy().initial_backoff_seconds == 300.0);
    CHECK(settings.get_retry_policy().backoff_factor == 10.0);
}

TEST_CASE("Settings keeps defaults for empty string values") {
    TempDir temp;
    EnvVarGuard config_root("KEY_PROBE_CONFIG_DIR", temp.path().string());

    write_text_file(temp.path() / "KeyProbe" / "config.ini",
                    "[Probe]\nModel =\n[Output]\nResultsFile=\n");

    Settings settings;
    REQUIRE(settings.load());
    CHECK(settings.get_model() == ProbeDefaults::kModel);
    CHECK(settings.get_results_file() == ProbeDefaults::kResultsFile);
}

TEST_CASE("IniConfig parses sections, trims values and skips comments") {
    std::istringstream input(
        "; leading comment\n"
        "[Probe]\n"
        "  Model =  gemini-pro  \n"
        "# another comment\n"
        "Concurrency=4\n"
        "\n"
        "[Output]\n"
        "ResultsFile = r.csv\n");

    IniConfig config;
    config.parse(input);

    CHECK(config.getValue("Probe", "Model") == "gemini-pro");
    CHECK(config.getValue("Probe", "Concurrency") == "4");
    CHECK(config.getValue("Output", "ResultsFile") == "r.csv");
    CHECK(config.hasValue("Probe", "Model"));
    CHECK_FALSE(config.hasValue("Probe", "Missing"));
    CHECK(config.getValue("Probe", "Missing", "fallback") == "fallback");
}

TEST_CASE("IniConfig counts malformed lines and keeps the rest") {
    std::istringstream input(
        "[Probe\n"
        "just some words\n"
        "= no key\n"
        "[Retry]\n"
        "MaxAttempts = 2\n");

    IniConfig config;
    CHECK(config.parse(input) == 3);
    CHECK(config.getValue("Retry", "MaxAttempts") == "2");
}

TEST_CASE("IniConfig writes sections that parse back to the same values") {
    IniConfig config;
    config.setValue("Probe", "Model", "gemini-pro");
    config.setValue("Output", "ResultsFile", "r.csv");

    std::ostringstream out;
    config.write(out);
    CHECK(out.str() == "[Output]\nResultsFile = r.csv\n\n[Probe]\nModel = gemini-pro\n");

    std::istringstream in(out.str());
    IniConfig reread;
    CHECK(reread.parse(in) == 0);
    CHECK(reread.getValue("Probe", "Model") == "gemini-pro");
    CHECK(reread.getValue("Output", "ResultsFile") == "r.csv");
}
