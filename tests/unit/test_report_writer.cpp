#include <catch2/catch_test_macros.hpp>

#include "AppException.hpp"
#include "ReportWriter.hpp"
#include "TestHelpers.hpp"

#include <sstream>

namespace {

ProbeResult make_result(std::string key, ProbeStatus status, long http_status,
                        std::string detail, double elapsed)
{
    ProbeResult result;
    result.key = std::move(key);
    result.status = status;
    result.http_status = http_status;
    result.detail = std::move(detail);
    result.elapsed_seconds = elapsed;
    return result;
}

} // namespace

TEST_CASE("CSV fields are quoted only when needed") {
    CHECK(ReportWriter::escape_csv_field("plain") == "plain");
    CHECK(ReportWriter::escape_csv_field("") == "");
    CHECK(ReportWriter::escape_csv_field("a,b") == "\"a,b\"");
    CHECK(ReportWriter::escape_csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(ReportWriter::escape_csv_field("line1\nline2") == "\"line1\nline2\"");
}

TEST_CASE("CSV report has a header and one row per result") {
    const std::vector<ProbeResult> results = {
        make_result("AIzaOk", ProbeStatus::Valid, 200, "OK", 0.4),
        make_result("AIzaNo", ProbeStatus::Invalid, 403, "{\"error\": \"denied, sorry\"}", 1.234),
        make_result("AIzaLost", ProbeStatus::Error, -1, "Timeout", 30.0),
    };

    std::ostringstream out;
    ReportWriter::write_results_csv(results, out);

    const std::string expected =
        "key,status,http_status,detail,elapsed_seconds\r\n"
        "AIzaOk,valid,200,OK,0.40\r\n"
        "AIzaNo,invalid,403,\"{\"\"error\"\": \"\"denied, sorry\"\"}\",1.23\r\n"
        "AIzaLost,error,-1,Timeout,30.00\r\n";
    CHECK(out.str() == expected);
}

TEST_CASE("CSV report with no results holds only the header") {
    std::ostringstream out;
    ReportWriter::write_results_csv({}, out);
    CHECK(out.str() == "key,status,http_status,detail,elapsed_seconds\r\n");
}

TEST_CASE("CSV report is written to disk, creating parent folders") {
    TempDir temp;
    const auto path = temp.path() / "nested" / "results.csv";
    const std::vector<ProbeResult> results = {
        make_result("AIzaM", ProbeStatus::ModelNotFound, 404, "not found", 0.1),
    };

    ReportWriter::write_results_csv(results, path.string());

    CHECK(read_text_file(path) ==
          "key,status,http_status,detail,elapsed_seconds\r\n"
          "AIzaM,model_not_found,404,not found,0.10\r\n");
}

TEST_CASE("CSV report fails with an app error when the target is a directory") {
    TempDir temp;
    try {
        ReportWriter::write_results_csv({}, temp.path().string());
        FAIL("Expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::OUTPUT_WRITE_FAILED);
    }
}

TEST_CASE("Success file lists valid keys sorted, one per line") {
    TempDir temp;
    const auto path = temp.path() / "success.txt";
    const std::set<std::string> keys = {"AIzaZulu", "AIzaAlpha", "AIzaMike"};

    REQUIRE(ReportWriter::write_success_file(keys, path.string()));
    CHECK(read_text_file(path) == "AIzaAlpha\nAIzaMike\nAIzaZulu\n");

    REQUIRE(ReportWriter::write_success_file(keys, path.string()));
    CHECK(read_text_file(path) == "AIzaAlpha\nAIzaMike\nAIzaZulu\n");
}

TEST_CASE("Success file is not created when no key is valid") {
    TempDir temp;
    const auto path = temp.path() / "success.txt";

    CHECK_FALSE(ReportWriter::write_success_file({}, path.string()));
    CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Summary counts everything that is not a definite answer as an error") {
    const std::vector<ProbeResult> results = {
        make_result("a", ProbeStatus::Valid, 200, "OK", 0.1),
        make_result("b", ProbeStatus::Valid, 200, "OK", 0.1),
        make_result("c", ProbeStatus::Invalid, 401, "", 0.1),
        make_result("d", ProbeStatus::ModelNotFound, 404, "", 0.1),
        make_result("e", ProbeStatus::Error, 429, "", 0.1),
        make_result("f", ProbeStatus::Error, -1, "Timeout", 0.1),
    };

    const ProbeSummary summary = ReportWriter::summarize(results, results.size());
    CHECK(summary.total == 6);
    CHECK(summary.valid == 2);
    CHECK(summary.invalid == 1);
    CHECK(summary.model_not_found == 1);
    CHECK(summary.other_errors == 2);

    CHECK(ReportWriter::format_summary(summary) ==
          "Done: total 6, valid 2, invalid 1, model_not_found 1, other errors 2.");
}

TEST_CASE("Summary counts keys without a result as errors") {
    const std::vector<ProbeResult> results = {
        make_result("a", ProbeStatus::Valid, 200, "OK", 0.1),
    };
    const ProbeSummary summary = ReportWriter::summarize(results, 4);
    CHECK(summary.total == 4);
    CHECK(summary.valid == 1);
    CHECK(summary.other_errors == 3);
}

TEST_CASE("Progress line masks the key") {
    const ProbeResult result = make_result("AIzaSyVerySecret", ProbeStatus::Invalid, 403, "x", 0.5);
    const ProgressEvent event{3, 10, result};

    CHECK(ReportWriter::format_progress_line(event) ==
          "[3/10] key=AIzaSy... status=invalid http=403 t=0.50s");
}

TEST_CASE("Elapsed time is printed with two decimals") {
    CHECK(ReportWriter::format_elapsed(0.0) == "0.00");
    CHECK(ReportWriter::format_elapsed(2.5) == "2.50");
    CHECK(ReportWriter::format_elapsed(12.345678) == "12.35");
}
