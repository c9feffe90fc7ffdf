#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <catch2/catch_test_case_info.hpp>
#include <catch2/interfaces/catch_interfaces_reporter.hpp>

#include <iostream>

// Prints each test name and flags the ones that failed, so ctest logs show progress.
class TestNamePrinter : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testCaseStarting(Catch::TestCaseInfo const& info) override {
        std::cout << "[TEST] " << info.name << std::endl;
    }

    void testCaseEnded(Catch::TestCaseStats const& stats) override {
        if (stats.totals.assertions.failed > 0) {
            std::cout << "[FAIL] " << stats.testInfo->name << " ("
                      << stats.totals.assertions.failed << " failed assertion(s))" << std::endl;
        }
    }
};

CATCH_REGISTER_LISTENER(TestNamePrinter)
