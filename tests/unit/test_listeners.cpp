#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <catch2/catch_test_case_info.hpp>

#include "TestHooks.hpp"

#include <iostream>

class CameraSorterTestListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testCaseStarting(Catch::TestCaseInfo const& info) override {
        std::cout << "[TEST] " << info.name << std::endl;
    }

    // A move hook left behind by a failed REQUIRE must not leak into the next case
    void testCaseEnded(Catch::TestCaseStats const& stats) override {
        TestHooks::reset_move_hook();
        if (!stats.totals.assertions.allOk()) {
            std::cout << "[FAIL] " << stats.testInfo->name << " ("
                      << stats.totals.assertions.failed << " failed assertion(s))" << std::endl;
        }
    }
};

CATCH_REGISTER_LISTENER(CameraSorterTestListener)
