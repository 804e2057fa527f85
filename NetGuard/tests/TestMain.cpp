/*
 * ============================================================================
 * NetGuard Test Runner
 * ============================================================================
 *
 * main() for the unit tests under tests/unit/<Concern>/. Keeps gtest's own
 * printer and adds a per-concern summary with the slowest tests, since the
 * socket and storage tests dominate the run time.
 *
 * NETGUARD_TEST_LOG_LEVEL (trace, debug, info, warn, error) raises the
 * logger above its default of error for a single run.
 *
 * ============================================================================
 */

#include "../src/Config/ConfigManager.hpp"
#include "../src/Core/Errors.hpp"
#include "../src/Utils/Logger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

    constexpr size_t SLOWEST_SHOWN = 5;

    /// Concern directory of a test source: tests/unit/Enforcement/HostsFile_Tests.cpp -> Enforcement
    std::string ConcernOf(const char* file) {
        if (file == nullptr) return "?";
        const std::string path(file);
        const std::string marker = "unit/";
        const size_t at = path.rfind(marker);
        if (at == std::string::npos) return "other";
        const size_t begin = at + marker.size();
        const size_t end = path.find('/', begin);
        return end == std::string::npos ? "other" : path.substr(begin, end - begin);
    }

    /// Logger setup and teardown around the whole run.
    class LoggingEnvironment : public ::testing::Environment {
    public:
        void SetUp() override {
            NetGuard::Utils::LoggerConfig config;
            config.async = false;
            config.minimalLevel = NetGuard::Utils::LogLevel::Error;
            if (const char* level = std::getenv("NETGUARD_TEST_LOG_LEVEL")) {
                try {
                    config.minimalLevel = NetGuard::Config::ConfigManager::ParseLogLevel(level);
                }
                catch (const NetGuard::Core::ConfigError& e) {
                    std::cerr << "Ignoring NETGUARD_TEST_LOG_LEVEL: " << e.what() << "\n";
                }
            }
            NetGuard::Utils::Logger::Instance().Initialize(config);
        }

        void TearDown() override {
            NetGuard::Utils::Logger::Instance().ShutDown();
        }
    };

    /// Tallies results per concern and prints them after gtest's own report.
    class ConcernSummary : public ::testing::EmptyTestEventListener {
    public:
        void OnTestStart(const ::testing::TestInfo&) override {
            m_started = std::chrono::steady_clock::now();
        }

        void OnTestEnd(const ::testing::TestInfo& info) override {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - m_started);

            Tally& tally = m_concerns[ConcernOf(info.file())];
            const ::testing::TestResult* result = info.result();
            if (result->Skipped()) {
                ++tally.skipped;
            }
            else if (result->Failed()) {
                ++tally.failed;
                m_failures.push_back(std::string(info.test_suite_name()) + "." + info.name() +
                    "  (" + (info.file() ? info.file() : "?") + ":" + std::to_string(info.line()) + ")");
            }
            else {
                ++tally.passed;
            }
            m_timings.push_back({ std::string(info.test_suite_name()) + "." + info.name(), elapsed });
        }

        void OnTestProgramEnd(const ::testing::UnitTest&) override {
            std::cout << "\nNetGuard tests by concern\n";
            std::cout << "  " << std::left << std::setw(14) << "concern"
                      << std::right << std::setw(8) << "passed" << std::setw(8) << "failed"
                      << std::setw(9) << "skipped" << "\n";
            for (const auto& [concern, tally] : m_concerns) {
                std::cout << "  " << std::left << std::setw(14) << concern
                          << std::right << std::setw(8) << tally.passed << std::setw(8) << tally.failed
                          << std::setw(9) << tally.skipped << "\n";
            }

            std::sort(m_timings.begin(), m_timings.end(),
                [](const Timing& a, const Timing& b) { return a.elapsed > b.elapsed; });
            std::cout << "\nSlowest\n";
            for (size_t i = 0; i < std::min(SLOWEST_SHOWN, m_timings.size()); ++i) {
                std::cout << "  " << std::setw(6) << m_timings[i].elapsed.count() << " ms  "
                          << m_timings[i].name << "\n";
            }

            if (!m_failures.empty()) {
                std::cout << "\nFailed\n";
                for (const auto& failure : m_failures) std::cout << "  " << failure << "\n";
            }
            std::cout << std::endl;
        }

    private:
        struct Tally {
            int passed = 0;
            int failed = 0;
            int skipped = 0;
        };

        struct Timing {
            std::string name;
            std::chrono::milliseconds elapsed;
        };

        std::chrono::steady_clock::time_point m_started;
        std::map<std::string, Tally> m_concerns;
        std::vector<Timing> m_timings;
        std::vector<std::string> m_failures;
    };

}  // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // interceptor tests close sockets under TLS writes
    std::signal(SIGPIPE, SIG_IGN);

    if (::testing::UnitTest::GetInstance()->total_test_count() == 0) {
        std::cerr << "No tests linked into the runner\n";
        return 1;
    }

    ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());
    ::testing::UnitTest::GetInstance()->listeners().Append(new ConcernSummary());
    return RUN_ALL_TESTS();
}
