#ifndef TEST_RUNNER_HPP
#define TEST_RUNNER_HPP

#include "common/errors.hpp"
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace Test {

/**
 * Outcome of a single test case
 */
struct TestResult {
    std::string testName;
    bool passed = true;
    std::vector<std::string> failures;

    void addFailure(const std::string& message) {
        passed = false;
        failures.push_back(message);
    }

    void check(bool condition, const std::string& what) {
        if (!condition) {
            addFailure(what);
        }
    }
};

struct TestCase {
    std::string name;
    std::string description;
    std::function<void(TestResult&)> run;
};

struct TestSuite {
    std::string name;
    std::vector<TestCase> cases;
};

inline std::string join(const std::vector<std::string>& ids) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ",";
        oss << ids[i];
    }
    oss << "]";
    return oss.str();
}

inline void checkIds(TestResult& result, const std::vector<std::string>& actual,
                     const std::vector<std::string>& expected, const std::string& what) {
    if (actual != expected) {
        result.addFailure(what + ": expected " + join(expected) + ", got " + join(actual));
    }
}

/**
 * Run fn and require a GameError carrying the given code
 */
template<typename Fn>
void expectError(TestResult& result, kott::ErrorCode expected, Fn&& fn, const std::string& what) {
    try {
        fn();
        result.addFailure(what + ": expected " + kott::errorCodeToString(expected) + ", nothing thrown");
    } catch (const kott::GameError& e) {
        if (e.code() != expected) {
            result.addFailure(what + ": expected " + kott::errorCodeToString(expected)
                              + ", got " + kott::errorCodeToString(e.code()));
        }
    }
}

class TestRunner {
public:
    /**
     * Run every suite (or only the one named by filter)
     * Returns the number of failed test cases
     */
    int runAll(const std::vector<TestSuite>& suites, const std::string& filter = std::string()) {
        std::vector<TestResult> results;

        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << "           KING OF THE TABLE - TEST SUITE\n";
        std::cout << std::string(70, '=') << "\n";

        bool matched = false;
        for (const auto& suite : suites) {
            if (!filter.empty() && suite.name != filter) continue;
            matched = true;

            std::cout << "\n" << std::string(60, '-') << "\n";
            std::cout << "Suite: " << suite.name << "\n";
            std::cout << std::string(60, '-') << "\n";
            for (const auto& testCase : suite.cases) {
                results.push_back(runTest(suite.name, testCase));
            }
        }

        if (!matched) {
            std::cout << "No suite named '" << filter << "'\n";
            return 1;
        }

        return printSummary(results);
    }

private:
    TestResult runTest(const std::string& suiteName, const TestCase& testCase) {
        TestResult result;
        result.testName = suiteName + "." + testCase.name;

        try {
            testCase.run(result);
        } catch (const std::exception& e) {
            result.addFailure(std::string("EXCEPTION: ") + e.what());
        }

        printTestResult(result, testCase.description);
        return result;
    }

    void printTestResult(const TestResult& result, const std::string& description) {
        std::cout << (result.passed ? "  [PASS] " : "  [FAIL] ") << result.testName << "\n";
        if (!result.passed) {
            std::cout << "         " << description << "\n";
            for (const auto& failure : result.failures) {
                std::cout << "         - " << failure << "\n";
            }
        }
    }

    int printSummary(const std::vector<TestResult>& results) {
        int failed = 0;
        for (const auto& r : results) {
            if (!r.passed) failed++;
        }

        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << "  SUMMARY: " << (results.size() - failed) << "/" << results.size() << " passed";
        if (failed > 0) {
            std::cout << ", " << failed << " FAILED";
        }
        std::cout << "\n" << std::string(70, '=') << "\n";
        return failed;
    }
};

} // namespace Test

#endif // TEST_RUNNER_HPP
