/**
 * @file TestUtils.h
 * @brief Shared testing utilities for the wallet core test suites
 *
 * Provides common macros, color codes and helper functions for all test executables.
 */

#pragma once

#include "Crypto.h"
#include "Logger.h"

#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// ANSI Color Codes
// ============================================================================

#define COLOR_RESET   "\033[0m"
#define COLOR_GREEN   "\033[32m"
#define COLOR_RED     "\033[31m"
#define COLOR_BLUE    "\033[34m"
#define COLOR_CYAN    "\033[36m"

// ============================================================================
// Global Test Counters
// ============================================================================

namespace TestGlobals {
    extern int g_testsRun;
    extern int g_testsPassed;
    extern int g_testsFailed;
}

// ============================================================================
// Test Macros
// ============================================================================

#define TEST_START(name) \
    do { \
        std::cout << COLOR_BLUE << "[TEST] " << name << COLOR_RESET << std::endl; \
        TestGlobals::g_testsRun++; \
    } while(0)

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cout << COLOR_RED << "  ✗ FAILED: " << message << COLOR_RESET << std::endl; \
            TestGlobals::g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << COLOR_GREEN << "  ✓ PASSED" << COLOR_RESET << std::endl; \
        TestGlobals::g_testsPassed++; \
        return true; \
    } while(0)

#define TEST_STEP(message) \
    do { \
        std::cout << "  → " << message << std::endl; \
    } while(0)

namespace TestUtils {

/**
 * @brief Decodes a hex literal; test vectors are trusted so failure yields an empty vector
 */
inline std::vector<uint8_t> fromHex(const std::string& hex) {
    std::vector<uint8_t> out;
    Crypto::HexToBytes(hex, out);
    return out;
}

/**
 * @brief True if a cached log entry from `component` contains `fragment` in its message or details
 */
inline bool hasLogEntry(const std::string& component, const std::string& fragment) {
    for (const auto& entry : Logging::Logger::getInstance().getRecentEntries(1000)) {
        if (entry.component != component) {
            continue;
        }
        if (entry.message.find(fragment) != std::string::npos ||
            entry.details.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

/**
 * @brief True if any cached log entry contains `fragment` anywhere
 */
inline bool anyLogContains(const std::string& fragment) {
    for (const auto& entry : Logging::Logger::getInstance().getRecentEntries(1000)) {
        if (entry.message.find(fragment) != std::string::npos ||
            entry.details.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Prints test summary statistics
 * @param suiteName Name of the test suite
 */
inline void printTestSummary(const std::string& suiteName) {
    std::cout << std::endl;
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "  " << suiteName << " Summary" << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl;
    std::cout << "Total tests run:    " << TestGlobals::g_testsRun << std::endl;
    std::cout << COLOR_GREEN << "Tests passed:       " << TestGlobals::g_testsPassed << COLOR_RESET << std::endl;

    if (TestGlobals::g_testsFailed > 0) {
        std::cout << COLOR_RED << "Tests failed:       " << TestGlobals::g_testsFailed << COLOR_RESET << std::endl;
        std::cout << COLOR_RED << "✗ Some tests failed" << COLOR_RESET << std::endl;
    } else {
        std::cout << "Tests failed:       " << TestGlobals::g_testsFailed << std::endl;
        std::cout << COLOR_GREEN << "✓ All tests passed!" << COLOR_RESET << std::endl;
    }
}

/**
 * @brief Prints test suite header
 * @param suiteName Name of the test suite
 */
inline void printTestHeader(const std::string& suiteName) {
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "  " << suiteName << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl << std::endl;
}

/**
 * @brief Initializes crypto and a console-free logger that keeps entries for inspection
 */
inline bool initializeTestEnvironment() {
    Logging::Logger::getInstance().setMinLevel(Logging::LogLevel::DEBUG);
    if (!Crypto::Initialize()) {
        std::cerr << COLOR_RED << "Failed to initialize libsodium" << COLOR_RESET << std::endl;
        return false;
    }
    return true;
}

inline int finishTestSuite(const std::string& suiteName) {
    printTestSummary(suiteName);
    Logging::Logger::getInstance().shutdown();
    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}

} // namespace TestUtils
