#ifndef DESKPILOT_TEST_SUPPORT_H
#define DESKPILOT_TEST_SUPPORT_H

#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

namespace deskpilot {
namespace test {

inline int& failureCount() {
    static int failures = 0;
    return failures;
}

inline void reportFailure(const char* file, int line, const char* expression) {
    ++failureCount();
    std::cerr << "[FAILED] " << file << ":" << line << ": " << expression << "\n";
}

// Polls until the predicate holds or the timeout expires
inline bool eventually(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline int finish(const char* suite) {
    if (failureCount() == 0) {
        std::cout << "\n=== " << suite << ": all tests passed ===\n";
        return 0;
    }
    std::cerr << "\n=== " << suite << ": " << failureCount() << " check(s) failed ===\n";
    return 1;
}

} // namespace test
} // namespace deskpilot

#define CHECK(expr) \
    do { if (!(expr)) deskpilot::test::reportFailure(__FILE__, __LINE__, #expr); } while (0)

#define CHECK_EQ(actual, expected) \
    do { if (!((actual) == (expected))) deskpilot::test::reportFailure(__FILE__, __LINE__, #actual " == " #expected); } while (0)

#define CHECK_THROWS(statement, ExceptionType) \
    do { \
        bool caught_ = false; \
        try { statement; } catch (const ExceptionType&) { caught_ = true; } \
        if (!caught_) deskpilot::test::reportFailure(__FILE__, __LINE__, #statement " throws " #ExceptionType); \
    } while (0)

#endif // DESKPILOT_TEST_SUPPORT_H
