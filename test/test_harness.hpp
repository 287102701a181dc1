#pragma once

// =============================================================================
// Minimal test framework shared by every Rill test executable
// =============================================================================
// No external dependencies. Each test is a void() function; a failed
// assertion throws and runTest() reports it. main() returns testExitCode().
// =============================================================================

#include <cmath>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static int g_passed = 0;
static int g_failed = 0;

#define RASSERT(cond)                                                      \
    do                                                                     \
    {                                                                      \
        if (!(cond))                                                       \
        {                                                                  \
            std::ostringstream os;                                         \
            os << "Assertion failed: " #cond " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                            \
        }                                                                  \
    } while (0)

#define RASSERT_EQ(a, b)                                      \
    do                                                        \
    {                                                         \
        if ((a) != (b))                                       \
        {                                                     \
            std::ostringstream os;                            \
            os << "Expected '" << (b) << "' but got '" << (a) \
               << "' (line " << __LINE__ << ")";              \
            throw std::runtime_error(os.str());               \
        }                                                     \
    } while (0)

#define RASSERT_NEAR(a, b, eps)                                    \
    do                                                             \
    {                                                              \
        if (std::fabs((a) - (b)) > (eps))                          \
        {                                                          \
            std::ostringstream os;                                 \
            os << "Expected ~" << (b) << " but got " << (a)        \
               << " (line " << __LINE__ << ")";                    \
            throw std::runtime_error(os.str());                    \
        }                                                          \
    } while (0)

// Expect an EvalResult to hold an error of the given ErrorKind
#define RASSERT_ERR(result, errKind)                                                   \
    do                                                                                 \
    {                                                                                  \
        auto &&r_ = (result);                                                          \
        if (r_.ok())                                                                   \
            throw std::runtime_error("Expected an error but the call succeeded (line " \
                                     + std::to_string(__LINE__) + ")");                \
        if (r_.kind() != (errKind))                                                    \
        {                                                                              \
            std::ostringstream os;                                                     \
            os << "Wrong error kind: " << r_.error().what() << " (line " << __LINE__  \
               << ")";                                                                 \
            throw std::runtime_error(os.str());                                        \
        }                                                                              \
    } while (0)

// Unwrap an EvalResult, failing the test with its error message
#define RUNWRAP(result)                                                               \
    ([&]() {                                                                          \
        auto r_ = (result);                                                           \
        if (!r_.ok())                                                                 \
            throw std::runtime_error(std::string("Unexpected error: ") +              \
                                     r_.error().what() + " (line " +                  \
                                     std::to_string(__LINE__) + ")");                 \
        return std::move(r_).value();                                                 \
    }())

static void runTest(const std::string &name, std::function<void()> fn)
{
    try
    {
        fn();
        std::cout << "  \033[32mPASS\033[0m: " << name << "\n";
        g_passed++;
    }
    catch (const std::exception &e)
    {
        std::cout << "  \033[31mFAIL\033[0m: " << name << "\n        " << e.what() << "\n";
        g_failed++;
    }
}

static int testExitCode()
{
    std::cout << "\n"
              << g_passed << " passed, " << g_failed << " failed\n";
    return g_failed == 0 ? 0 : 1;
}
