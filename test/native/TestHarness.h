/// @file TestHarness.h
/// @brief Minimal test macros shared by the native unit tests
#pragma once

#include <cmath>
#include <cstdio>

static int testsPassed = 0;
static int testsFailed = 0;

struct TestFailure {};

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
  printf("Running %s... ", #name); \
  try { \
    test_##name(); \
    printf("PASSED\n"); \
    testsPassed++; \
  } catch (const TestFailure&) { \
    printf("FAILED\n"); \
    testsFailed++; \
  } \
} while (0)

#define TEST_FAIL(expr) do { \
  printf("\n  %s:%d: %s\n  ", __FILE__, __LINE__, expr); \
  throw TestFailure(); \
} while (0)

#define ASSERT_TRUE(x) do { if (!(x)) { TEST_FAIL("ASSERT_TRUE(" #x ")"); } } while (0)
#define ASSERT_FALSE(x) do { if (x) { TEST_FAIL("ASSERT_FALSE(" #x ")"); } } while (0)
#define ASSERT_EQ(a, b) do { if (!((a) == (b))) { TEST_FAIL("ASSERT_EQ(" #a ", " #b ")"); } } while (0)
#define ASSERT_NE(a, b) do { if (!((a) != (b))) { TEST_FAIL("ASSERT_NE(" #a ", " #b ")"); } } while (0)
#define ASSERT_NEAR(a, b, tol) do { \
  if (!(std::fabs(static_cast<double>(a) - static_cast<double>(b)) <= (tol))) { \
    TEST_FAIL("ASSERT_NEAR(" #a ", " #b ", " #tol ")"); \
  } \
} while (0)

#define TEST_SUMMARY() \
  printf("\n=== Results: %d passed, %d failed ===\n\n", testsPassed, testsFailed)
