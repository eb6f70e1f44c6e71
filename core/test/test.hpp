#pragma once

//
// Minimal GTest-compatible test header.
// Supports: TEST(suite, name), EXPECT_TRUE/FALSE, EXPECT_EQ/NE,
//           EXPECT_FLOAT_EQ, EXPECT_NEAR, EXPECT_THROW, EXPECT_NO_THROW,
//           ASSERT_* variants.
//

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace tc_test {

struct Test {
    const char* suite;
    const char* name;
    void (*fn)();
};

inline std::vector<Test>& tests()
{
    static std::vector<Test> t;
    return t;
}

inline int& fail_count()
{
    static int n = 0;
    return n;
}

struct Register {
    Register(const char* suite, const char* name, void (*fn)())
    {
        tests().push_back({suite, name, fn});
    }
};

} // namespace tc_test

// ---- test registration ------------------------------------------------------

#define TEST(suite, name)                                                    \
    static void tc_test_##suite##_##name();                                  \
    static ::tc_test::Register tc_reg_##suite##_##name(                      \
        #suite, #name, tc_test_##suite##_##name);                            \
    static void tc_test_##suite##_##name()

// ---- expect (non-fatal) -----------------------------------------------------

#define EXPECT_TRUE(expr)                                                    \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_TRUE(%s)\n",         \
                         __FILE__, __LINE__, #expr);                         \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ(a, b)                                                      \
    do {                                                                     \
        if (!((a) == (b))) {                                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_EQ(%s, %s)\n",      \
                         __FILE__, __LINE__, #a, #b);                        \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_NE(a, b)                                                      \
    do {                                                                     \
        if (!((a) != (b))) {                                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_NE(%s, %s)\n",      \
                         __FILE__, __LINE__, #a, #b);                        \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_LT(a, b)                                                      \
    do {                                                                     \
        if (!((a) < (b))) {                                                  \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_LT(%s, %s)\n",      \
                         __FILE__, __LINE__, #a, #b);                        \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_GT(a, b)                                                      \
    do {                                                                     \
        if (!((a) > (b))) {                                                  \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_GT(%s, %s)\n",      \
                         __FILE__, __LINE__, #a, #b);                        \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_LE(a, b)                                                      \
    do {                                                                     \
        if (!((a) <= (b))) {                                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_LE(%s, %s)\n",      \
                         __FILE__, __LINE__, #a, #b);                        \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_GE(a, b)                                                      \
    do {                                                                     \
        if (!((a) >= (b))) {                                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_GE(%s, %s)\n",      \
                         __FILE__, __LINE__, #a, #b);                        \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_NEAR(a, b, eps)                                               \
    do {                                                                     \
        auto va_ = (a); auto vb_ = (b);                                     \
        if (std::fabs(double(va_) - double(vb_)) > double(eps)) {           \
            std::fprintf(stderr,                                             \
                "  FAIL %s:%d: EXPECT_NEAR(%s, %s, %s) got %g vs %g\n",    \
                __FILE__, __LINE__, #a, #b, #eps,                            \
                double(va_), double(vb_));                                   \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_FLOAT_EQ(a, b) EXPECT_NEAR(a, b, 1e-6)

// Only the named exception type counts; anything else propagates and fails the run
#define EXPECT_THROW(stmt, exc)                                              \
    do {                                                                     \
        bool tc_thrown_ = false;                                             \
        try {                                                                \
            stmt;                                                            \
        } catch (const exc&) {                                               \
            tc_thrown_ = true;                                               \
        }                                                                    \
        if (!tc_thrown_) {                                                   \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_THROW(%s, %s)\n",   \
                         __FILE__, __LINE__, #stmt, #exc);                   \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

#define EXPECT_NO_THROW(stmt)                                                \
    do {                                                                     \
        try {                                                                \
            stmt;                                                            \
        } catch (const std::exception& e_) {                                 \
            std::fprintf(stderr, "  FAIL %s:%d: EXPECT_NO_THROW(%s): %s\n", \
                         __FILE__, __LINE__, #stmt, e_.what());              \
            ++::tc_test::fail_count();                                       \
        }                                                                    \
    } while (0)

// ---- assert (fatal, returns from the current test) -------------------------

#define ASSERT_TRUE(expr)                                                    \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::fprintf(stderr, "  FAIL %s:%d: ASSERT_TRUE(%s)\n",         \
                         __FILE__, __LINE__, #expr);                         \
            ++::tc_test::fail_count();                                       \
            return;                                                          \
        }                                                                    \
    } while (0)

#define ASSERT_FALSE(expr) ASSERT_TRUE(!(expr))
#define ASSERT_EQ(a, b) do { if (!((a) == (b))) { \
    std::fprintf(stderr, "  FAIL %s:%d: ASSERT_EQ(%s, %s)\n", __FILE__, __LINE__, #a, #b); \
    ++::tc_test::fail_count(); return; } } while (0)
#define ASSERT_NE(a, b) do { if (!((a) != (b))) { \
    std::fprintf(stderr, "  FAIL %s:%d: ASSERT_NE(%s, %s)\n", __FILE__, __LINE__, #a, #b); \
    ++::tc_test::fail_count(); return; } } while (0)

// ---- runner -----------------------------------------------------------------

inline int tc_test_main()
{
    int passed = 0, failed = 0;
    for (auto& t : ::tc_test::tests()) {
        ::tc_test::fail_count() = 0;
        t.fn();
        if (::tc_test::fail_count() == 0) {
            std::printf("  PASS  %s.%s\n", t.suite, t.name);
            ++passed;
        } else {
            std::printf("  FAIL  %s.%s\n", t.suite, t.name);
            ++failed;
        }
    }
    std::printf("\n%d passed, %d failed\n", passed, failed);
    return failed ? 1 : 0;
}

int main() { return tc_test_main(); }
