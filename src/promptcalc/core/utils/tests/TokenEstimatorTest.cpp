#include "promptcalc/core/utils/TokenEstimator.h"

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace promptcalc::core::utils;
using promptcalc::core::types::TextStats;

// 轻量断言工具（与 core/tests 风格保持一致）

namespace mini_test {

inline std::string toString(const std::string& v) { return v; }
inline std::string toString(const char* v) { return v ? std::string(v) : "null"; }
inline std::string toString(bool v) { return v ? "true" : "false"; }

template <typename T>
std::string toString(const T& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

inline std::string toString(const TextStats& s) {
    return s.toJson().dump();
}

class AssertionFailed : public std::runtime_error {
public:
    explicit AssertionFailed(const std::string& msg) : std::runtime_error(msg) {}
};

#define CHECK_TRUE(cond)                                                                          \
    do {                                                                                          \
        if (!(cond))                                                                              \
            throw mini_test::AssertionFailed(std::string("CHECK_TRUE failed: ") + #cond);         \
    } while (0)

#define CHECK_FALSE(cond) CHECK_TRUE(!(cond))

#define CHECK_EQ(a, b)                                                                            \
    do {                                                                                          \
        const auto _va = (a);                                                                     \
        const auto _vb = (b);                                                                     \
        if (!(_va == _vb)) {                                                                      \
            throw mini_test::AssertionFailed(std::string("CHECK_EQ failed: ") + #a " vs " #b +    \
                                             " (" + mini_test::toString(_va) + " vs " +           \
                                             mini_test::toString(_vb) + ")");                     \
        }                                                                                         \
    } while (0)

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline int run(const std::vector<TestCase>& tests) {
    int failed = 0;
    for (const auto& t : tests) {
        try {
            t.fn();
            std::cout << "[  OK  ] " << t.name << "\n";
        } catch (const AssertionFailed& e) {
            failed++;
            std::cout << "[ FAIL ] " << t.name << " :: " << e.what() << "\n";
        } catch (const std::exception& e) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: " << e.what() << "\n";
        } catch (...) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: unknown exception\n";
        }
    }
    std::cout << "Executed " << tests.size() << " cases, failed " << failed << ".\n";
    return failed == 0 ? 0 : 1;
}

} // namespace mini_test

static TextStats makeStats(std::size_t c, std::size_t w, std::size_t l,
                           std::size_t tc, std::size_t tw, std::size_t ta) {
    TextStats s;
    s.characters = c;
    s.words = w;
    s.lines = l;
    s.tokensCharBased = tc;
    s.tokensWordBased = tw;
    s.tokensAdvanced = ta;
    return s;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"empty_string_stats", []() {
        CHECK_EQ(computeStats(""), makeStats(0, 0, 1, 0, 0, 0));
    }});

    tests.push_back({"hello_world_stats", []() {
        // 11/4 -> 3, 2/0.75 -> 3, 11/3.8 -> 3
        CHECK_EQ(computeStats("hello world"), makeStats(11, 2, 1, 3, 3, 3));
    }});

    tests.push_back({"char_count_decodes_utf8", []() {
        CHECK_EQ(charCount("h\xC3\xA9llo"), 5U);                 // é
        CHECK_EQ(charCount("\xE6\x97\xA5\xE6\x9C\xAC"), 2U);     // 日本
        CHECK_EQ(charCount("\xF0\x9F\x98\x80"), 1U);             // emoji
        // 非法序列逐字节计数
        CHECK_EQ(charCount("\xC3"), 1U);
        CHECK_EQ(charCount("\xC3("), 2U);
        CHECK_EQ(charCount("\x80\x80"), 2U);
    }});

    tests.push_back({"word_count_splits_on_whitespace_runs", []() {
        CHECK_EQ(wordCount(""), 0U);
        CHECK_EQ(wordCount("   \n\t "), 0U);
        CHECK_EQ(wordCount("  two   words \n"), 2U);
        CHECK_EQ(wordCount("one\ttwo\nthree"), 3U);
    }});

    tests.push_back({"line_count_is_one_plus_newlines", []() {
        CHECK_EQ(lineCount(""), 1U);
        CHECK_EQ(lineCount("\n"), 2U);
        CHECK_EQ(lineCount("a\n\nb"), 3U);
        CHECK_EQ(lineCount("no newline\r"), 1U);
    }});

    tests.push_back({"advanced_weights_punctuation_and_structure", []() {
        // (8 + 2*0.5) / 3.8 = 2.37 -> 3
        CHECK_EQ(estimateTokensAdvanced("Hi, you!"), 3U);
        CHECK_EQ(estimateTokensCharBased("Hi, you!"), 2U);
        // (3 + 0.3) / 3.8 -> 1
        CHECK_EQ(estimateTokensAdvanced("a\nb"), 1U);
        CHECK_EQ(estimateTokensAdvanced("\t"), 1U);
        // 19 个字符：无标点为 19/3.8 = 5，句号额外 0.5 推到 6
        const std::string plain(18, 'x');
        CHECK_EQ(estimateTokensAdvanced(plain + "x"), 5U);
        CHECK_EQ(estimateTokensAdvanced(plain + "."), 6U);
    }});

    tests.push_back({"word_based_rounds_up", []() {
        CHECK_EQ(estimateTokensWordBased("one"), 2U);          // 1/0.75
        CHECK_EQ(estimateTokensWordBased("a b c"), 4U);        // 3/0.75
        CHECK_EQ(estimateTokensWordBased("a b c d e f"), 8U);  // 6/0.75
    }});

    tests.push_back({"non_empty_text_never_estimates_zero", []() {
        const std::vector<std::string> samples{"x", " ", "\n", ".", "\xC3\xA9", "a b"};
        for (const auto& s : samples) {
            const auto st = computeStats(s);
            CHECK_TRUE(st.tokensCharBased >= 1);
            CHECK_TRUE(st.tokensAdvanced >= 1);
            CHECK_TRUE(st.lines >= 1);
        }
    }});

    tests.push_back({"estimators_are_pure", []() {
        const std::string s = "Line one.\nLine two, with\ttabs!";
        CHECK_EQ(computeStats(s), computeStats(s));
        CHECK_EQ(computeStats(s).lines, 2U);
        CHECK_EQ(computeStats(s).words, 6U);
    }});

    return mini_test::run(tests);
}
