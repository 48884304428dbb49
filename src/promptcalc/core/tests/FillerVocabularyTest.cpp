#include "promptcalc/core/FillerVocabulary.h"

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace promptcalc::core;

// 轻量断言工具（与 utils/tests 风格保持一致）

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

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"builtin_membership_is_case_insensitive", []() {
        const auto& v = FillerVocabulary::builtin();
        CHECK_TRUE(v.containsWord("actually"));
        CHECK_TRUE(v.containsWord("Actually"));
        CHECK_TRUE(v.containsWord("BASICALLY"));
        CHECK_FALSE(v.containsWord("approach"));
        CHECK_FALSE(v.containsWord(""));
        CHECK_TRUE(v.containsPhrase("Carrying Out"));
        CHECK_FALSE(v.containsPhrase("carrying"));
        CHECK_EQ(v.phraseCount(), 4U);
        CHECK_TRUE(v.wordCount() > 800);
    }});

    tests.push_back({"removes_word_with_one_trailing_space", []() {
        const auto& v = FillerVocabulary::builtin();
        CHECK_EQ(v.removeFrom("This is actually fine"), "This is fine");
        CHECK_EQ(v.removeFrom("ACTUALLY done"), "done");
        // 后面不是空格时只删词本身
        CHECK_EQ(v.removeFrom("Actually, the plan"), ", the plan");
        CHECK_EQ(v.removeFrom("it is done basically"), "it is done ");
    }});

    tests.push_back({"matches_whole_words_only", []() {
        const auto& v = FillerVocabulary::builtin();
        CHECK_EQ(v.removeFrom("factually correct"), "factually correct");
        CHECK_EQ(v.removeFrom("actually_x stays"), "actually_x stays");
        CHECK_EQ(v.removeFrom("go"), "go");
        CHECK_EQ(v.removeFrom(""), "");
    }});

    tests.push_back({"prefers_longest_phrase", []() {
        const auto& v = FillerVocabulary::builtin();
        CHECK_EQ(v.removeFrom("We are carrying out tests"), "We are tests");
        CHECK_EQ(v.removeFrom("Close to done"), "done");
    }});

    tests.push_back({"filler_word_wins_over_phrase_with_same_head", []() {
        const auto& v = FillerVocabulary::builtin();
        // 首词本身是填充词时只删该词，后续词保留
        CHECK_EQ(v.removeFrom("We are setting up the server"), "We are up the server");
        CHECK_EQ(v.removeFrom("Stop looking for bugs"), "Stop for bugs");
        CHECK_EQ(v.removeFrom("I am lying down now"), "I am down now");
        CHECK_EQ(v.removeFrom("We are Looking For it"), "We are For it");
        CHECK_FALSE(v.containsPhrase("setting up"));
    }});

    tests.push_back({"custom_vocabulary", []() {
        FillerVocabulary v({"um", "You Know"});
        CHECK_EQ(v.wordCount(), 1U);
        CHECK_EQ(v.phraseCount(), 1U);
        CHECK_EQ(v.removeFrom("um I think you know it"), "I think it");
        CHECK_EQ(v.removeFrom("say um"), "say ");
        // 短语要求词间单个空格
        CHECK_EQ(v.removeFrom("you  know"), "you  know");
    }});

    return mini_test::run(tests);
}
