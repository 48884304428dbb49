#include "promptcalc/core/RuleCatalog.h"
#include "promptcalc/core/types/StrategyCategory.h"

#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace promptcalc::core;
using namespace promptcalc::core::types;

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

inline std::string toString(StrategyCategory v) {
    return strategyCategoryToString(v);
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

    tests.push_back({"categories_run_in_fixed_order", []() {
        // 相邻同类别规则合并后的 pass 序列；"-" 表示不计入策略的归一步骤
        std::vector<std::string> passes;
        std::optional<StrategyCategory> prev;
        bool first = true;
        for (const auto& r : RuleCatalog::builtin().rules()) {
            if (first || r.category != prev) {
                passes.push_back(r.category.has_value() ? strategyCategoryToString(*r.category) : "-");
            }
            prev = r.category;
            first = false;
        }
        const std::vector<std::string> expected{
            "whitespace", "redundancy", "simplification", "filler", "-", "punctuation", "voice", "-"};
        CHECK_TRUE(passes == expected);
    }});

    tests.push_back({"rule_counts_per_category", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.ruleNames(StrategyCategory::Whitespace).size(), 1U);
        CHECK_EQ(c.ruleNames(StrategyCategory::Redundancy).size(), 7U);
        CHECK_EQ(c.ruleNames(StrategyCategory::Simplification).size(), 7U);
        CHECK_EQ(c.ruleNames(StrategyCategory::Filler).size(), 1U);
        CHECK_EQ(c.ruleNames(StrategyCategory::Punctuation).size(), 1U);
        CHECK_EQ(c.ruleNames(StrategyCategory::Voice).size(), 3U);
        CHECK_TRUE(c.ruleNames(StrategyCategory::NoOptimization).empty());
        CHECK_EQ(c.toJson().size(), c.rules().size());
    }});

    tests.push_back({"whitespace_only_fires_on_runs", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.applyCategory(StrategyCategory::Whitespace, "  a  b \n c "), "a b c");
        CHECK_EQ(c.applyCategory(StrategyCategory::Whitespace, " a b\nc"), " a b\nc");
    }});

    tests.push_back({"redundancy_phrases", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "Please kindly help"), "help");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "It is really quite extremely hot"), "It is hot");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "I want you to write in order to learn"),
                 "write to learn");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "due to the fact that it rained"), "because it rained");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "At this point in time we stop"), "now we stop");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "for the purpose of testing"), "to testing");
        // 礼貌词先于请求前缀删除，"could you please" 因而只剩 "could you"
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "Could you please explain this"),
                 "Could you explain this");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "I am pleased"), "I am pleased");
    }});

    tests.push_back({"simplification_is_whole_word_and_case_insensitive", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.applyCategory(StrategyCategory::Simplification, "Utilize it, then Demonstrate"),
                 "use it, then show");
        CHECK_EQ(c.applyCategory(StrategyCategory::Simplification, "facilitate; implement; subsequently; therefore"),
                 "help; do; then; so");
        CHECK_EQ(c.applyCategory(StrategyCategory::Simplification, "implementation details"), "implementation details");
    }});

    tests.push_back({"punctuation_runs_collapse_to_period", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.applyCategory(StrategyCategory::Punctuation, "Wait!!! What?! ok.."), "Wait. What. ok.");
        CHECK_EQ(c.applyCategory(StrategyCategory::Punctuation, "Fine! Sure?"), "Fine! Sure?");
    }});

    tests.push_back({"voice_patterns", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "The house is being painted"), "The house paints");
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "This is being done."), "This dones.");
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "The wall was painted by Ann."), "The wall Ann painted.");
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "Cakes WERE baked BY Bob"), "Cakes Bob baked");
        // 非 -ed 形式的被动语态不处理
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "The report was written by Sam"),
                 "The report was written by Sam");
    }});

    tests.push_back({"rules_tolerate_mixed_whitespace", []() {
        const auto& c = RuleCatalog::builtin();
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "please \n\t help"), "help");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "I want you to\n\nwrite"), "write");
        CHECK_EQ(c.applyCategory(StrategyCategory::Redundancy, "please"), "please");
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "The wall was painted\n  by   Ann"), "The wall Ann painted");
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "was was painted by Ann"), "was Ann painted");
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "This  is being done"), "This  dones");
        // "is" 与 "being" 之间只接受单个空格
        CHECK_EQ(c.applyCategory(StrategyCategory::Voice, "it is  being done"), "it is  being done");
        CHECK_EQ(c.applyCategory(StrategyCategory::Punctuation, "a?b!c.d"), "a?b!c.d");
    }});

    tests.push_back({"normalize_whitespace", []() {
        CHECK_EQ(RuleCatalog::normalizeWhitespace("  a \t b\n"), "a b");
        CHECK_EQ(RuleCatalog::normalizeWhitespace(""), "");
        CHECK_EQ(RuleCatalog::normalizeWhitespace(" \n "), "");
    }});

    return mini_test::run(tests);
}
