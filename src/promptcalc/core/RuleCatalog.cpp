#include "promptcalc/core/RuleCatalog.h"

#include "promptcalc/core/FillerVocabulary.h"

#include <cctype>
#include <iterator>
#include <memory>
#include <regex>
#include <string_view>
#include <utility>

namespace promptcalc::core {

using types::StrategyCategory;

namespace {

const auto kIcase = std::regex::ECMAScript | std::regex::icase;

struct PhraseRule {
    const char* name;
    const char* pattern;
    const char* replacement;
    // 命中后连同其后的整段空白一起删除（空白段用线性扫描吞掉，不交给正则重复匹配）
    bool swallowTrailingSpace{false};
};

// 冗余短语：礼貌词/强调词/请求前缀删除，迂回说法替换为短形式
const PhraseRule kRedundancyRules[] = {
    {"politeness", R"(\b(please|kindly)(?=\s))", "", true},
    {"intensifier", R"(\b(very|really|quite|extremely)(?=\s))", "", true},
    {"request-preamble", R"(\b(I would like you to|I want you to|could you please|can you please))", "", true},
    {"in-order-to", R"(\b(in order to)\b)", "to"},
    {"due-to-the-fact-that", R"(\b(due to the fact that)\b)", "because"},
    {"at-this-point-in-time", R"(\b(at this point in time)\b)", "now"},
    {"for-the-purpose-of", R"(\b(for the purpose of)\b)", "to"},
};

// 书面词 -> 短同义词（整词）
const PhraseRule kSimplificationRules[] = {
    {"utilize", R"(\butilize\b)", "use"},
    {"demonstrate", R"(\bdemonstrate\b)", "show"},
    {"facilitate", R"(\bfacilitate\b)", "help"},
    {"implement", R"(\bimplement\b)", "do"},
    {"approximately", R"(\bapproximately\b)", "about"},
    {"subsequently", R"(\bsubsequently\b)", "then"},
    {"therefore", R"(\btherefore\b)", "so"},
};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// 与 ECMAScript \w 一致：[A-Za-z0-9_]
bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isSentenceEnd(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::size_t skipSpaces(const std::string& text, std::size_t pos) {
    while (pos < text.size() && isSpace(text[pos])) ++pos;
    return pos;
}

std::size_t wordEnd(const std::string& text, std::size_t pos) {
    while (pos < text.size() && isWordChar(text[pos])) ++pos;
    return pos;
}

bool matchesIcase(const std::string& text, std::size_t pos, std::string_view keyword) {
    if (pos + keyword.size() > text.size()) return false;
    for (std::size_t k = 0; k < keyword.size(); ++k) {
        if (std::tolower(static_cast<unsigned char>(text[pos + k])) != keyword[k]) return false;
    }
    return true;
}

bool endsWithEdIcase(const std::string& w) {
    if (w.size() < 2) return false;
    return std::tolower(static_cast<unsigned char>(w[w.size() - 2])) == 'e' &&
           std::tolower(static_cast<unsigned char>(w[w.size() - 1])) == 'd';
}

bool hasWhitespaceRun(const std::string& text) {
    for (std::size_t i = 1; i < text.size(); ++i) {
        if (isSpace(text[i - 1]) && isSpace(text[i])) return true;
    }
    return false;
}

// 两个及以上连续的 . ! ? 折叠为单个 "."
std::string collapseSentencePunctuation(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isSentenceEnd(text[i])) {
            out.push_back(text[i++]);
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && isSentenceEnd(text[j])) ++j;
        out.push_back(j - i >= 2 ? '.' : text[i]);
        i = j;
    }
    return out;
}

/**
 * 被动语态的按词扫描；两个改写都只在词首尝试匹配，未命中时整词原样拷贝。
 *   "is being <word>"              -> "<word 去掉结尾 ed>s"（粗糙的启发式，不做词形分析）
 *   "<aux> <word>ed by <agent>"    -> "<agent> <word>ed"
 */
std::string rewriteIsBeing(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isWordChar(text[i])) {
            out.push_back(text[i++]);
            continue;
        }
        // "is" 与 "being" 之间恰好一个空格，"being" 之后至少一个空白
        if (matchesIcase(text, i, "is") && i + 2 < text.size() && text[i + 2] == ' ' &&
            matchesIcase(text, i + 3, "being")) {
            const std::size_t afterBeing = i + 8;
            const std::size_t verbBegin = skipSpaces(text, afterBeing);
            const std::size_t verbEnd = wordEnd(text, verbBegin);
            if (verbBegin > afterBeing && verbEnd > verbBegin) {
                std::string verb = text.substr(verbBegin, verbEnd - verbBegin);
                if (endsWithEdIcase(verb)) verb.erase(verb.size() - 2);
                out += verb;
                out += 's';
                i = verbEnd;
                continue;
            }
        }
        const std::size_t e = wordEnd(text, i);
        out.append(text, i, e - i);
        i = e;
    }
    return out;
}

std::string rewriteVerbedBy(const std::string& text, std::string_view aux) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isWordChar(text[i])) {
            out.push_back(text[i++]);
            continue;
        }
        if (matchesIcase(text, i, aux)) {
            const std::size_t afterAux = i + aux.size();
            const std::size_t verbBegin = skipSpaces(text, afterAux);
            const std::size_t verbEnd = wordEnd(text, verbBegin);
            const std::size_t byBegin = skipSpaces(text, verbEnd);
            const std::size_t agentBegin = skipSpaces(text, byBegin + 2);
            const std::size_t agentEnd = wordEnd(text, agentBegin);
            const bool ok = verbBegin > afterAux && verbEnd - verbBegin >= 3 &&
                            endsWithEdIcase(text.substr(verbEnd - 2, 2)) && byBegin > verbEnd &&
                            matchesIcase(text, byBegin, "by") && agentBegin > byBegin + 2 &&
                            agentEnd > agentBegin;
            if (ok) {
                out.append(text, agentBegin, agentEnd - agentBegin);
                out += ' ';
                out.append(text, verbBegin, verbEnd - verbBegin);
                i = agentEnd;
                continue;
            }
        }
        const std::size_t e = wordEnd(text, i);
        out.append(text, i, e - i);
        i = e;
    }
    return out;
}

// 逐个命中替换，并线性跳过命中后的空白段
std::string replaceSwallowingSpace(const std::string& text, const std::regex& re, const std::string& replacement) {
    std::string out;
    out.reserve(text.size());
    auto last = text.cbegin();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        if (m[0].first < last) continue;
        out.append(last, m[0].first);
        out += replacement;
        last = m[0].second;
        while (last != text.cend() && isSpace(*last)) ++last;
    }
    out.append(last, text.cend());
    return out;
}

RewriteRule makeRegexRule(const PhraseRule& r, StrategyCategory category) {
    auto re = std::make_shared<const std::regex>(r.pattern, kIcase);
    std::string replacement = r.replacement;
    if (r.swallowTrailingSpace) {
        return RewriteRule{
            r.name,
            category,
            [re, replacement](const std::string& text) { return replaceSwallowingSpace(text, *re, replacement); }};
    }
    return RewriteRule{
        r.name,
        category,
        [re, replacement](const std::string& text) { return std::regex_replace(text, *re, replacement); }};
}

} // namespace

const RuleCatalog& RuleCatalog::builtin() {
    static const RuleCatalog catalog;
    return catalog;
}

RuleCatalog::RuleCatalog() {
    // 1) whitespace：存在两个以上连续空白时才整体归一
    m_rules.push_back(RewriteRule{
        "collapse-whitespace-runs",
        StrategyCategory::Whitespace,
        [](const std::string& text) { return hasWhitespaceRun(text) ? normalizeWhitespace(text) : text; }});

    // 2) redundancy
    for (const auto& r : kRedundancyRules) {
        m_rules.push_back(makeRegexRule(r, StrategyCategory::Redundancy));
    }

    // 3) simplification
    for (const auto& r : kSimplificationRules) {
        m_rules.push_back(makeRegexRule(r, StrategyCategory::Simplification));
    }

    // 4) filler：词表集合成员判定，而非一条巨型正则
    m_rules.push_back(RewriteRule{
        "filler-vocabulary",
        StrategyCategory::Filler,
        [](const std::string& text) { return FillerVocabulary::builtin().removeFrom(text); }});

    m_rules.push_back(RewriteRule{"normalize-after-filler", std::nullopt, &RuleCatalog::normalizeWhitespace});

    // 5) punctuation
    m_rules.push_back(RewriteRule{"collapse-sentence-punctuation", StrategyCategory::Punctuation,
                                  &collapseSentencePunctuation});

    // 6) voice：按词扫描，不对任意长的词或空白段做正则重复匹配
    m_rules.push_back(RewriteRule{"is-being-verb", StrategyCategory::Voice, &rewriteIsBeing});
    m_rules.push_back(RewriteRule{
        "was-verbed-by",
        StrategyCategory::Voice,
        [](const std::string& text) { return rewriteVerbedBy(text, "was"); }});
    m_rules.push_back(RewriteRule{
        "were-verbed-by",
        StrategyCategory::Voice,
        [](const std::string& text) { return rewriteVerbedBy(text, "were"); }});

    m_rules.push_back(RewriteRule{"final-normalize", std::nullopt, &RuleCatalog::normalizeWhitespace});
}

std::vector<std::string> RuleCatalog::ruleNames(StrategyCategory category) const {
    std::vector<std::string> names;
    for (const auto& r : m_rules) {
        if (r.category == category) names.push_back(r.name);
    }
    return names;
}

std::string RuleCatalog::applyCategory(StrategyCategory category, const std::string& text) const {
    std::string out = text;
    for (const auto& r : m_rules) {
        if (r.category == category) out = r.apply(out);
    }
    return out;
}

std::string RuleCatalog::normalizeWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }
    return out;
}

nlohmann::json RuleCatalog::toJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : m_rules) {
        arr.push_back({
            {"name", r.name},
            {"category", r.category.has_value() ? types::strategyCategoryToString(*r.category) : "normalize"}
        });
    }
    return arr;
}

} // namespace promptcalc::core
