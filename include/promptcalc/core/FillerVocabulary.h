#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace promptcalc::core {

/**
 * @brief 填充词/模糊限定词的封闭词表
 *
 * 词表以小写存储；含空格的条目视为多词短语（如 "carrying out"）。
 * 匹配规则：按整词切分（词字符为 [A-Za-z0-9_]），大小写不敏感的精确命中；
 * 在每个词的起点优先尝试最长的短语，再尝试单词。
 */
class FillerVocabulary {
public:
    // 内置词表（进程内只构建一次）
    static const FillerVocabulary& builtin();

    explicit FillerVocabulary(const std::vector<std::string>& entries);

    bool containsWord(std::string_view word) const;
    bool containsPhrase(std::string_view phrase) const;

    std::size_t wordCount() const { return m_words.size(); }
    std::size_t phraseCount() const { return m_phrases.size(); }

    /**
     * @brief 删除所有命中的词/短语，以及紧随其后的一个空格（若有）
     * @return 删除后的文本；无命中时与输入相同
     */
    std::string removeFrom(std::string_view text) const;

private:
    std::unordered_set<std::string> m_words;
    std::unordered_set<std::string> m_phrases;
    std::size_t m_maxPhraseWords{1};
};

} // namespace promptcalc::core
