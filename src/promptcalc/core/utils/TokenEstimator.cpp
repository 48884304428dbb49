#include "promptcalc/core/utils/TokenEstimator.h"

#include <cctype>
#include <cmath>

namespace promptcalc::core::utils {

namespace {

constexpr double kCharsPerToken = 4.0;
constexpr double kWordsPerToken = 0.75;
constexpr double kAdvancedDivisor = 3.8;
constexpr double kPunctuationWeight = 0.5;
constexpr double kStructuralWeight = 0.3;

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// UTF-8 续字节 10xxxxxx
bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// 期望的续字节个数；非法首字节返回 0
std::size_t expectedContinuations(unsigned char lead) {
    if (lead < 0x80) return 0;
    if (lead >= 0xC2 && lead <= 0xDF) return 1;
    if (lead >= 0xE0 && lead <= 0xEF) return 2;
    if (lead >= 0xF0 && lead <= 0xF4) return 3;
    return 0;
}

std::size_t ceilToSize(double v) {
    if (v <= 0.0) return 0;
    return static_cast<std::size_t>(std::ceil(v));
}

} // namespace

std::size_t charCount(std::string_view text) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        const std::size_t need = expectedContinuations(lead);
        std::size_t len = 1;
        // 只有续字节完整时才作为一个标量值吞掉；否则首字节单独计数
        if (need > 0 && i + need < text.size()) {
            bool complete = true;
            for (std::size_t k = 1; k <= need; ++k) {
                if (!isContinuationByte(text[i + k])) {
                    complete = false;
                    break;
                }
            }
            if (complete) len += need;
        }
        ++count;
        i += len;
    }
    return count;
}

std::size_t wordCount(std::string_view text) {
    std::size_t words = 0;
    bool inWord = false;
    for (char c : text) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

std::size_t lineCount(std::string_view text) {
    std::size_t lines = 1;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    return lines;
}

std::size_t estimateTokensCharBased(std::string_view text) {
    return ceilToSize(static_cast<double>(charCount(text)) / kCharsPerToken);
}

std::size_t estimateTokensWordBased(std::string_view text) {
    return ceilToSize(static_cast<double>(wordCount(text)) / kWordsPerToken);
}

std::size_t estimateTokensAdvanced(std::string_view text) {
    std::size_t punctuation = 0;
    std::size_t structural = 0;
    for (char c : text) {
        switch (c) {
            case '.': case '!': case '?': case ';': case ':': case ',':
                ++punctuation;
                break;
            case '\n': case '\t':
                ++structural;
                break;
            default:
                break;
        }
    }
    const double weighted = static_cast<double>(charCount(text)) +
                            static_cast<double>(punctuation) * kPunctuationWeight +
                            static_cast<double>(structural) * kStructuralWeight;
    return ceilToSize(weighted / kAdvancedDivisor);
}

types::TextStats computeStats(std::string_view text) {
    types::TextStats s;
    s.characters = charCount(text);
    s.words = wordCount(text);
    s.lines = lineCount(text);
    s.tokensCharBased = estimateTokensCharBased(text);
    s.tokensWordBased = estimateTokensWordBased(text);
    s.tokensAdvanced = estimateTokensAdvanced(text);
    return s;
}

} // namespace promptcalc::core::utils
