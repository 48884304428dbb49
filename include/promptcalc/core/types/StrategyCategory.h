#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace promptcalc::core::types {

// 重写策略类别；声明顺序即流水线执行顺序
enum class StrategyCategory {
    Whitespace,
    Redundancy,
    Simplification,
    Filler,
    Punctuation,
    Voice,

    // 哨兵：没有任何类别改动文本
    NoOptimization
};

// 六个真实类别（不含哨兵），按执行顺序
inline constexpr std::array<StrategyCategory, 6> kAllStrategyCategories{
    StrategyCategory::Whitespace,
    StrategyCategory::Redundancy,
    StrategyCategory::Simplification,
    StrategyCategory::Filler,
    StrategyCategory::Punctuation,
    StrategyCategory::Voice,
};

// Enum to stable key (used in config and JSON)
inline std::string strategyCategoryToString(StrategyCategory v) {
    switch (v) {
        case StrategyCategory::Whitespace: return "whitespace";
        case StrategyCategory::Redundancy: return "redundancy";
        case StrategyCategory::Simplification: return "simplification";
        case StrategyCategory::Filler: return "filler";
        case StrategyCategory::Punctuation: return "punctuation";
        case StrategyCategory::Voice: return "voice";
        case StrategyCategory::NoOptimization: return "none";
    }
    return "unknown";
}

namespace strategy_category_detail {
inline char asciiLower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
    return c;
}
inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (asciiLower(a[i]) != asciiLower(b[i])) return false;
    }
    return true;
}
} // namespace strategy_category_detail

// String to enum (case-insensitive). Expected input like "filler".
inline std::optional<StrategyCategory> stringToStrategyCategory(std::string_view s) {
    using strategy_category_detail::iequals;
    if (iequals(s, "whitespace")) return StrategyCategory::Whitespace;
    if (iequals(s, "redundancy")) return StrategyCategory::Redundancy;
    if (iequals(s, "simplification")) return StrategyCategory::Simplification;
    if (iequals(s, "filler")) return StrategyCategory::Filler;
    if (iequals(s, "punctuation")) return StrategyCategory::Punctuation;
    if (iequals(s, "voice")) return StrategyCategory::Voice;
    if (iequals(s, "none")) return StrategyCategory::NoOptimization;
    return std::nullopt;
}

// 面向用户的说明文字
inline std::string_view getStrategyCategoryLabel(StrategyCategory v) {
    switch (v) {
        case StrategyCategory::Whitespace: return "Removed excessive whitespace";
        case StrategyCategory::Redundancy: return "Removed redundant phrases";
        case StrategyCategory::Simplification: return "Simplified complex words";
        case StrategyCategory::Filler: return "Removed filler words";
        case StrategyCategory::Punctuation: return "Cleaned up punctuation";
        case StrategyCategory::Voice: return "Converted passive to active voice";
        case StrategyCategory::NoOptimization: return "No significant optimizations found";
    }
    return "Unknown strategy";
}

} // namespace promptcalc::core::types
