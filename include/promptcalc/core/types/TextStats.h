#pragma once

#include <cstddef>

#include "nlohmann/json.hpp"

namespace promptcalc::core::types {

/**
 * @brief 文本的描述性统计与三种 token 估算
 *
 * 完全由输入字符串导出；文本每次变化都重新计算。
 */
struct TextStats {
    std::size_t characters{0};
    std::size_t words{0};
    std::size_t lines{1};
    std::size_t tokensCharBased{0};
    std::size_t tokensWordBased{0};
    std::size_t tokensAdvanced{0};

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["characters"] = characters;
        j["words"] = words;
        j["lines"] = lines;
        j["tokens_char_based"] = tokensCharBased;
        j["tokens_word_based"] = tokensWordBased;
        j["tokens_advanced"] = tokensAdvanced;
        return j;
    }

    bool operator==(const TextStats& o) const {
        return characters == o.characters && words == o.words && lines == o.lines &&
               tokensCharBased == o.tokensCharBased && tokensWordBased == o.tokensWordBased &&
               tokensAdvanced == o.tokensAdvanced;
    }
    bool operator!=(const TextStats& o) const { return !(*this == o); }
};

} // namespace promptcalc::core::types
