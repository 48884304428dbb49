#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace promptcalc::core::types {

struct ModelLimit {
    std::string name;
    std::uint64_t limit{0};

    static std::optional<ModelLimit> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        if (!j.contains("name") || !j["name"].is_string()) return std::nullopt;

        ModelLimit m;
        m.name = j["name"].get<std::string>();
        if (!j.contains("limit")) return std::nullopt;
        const auto& v = j["limit"];
        if (v.is_number_unsigned()) {
            m.limit = v.get<std::uint64_t>();
        } else if (v.is_number_integer()) {
            const auto s = v.get<std::int64_t>();
            if (s < 0) return std::nullopt;
            m.limit = static_cast<std::uint64_t>(s);
        } else {
            return std::nullopt;
        }
        return m;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{{"name", name}, {"limit", limit}};
    }

    bool isValid(std::vector<std::string>* errors = nullptr) const {
        bool ok = true;
        auto push = [&](std::string msg) {
            ok = false;
            if (errors) errors->push_back(std::move(msg));
        };
        if (name.empty()) push("name is empty");
        if (limit == 0) push("limit is 0");
        return ok;
    }

    bool operator==(const ModelLimit& o) const { return name == o.name && limit == o.limit; }
};

} // namespace promptcalc::core::types
