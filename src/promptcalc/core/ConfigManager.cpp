#include "promptcalc/core/ConfigManager.h"

#include "promptcalc/core/ErrorHandler.h"
#include "promptcalc/core/types/StrategyCategory.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace promptcalc::core {

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        // 1) 回退默认配置（内存）
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 2) 自动生成配置模板（落盘的是默认值，不含 env 替换结果）
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 0;
            err->message = "Config file not found, using default config: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) {
                // 合并提示，不影响 loadFromFile 的整体成功语义
                (*err->details)["auto_create_failed"] = saveErr.toJson();
            }
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::ConfigError;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        if (err) {
            err->errorType = ErrorType::ConfigError;
            err->errorCode = 0;
            err->message = "Config root must be a JSON object";
        }
        return false;
    }

    // 在锁外处理 env 逻辑，避免长期占用
    applyEnvMappingOverrides(parsed);
    replaceEnvPlaceholdersRecursive(parsed);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(parsed);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    try {
        const std::filesystem::path p(path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                if (err) {
                    err->errorType = ErrorType::IoError;
                    err->errorCode = 1;
                    err->message = "Failed to create config directory: " + parent.string();
                    err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
                }
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            if (err) {
                err->errorType = ErrorType::IoError;
                err->errorCode = 2;
                err->message = "Failed to open config file for write: " + path;
                err->details = nlohmann::json{{"path", path}};
            }
            return false;
        }

        const auto tmpl = makeDefaultConfig();
        ofs << tmpl.dump(2) << "\n";
        ofs.flush();
        return true;
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::IoError;
            err->errorCode = 3;
            err->message = std::string("Failed to save config file: ") + e.what();
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        if (err) {
            err->errorType = ErrorType::InvalidArgument;
            err->errorCode = 0;
            err->message = "Empty keyPath";
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    if (!p) {
        if (err) {
            err->errorType = ErrorType::InvalidArgument;
            err->errorCode = 0;
            err->message = "Failed to create keyPath: " + keyPath;
        }
        return false;
    }
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "Prompt token calculator config template (auto-generated). JSON has no comments; use _comment fields.";
    j["model_limits"] = nlohmann::json::array({
        {{"name", "GPT-3.5 Turbo"}, {"limit", 4096}},
        {{"name", "GPT-4"}, {"limit", 8192}},
        {{"name", "GPT-4 Turbo"}, {"limit", 32768}},
        {{"name", "Claude 3 Sonnet"}, {"limit", 200000}}
    });
    j["session"] = {
        {"_comment", "default_model must match one of model_limits[].name (case-insensitive)."},
        {"default_model", "GPT-3.5 Turbo"}
    };
    nlohmann::json strategies = nlohmann::json::array();
    for (auto c : types::kAllStrategyCategories) {
        strategies.push_back(types::strategyCategoryToString(c));
    }
    j["optimizer"] = {
        {"_comment", "Rewrite categories run in fixed order; removing a key disables that pass."},
        {"enabled_strategies", std::move(strategies)}
    };
    j["logging"] = {
        {"min_level", "WARNING"},
        {"enabled", true}
    };
    return j;
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
    if (s.empty()) return std::nullopt;
    return s;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        if (!p->contains(k)) return nullptr;
        p = &((*p)[k]);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& k = parts[i];
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        if (i == parts.size() - 1) {
            return &((*p)[k]);
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
    };
    const MapItem mapping[] = {
        {"PROMPTCALC_DEFAULT_MODEL", "session.default_model"},
        {"PROMPTCALC_LOG_LEVEL", "logging.min_level"},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        // 空字符串视为“未提供”
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        const auto parts = splitKeyPath(m.keyPath);
        nlohmann::json* p = getOrCreatePtrByPath(root, parts);
        if (!p) continue;
        *p = val;
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            replaceEnvPlaceholdersRecursive(it.value());
        }
        return;
    }
    if (node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    // model_limits
    std::set<std::string> modelNames;
    if (!cfgCopy.contains("model_limits") || !cfgCopy["model_limits"].is_array()) {
        out.push_back("Missing or invalid 'model_limits' (array required)");
    } else if (cfgCopy["model_limits"].empty()) {
        out.push_back("Invalid 'model_limits' (at least one entry required)");
    } else {
        const auto& limits = cfgCopy["model_limits"];
        for (size_t i = 0; i < limits.size(); ++i) {
            const auto& m = limits[i];
            const auto prefix = "model_limits[" + std::to_string(i) + "]";
            if (!m.is_object()) {
                out.push_back("Invalid '" + prefix + "' (object required)");
                continue;
            }
            if (!m.contains("name") || !m["name"].is_string() || trimCopy(m["name"].get<std::string>()).empty()) {
                out.push_back("Missing or invalid '" + prefix + ".name'");
            } else {
                std::string low = trimCopy(m["name"].get<std::string>());
                std::transform(low.begin(), low.end(), low.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (!modelNames.insert(low).second) {
                    out.push_back("WARN: duplicate model name in '" + prefix + ".name': " + m["name"].get<std::string>());
                }
            }
            if (!m.contains("limit") || !m["limit"].is_number_integer()) {
                out.push_back("Missing or invalid '" + prefix + ".limit' (integer required)");
            } else if (m["limit"].get<long long>() <= 0) {
                out.push_back("Invalid '" + prefix + ".limit' (must be positive)");
            }
        }
    }

    // session.default_model
    if (cfgCopy.contains("session")) {
        if (!cfgCopy["session"].is_object()) {
            out.push_back("Invalid 'session' (object required)");
        } else if (cfgCopy["session"].contains("default_model")) {
            const auto& d = cfgCopy["session"]["default_model"];
            if (!d.is_string()) {
                out.push_back("Invalid 'session.default_model' (string required)");
            } else {
                std::string low = trimCopy(d.get<std::string>());
                std::transform(low.begin(), low.end(), low.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (!modelNames.empty() && modelNames.find(low) == modelNames.end()) {
                    out.push_back("WARN: session.default_model refers to unknown model: " + d.get<std::string>());
                }
            }
        }
    }

    // optimizer.enabled_strategies
    if (cfgCopy.contains("optimizer")) {
        if (!cfgCopy["optimizer"].is_object()) {
            out.push_back("Invalid 'optimizer' (object required)");
        } else if (cfgCopy["optimizer"].contains("enabled_strategies")) {
            const auto& s = cfgCopy["optimizer"]["enabled_strategies"];
            if (!s.is_array()) {
                out.push_back("Invalid 'optimizer.enabled_strategies' (array required)");
            } else {
                for (const auto& item : s) {
                    if (!item.is_string()) {
                        out.push_back("Invalid strategy entry (string required)");
                        continue;
                    }
                    const auto c = types::stringToStrategyCategory(item.get<std::string>());
                    if (!c.has_value() || *c == types::StrategyCategory::NoOptimization) {
                        out.push_back("Invalid strategy key: " + item.get<std::string>());
                    }
                }
            }
        }
    }

    // logging
    if (cfgCopy.contains("logging")) {
        const auto& lg = cfgCopy["logging"];
        if (!lg.is_object()) {
            out.push_back("Invalid 'logging' (object required)");
        } else {
            if (lg.contains("min_level") &&
                (!lg["min_level"].is_string() ||
                 !ErrorHandler::logLevelFromString(lg["min_level"].get<std::string>()).has_value())) {
                out.push_back("Invalid 'logging.min_level' (ERROR/WARNING/INFO/DEBUG)");
            }
            if (lg.contains("enabled") && !lg["enabled"].is_boolean()) {
                out.push_back("Invalid 'logging.enabled' (boolean required)");
            }
        }
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace promptcalc::core
