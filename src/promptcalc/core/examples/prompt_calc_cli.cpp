#include "promptcalc/core/ConfigManager.h"
#include "promptcalc/core/ErrorHandler.h"
#include "promptcalc/core/ModelLimitTracker.h"
#include "promptcalc/core/PromptOptimizer.h"
#include "promptcalc/core/PromptSession.h"
#include "promptcalc/core/RuleCatalog.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "nlohmann/json.hpp"

using promptcalc::core::ConfigManager;
using promptcalc::core::ErrorHandler;
using promptcalc::core::ErrorInfo;
using promptcalc::core::ModelLimitTracker;
using promptcalc::core::PromptOptimizer;
using promptcalc::core::PromptSession;
using promptcalc::core::RuleCatalog;

namespace {

struct CliOptions {
    std::string configPath;
    std::string model;
    std::string inputPath;
    bool optimize{false};
    bool apply{false};
    bool listModels{false};
    bool listRules{false};
};

void printHelp() {
    std::cout << "Usage: prompt_calc_cli [options] [file]\n"
              << "  Reads the prompt from <file> or stdin and prints a JSON report.\n\n"
              << "Options:\n"
              << "  --config <path>  load JSON config (missing file -> default template is written)\n"
              << "  --model <name>   model used for the usage report (default: session.default_model)\n"
              << "  --optimize       run the rewrite pipeline and report savings\n"
              << "  --apply          with --optimize, also report stats of the optimized text\n"
              << "  --list-models    print the model limit catalog and exit\n"
              << "  --list-rules     print the rewrite rule catalog and exit\n"
              << "  --help           show this help\n";
}

bool parseArgs(int argc, char** argv, CliOptions& opt, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto needValue = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                error = std::string("missing value for ") + flag;
                return nullptr;
            }
            return argv[++i];
        };
        if (a == "--config") {
            const char* v = needValue("--config");
            if (!v) return false;
            opt.configPath = v;
        } else if (a == "--model") {
            const char* v = needValue("--model");
            if (!v) return false;
            opt.model = v;
        } else if (a == "--optimize") {
            opt.optimize = true;
        } else if (a == "--apply") {
            opt.apply = true;
        } else if (a == "--list-models") {
            opt.listModels = true;
        } else if (a == "--list-rules") {
            opt.listRules = true;
        } else if (!a.empty() && a[0] == '-' && a != "-") {
            error = "unknown option: " + a;
            return false;
        } else if (opt.inputPath.empty()) {
            opt.inputPath = a;
        } else {
            error = "unexpected argument: " + a;
            return false;
        }
    }
    return true;
}

bool readInput(const std::string& path, std::string& out, std::string& error) {
    if (path.empty() || path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        error = "Failed to open input file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    out = buffer.str();
    return true;
}

void printJson(const nlohmann::json& j) {
    // 输入可能不是合法 UTF-8，输出时替换非法字节而不是抛异常
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            printHelp();
            return 0;
        }
    }

    CliOptions opt;
    std::string argError;
    if (!parseArgs(argc, argv, opt, argError)) {
        std::cerr << "[ERR ] " << argError << "\n";
        printHelp();
        return 1;
    }

    ErrorHandler logger;
    ConfigManager cfg;
    if (!opt.configPath.empty()) {
        ErrorInfo err;
        if (!cfg.loadFromFile(opt.configPath, &err)) {
            logger.log(ErrorHandler::LogLevel::Error, "Failed to load config", err);
            return 1;
        }
        if (!err.message.empty()) {
            logger.log(ErrorHandler::LogLevel::Info, err.message);
        }
    }
    cfg.applyEnvironmentOverrides();

    if (auto lg = cfg.get("logging"); lg.has_value()) {
        if (!logger.applyLoggingConfig(*lg)) {
            logger.log(ErrorHandler::LogLevel::Warning, "Ignoring unknown logging.min_level");
        }
    }

    const auto issues = cfg.validate();
    for (const auto& s : issues) {
        logger.log(s.rfind("WARN:", 0) == 0 ? ErrorHandler::LogLevel::Warning : ErrorHandler::LogLevel::Error, s);
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        return 1;
    }

    ModelLimitTracker tracker;
    {
        ErrorInfo err;
        if (!tracker.loadFromConfig(cfg, &err)) {
            logger.log(ErrorHandler::LogLevel::Warning, "Using default model limits", err);
        } else if (!err.message.empty()) {
            logger.log(ErrorHandler::LogLevel::Warning, err.message, err);
        }
    }

    if (opt.listModels) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& m : tracker.listModelLimits()) arr.push_back(m.toJson());
        printJson(arr);
        return 0;
    }
    if (opt.listRules) {
        printJson(RuleCatalog::builtin().toJson());
        return 0;
    }

    PromptOptimizer optimizer;
    optimizer.setLogger(&logger);
    {
        ErrorInfo err;
        if (!optimizer.loadFromConfig(cfg, &err)) {
            logger.log(ErrorHandler::LogLevel::Error, "Invalid optimizer config", err);
            return 1;
        }
    }

    PromptSession session(tracker, optimizer);

    std::string model = opt.model;
    if (model.empty()) {
        if (auto d = cfg.get("session.default_model"); d.has_value() && d->is_string()) {
            model = d->get<std::string>();
        }
    }
    if (!model.empty()) {
        ErrorInfo err;
        if (!session.selectModelByName(model, &err)) {
            if (!opt.model.empty()) {
                logger.log(ErrorHandler::LogLevel::Error, "Unknown model", err);
                return 1;
            }
            logger.log(ErrorHandler::LogLevel::Warning, "Default model not found, using first catalog entry", err);
        }
    }

    std::string text;
    std::string readError;
    if (!readInput(opt.inputPath, text, readError)) {
        logger.log(ErrorHandler::LogLevel::Error, readError);
        return 1;
    }
    session.setText(std::move(text));

    nlohmann::json report;
    report["stats"] = session.stats().toJson();
    report["usage"] = session.usage().toJson();

    if (opt.optimize) {
        ErrorInfo err;
        if (!session.optimize(&err)) {
            logger.log(ErrorHandler::LogLevel::Error, "Nothing to optimize", err);
            report["error"] = err.toJson();
            printJson(report);
            return 2;
        }
        report["optimization"] = session.pendingResult()->toJson();
        if (opt.apply && session.applyOptimization()) {
            report["applied"] = {
                {"stats", session.stats().toJson()},
                {"usage", session.usage().toJson()}
            };
        }
    }

    printJson(report);
    return 0;
}
