#include "mindgraph/io/ConfigLoader.h"
#include "mindgraph/layout/LayoutFactory.h"
#include "mindgraph/common/Logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace mindgraph {

namespace {

template <typename T>
void overrideField(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section[key].get<T>();
    }
}

void overrideMillis(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        auto value = section[key].get<int64_t>();
        if (value < 0) {
            throw std::invalid_argument(std::string(key) + " must not be negative");
        }
        target = std::chrono::milliseconds(value);
    }
}

void overrideCount(const json& section, const char* key, size_t& target) {
    if (section.contains(key)) {
        auto value = section[key].get<int64_t>();
        if (value < 0) {
            throw std::invalid_argument(std::string(key) + " must not be negative");
        }
        target = static_cast<size_t>(value);
    }
}

}  // namespace

bool ConfigLoader::fromJson(const std::string& jsonStr, EngineConfig& out, const EngineConfig& base) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_WARN("Config must be a JSON object");
            return false;
        }

        EngineConfig config = base;

        if (j.contains("radial")) {
            const auto& radial = j["radial"];
            overrideField(radial, "centerX", config.radial.center.x);
            overrideField(radial, "centerY", config.radial.center.y);
            overrideField(radial, "initialRadius", config.radial.initialRadius);
            overrideField(radial, "radiusGrowth", config.radial.radiusGrowth);
        }

        if (j.contains("hierarchical")) {
            const auto& hierarchical = j["hierarchical"];
            overrideField(hierarchical, "columnSpacing", config.hierarchical.columnSpacing);
            overrideField(hierarchical, "rowSpacing", config.hierarchical.rowSpacing);
        }

        if (j.contains("templateGrid")) {
            const auto& grid = j["templateGrid"];
            overrideField(grid, "sectionsPerRow", config.templateGrid.sectionsPerRow);
            overrideField(grid, "sectionSpacing", config.templateGrid.sectionSpacing);
            overrideField(grid, "childSpacing", config.templateGrid.childSpacing);
            overrideField(grid, "childOffsetX", config.templateGrid.childOffsetX);
            if (config.templateGrid.sectionsPerRow < 1) {
                throw std::invalid_argument("templateGrid.sectionsPerRow must be at least 1");
            }
        }

        if (j.contains("history")) {
            overrideCount(j["history"], "maxSnapshots", config.history.maxSnapshots);
        }

        if (j.contains("session")) {
            const auto& session = j["session"];
            overrideMillis(session, "persistDebounceMs", config.session.persistDebounce);
            overrideMillis(session, "templateLayoutDelayMs", config.session.templateLayoutDelay);
            if (session.contains("defaultLayout")) {
                std::string name = session["defaultLayout"].get<std::string>();
                auto kind = parseLayoutKind(name);
                if (!kind) {
                    throw std::invalid_argument("unknown layout '" + name + "'");
                }
                config.session.defaultLayout = *kind;
            }
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                std::string name = logging["level"].get<std::string>();
                auto level = parseLogLevel(name);
                if (!level) {
                    throw std::invalid_argument("unknown log level '" + name + "'");
                }
                config.logging.level = *level;
            }
            overrideField(logging, "logDir", config.logging.logDir);
            overrideField(logging, "logToFile", config.logging.logToFile);
        }

        out = config;
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("Malformed config: {}", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LOG_WARN("Invalid config: {}", e.what());
        return false;
    }
}

EngineConfig ConfigLoader::load(const std::string& path) {
    EngineConfig config = EngineConfig::defaults();

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_INFO("No config at '{}', using defaults", path);
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!fromJson(buffer.str(), config)) {
        LOG_WARN("Ignoring config '{}', using defaults", path);
    }
    return config;
}

std::string ConfigLoader::toJson(const EngineConfig& config) {
    json j;
    j["radial"] = {
        {"centerX", config.radial.center.x},
        {"centerY", config.radial.center.y},
        {"initialRadius", config.radial.initialRadius},
        {"radiusGrowth", config.radial.radiusGrowth}
    };
    j["hierarchical"] = {
        {"columnSpacing", config.hierarchical.columnSpacing},
        {"rowSpacing", config.hierarchical.rowSpacing}
    };
    j["templateGrid"] = {
        {"sectionsPerRow", config.templateGrid.sectionsPerRow},
        {"sectionSpacing", config.templateGrid.sectionSpacing},
        {"childSpacing", config.templateGrid.childSpacing},
        {"childOffsetX", config.templateGrid.childOffsetX}
    };
    j["history"] = {{"maxSnapshots", config.history.maxSnapshots}};
    j["session"] = {
        {"persistDebounceMs", config.session.persistDebounce.count()},
        {"templateLayoutDelayMs", config.session.templateLayoutDelay.count()},
        {"defaultLayout", layoutKindName(config.session.defaultLayout)}
    };
    j["logging"] = {
        {"logDir", config.logging.logDir},
        {"logToFile", config.logging.logToFile}
    };
    if (config.logging.level) {
        j["logging"]["level"] = logLevelName(*config.logging.level);
    }
    return j.dump(2);
}

}  // namespace mindgraph
