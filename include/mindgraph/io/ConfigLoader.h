#pragma once

#include "../config/EngineConfig.h"

#include <string>

namespace mindgraph {

/// Reads EngineConfig from JSON.
///
/// Only keys present in the document override the defaults, e.g.
/// {"radial": {"initialRadius": 320}, "session": {"persistDebounceMs": 250},
///  "logging": {"level": "debug"}}.
class ConfigLoader {
public:
    /// Parse a JSON string on top of `base`.
    /// @return true if parsing succeeded; `out` is untouched on failure
    static bool fromJson(const std::string& json, EngineConfig& out,
                         const EngineConfig& base = EngineConfig::defaults());

    /// Load from a file, falling back to defaults when the file is missing
    /// or malformed
    static EngineConfig load(const std::string& path);

    /// Serialize a configuration, every key written
    static std::string toJson(const EngineConfig& config);
};

}  // namespace mindgraph
