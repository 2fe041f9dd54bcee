#pragma once

#include "../config/EngineConfig.h"
#include "ILayout.h"
#include "LayoutOptions.h"

#include <memory>
#include <optional>
#include <string>

namespace mindgraph {

/// Layout for the given kind, configured from `config`
std::unique_ptr<ILayout> createLayout(LayoutKind kind, const EngineConfig& config = {});

/// "radial" / "hierarchical"
const char* layoutKindName(LayoutKind kind);

/// Inverse of layoutKindName, nullopt for unknown names
std::optional<LayoutKind> parseLayoutKind(const std::string& name);

}  // namespace mindgraph
