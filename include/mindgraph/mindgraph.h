#pragma once

/// @file mindgraph.h
/// @brief Main header for the mindgraph mind-map engine
///
/// mindgraph owns the node/edge graph behind a mind-map canvas: layouts,
/// collapse/focus visibility, undo/redo history and section templates.
///
/// Example usage:
/// @code
/// #include <mindgraph/mindgraph.h>
///
/// mindgraph::BoardSession session("board-1");
/// session.dispatch(mindgraph::intent::ApplyTemplate{"swot-analysis"});
/// session.tick();                    // runs the deferred layout when due
/// const auto& view = session.view(); // visible nodes and edges
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/NodeData.h"
#include "core/Graph.h"
#include "core/GraphTraversal.h"
#include "core/Selection.h"
#include "core/GraphStore.h"

// Layout module
#include "layout/LayoutOptions.h"
#include "layout/LayoutResult.h"
#include "layout/ILayout.h"
#include "layout/RadialLayout.h"
#include "layout/HierarchicalLayout.h"
#include "layout/LayoutRoot.h"
#include "layout/LayoutFactory.h"

// View, history, templates
#include "view/VisibilityResolver.h"
#include "history/HistoryManager.h"
#include "templates/TemplateCatalog.h"
#include "templates/TemplateInstantiator.h"

// Serialization and configuration
#include "config/EngineConfig.h"
#include "io/GraphSerializer.h"
#include "io/ConfigLoader.h"

// Session
#include "session/BoardSession.h"

#include <string>

namespace mindgraph {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace mindgraph
