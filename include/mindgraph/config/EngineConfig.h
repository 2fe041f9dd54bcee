#pragma once

#include "../common/Logger.h"
#include "../history/HistoryManager.h"
#include "../layout/LayoutOptions.h"
#include "../templates/TemplateSpec.h"

#include <chrono>

namespace mindgraph {

/// Timing of the work a BoardSession defers to later ticks
struct SessionOptions {
    /// Quiet period after the last change before the board is persisted
    std::chrono::milliseconds persistDebounce{500};

    /// Delay before a freshly inserted template is laid out
    std::chrono::milliseconds templateLayoutDelay{150};

    /// Algorithm used by ApplyLayout when the intent does not name one
    LayoutKind defaultLayout = LayoutKind::Radial;
};

/// All tunables of the engine in one place
struct EngineConfig {
    RadialLayoutOptions radial;
    HierarchicalLayoutOptions hierarchical;
    TemplateGridOptions templateGrid;
    HistoryOptions history;
    SessionOptions session;
    LoggingOptions logging;

    static EngineConfig defaults() { return EngineConfig{}; }
};

}  // namespace mindgraph
