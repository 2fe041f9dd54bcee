#include "mindgraph/layout/LayoutFactory.h"
#include "mindgraph/layout/HierarchicalLayout.h"
#include "mindgraph/layout/RadialLayout.h"

namespace mindgraph {

std::unique_ptr<ILayout> createLayout(LayoutKind kind, const EngineConfig& config) {
    switch (kind) {
        case LayoutKind::Radial:
            return std::make_unique<RadialLayout>(config.radial);
        case LayoutKind::Hierarchical:
            return std::make_unique<HierarchicalLayout>(config.hierarchical);
    }
    return std::make_unique<RadialLayout>(config.radial);
}

const char* layoutKindName(LayoutKind kind) {
    switch (kind) {
        case LayoutKind::Radial: return "radial";
        case LayoutKind::Hierarchical: return "hierarchical";
    }
    return "radial";
}

std::optional<LayoutKind> parseLayoutKind(const std::string& name) {
    if (name == "radial") return LayoutKind::Radial;
    if (name == "hierarchical") return LayoutKind::Hierarchical;
    return std::nullopt;
}

}  // namespace mindgraph
