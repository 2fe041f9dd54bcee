#pragma once

#include <string>
#include <vector>

namespace mindgraph {

/// One section of a template: a titled node with a column of children
struct TemplateSection {
    std::string title;
    std::vector<std::string> children;
};

/// Declarative mind-map template: a root label and its sections
struct TemplateSpec {
    std::string name;
    std::string root;
    std::vector<TemplateSection> sections;
};

/// Grid used to place a freshly instantiated template
struct TemplateGridOptions {
    /// Sections per grid row
    int sectionsPerRow = 3;

    /// Distance between section cells, both axes
    double sectionSpacing = 350.0;

    /// Vertical distance between children of one section
    double childSpacing = 100.0;

    /// Horizontal offset of the child column from its section
    double childOffsetX = 300.0;
};

}  // namespace mindgraph
