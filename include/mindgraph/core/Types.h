#pragma once

#include <cmath>
#include <string>

namespace mindgraph {

using NodeId = std::string;
using EdgeId = std::string;

/// Canvas coordinate. Double precision so positions loaded from a document
/// survive a save/load cycle unchanged.
struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(double s) const { return {x * s, y * s}; }

    double length() const { return std::sqrt(x * x + y * y); }
    double distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Node kind. The order matches the alternatives of NodePayload.
enum class NodeType {
    Generic,
    Note,
    Checklist,
    Kanban,
    Timeline,
    Matrix
};

/// Edge rendering style
enum class EdgeType {
    Plain,
    SmoothStep,
    Labeled
};

}  // namespace mindgraph
