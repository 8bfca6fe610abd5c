// =============================================================================
// SKYROAM - POLYGON BUILDER
// Way -> building footprint: node resolution, winding, height, colour
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Server/ElementSource.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skyroam::server {

// =============================================================================
// PROJECTED NODE INDEX
// Appended during the node pass, sorted once, then binary searched.
// =============================================================================
struct ProjectedNode {
    ElementId id;
    float x;
    float z;
};

class NodeIndex {
public:
    void reserve(std::size_t n) { m_nodes.reserve(n); }

    void add(ElementId id, Point2 p) {
        m_nodes.push_back({id, p.x, p.z});
        m_sorted = false;
    }

    // Must run before lookups; later duplicates of an id are ignored
    void finalize();

    [[nodiscard]] std::optional<Point2> find(ElementId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] bool is_sorted() const noexcept { return m_sorted; }

private:
    std::vector<ProjectedNode> m_nodes;
    bool m_sorted = true;
};

// =============================================================================
// FOOTPRINT
// =============================================================================
struct Footprint {
    ElementId id = 0;
    std::vector<Point2> points;   // Canonical winding, closing duplicate removed
    bool closed = false;          // Source way started and ended on the same node
    float height = 0.0f;
    math::Vec3 color;
};

enum class BuildResult : std::uint8_t {
    Ok,
    NotBuilding,
    MissingNode,
    TooFewPoints
};

[[nodiscard]] const char* to_string(BuildResult r) noexcept;

// =============================================================================
// POLYGON BUILDER
// =============================================================================
class PolygonBuilder {
public:
    explicit PolygonBuilder(const BuildingConfig& config) : m_config(config) {}

    // Fills `out` and returns Ok, or reports why the way was rejected
    BuildResult build(const RawWay& way, const NodeIndex& nodes, Footprint& out) const;

    // Shoelace sum of (x2 - x1)(z2 + z1) over the wrapped edge list.
    // Positive means clockwise in this convention.
    [[nodiscard]] static double winding_sum(const std::vector<Point2>& points) noexcept;

    // Reverse clockwise rings so every footprint winds the same way
    static void normalize_winding(std::vector<Point2>& points) noexcept;

    // height tag -> building:levels * level height -> id-derived fallback
    [[nodiscard]] float resolve_height(const RawWay& way) const;

    [[nodiscard]] static math::Vec3 resolve_color(ElementId id) noexcept;

    // First plain decimal number in a tag value ("12.5 m" -> 12.5, "~30" -> 30)
    [[nodiscard]] static std::optional<float> parse_numeric_prefix(const std::string& text) noexcept;

private:
    BuildingConfig m_config;
};

} // namespace skyroam::server
