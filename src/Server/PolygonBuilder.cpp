// =============================================================================
// SKYROAM - POLYGON BUILDER IMPLEMENTATION
// =============================================================================

#include "Server/PolygonBuilder.hpp"

#include <algorithm>
#include <cmath>
#include <charconv>

namespace skyroam::server {

namespace {

// splitmix64 finalizer; stable across platforms and runs
[[nodiscard]] std::uint64_t mix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

} // namespace

// =============================================================================
// NODE INDEX
// =============================================================================

void NodeIndex::finalize() {
    if (m_sorted) {
        return;
    }
    std::stable_sort(m_nodes.begin(), m_nodes.end(),
        [](const ProjectedNode& a, const ProjectedNode& b) { return a.id < b.id; });
    m_nodes.erase(std::unique(m_nodes.begin(), m_nodes.end(),
        [](const ProjectedNode& a, const ProjectedNode& b) { return a.id == b.id; }),
        m_nodes.end());
    m_sorted = true;
}

std::optional<Point2> NodeIndex::find(ElementId id) const {
    auto it = std::lower_bound(m_nodes.begin(), m_nodes.end(), id,
        [](const ProjectedNode& n, ElementId key) { return n.id < key; });
    if (it == m_nodes.end() || it->id != id) {
        return std::nullopt;
    }
    return Point2{it->x, it->z};
}

// =============================================================================
// POLYGON BUILDER
// =============================================================================

const char* to_string(BuildResult r) noexcept {
    switch (r) {
        case BuildResult::Ok:           return "ok";
        case BuildResult::NotBuilding:  return "not a building";
        case BuildResult::MissingNode:  return "missing node";
        case BuildResult::TooFewPoints: return "too few points";
    }
    return "unknown";
}

BuildResult PolygonBuilder::build(const RawWay& way, const NodeIndex& nodes, Footprint& out) const {
    if (!way.tag("building")) {
        return BuildResult::NotBuilding;
    }

    std::size_t count = way.node_ids.size();
    const bool closed = count >= 2 && way.node_ids.front() == way.node_ids.back();
    if (closed) {
        --count;
    }

    out.points.clear();
    out.points.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto p = nodes.find(way.node_ids[i]);
        if (!p) {
            return BuildResult::MissingNode;
        }
        out.points.push_back(*p);
    }

    if (out.points.size() < 3) {
        return BuildResult::TooFewPoints;
    }

    normalize_winding(out.points);

    out.id = way.id;
    out.closed = closed;
    out.height = resolve_height(way);
    out.color = resolve_color(way.id);
    return BuildResult::Ok;
}

double PolygonBuilder::winding_sum(const std::vector<Point2>& points) noexcept {
    double sum = 0.0;
    const std::size_t n = points.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& p1 = points[i];
        const Point2& p2 = points[(i + 1) % n];
        sum += (static_cast<double>(p2.x) - p1.x) * (static_cast<double>(p2.z) + p1.z);
    }
    return sum;
}

void PolygonBuilder::normalize_winding(std::vector<Point2>& points) noexcept {
    if (winding_sum(points) > 0.0) {
        std::reverse(points.begin(), points.end());
    }
}

float PolygonBuilder::resolve_height(const RawWay& way) const {
    if (const std::string* h = way.tag("height")) {
        if (auto v = parse_numeric_prefix(*h); v && *v > 0.0f) {
            return *v;
        }
    }

    if (const std::string* levels = way.tag("building:levels")) {
        if (auto v = parse_numeric_prefix(*levels); v && *v > 0.0f) {
            return *v * m_config.level_height;
        }
    }

    const std::uint64_t h = mix64(static_cast<std::uint64_t>(way.id));
    const float t = static_cast<float>(h % 1000) / 1000.0f;
    return m_config.fallback_min_height + t * (m_config.fallback_max_height - m_config.fallback_min_height);
}

math::Vec3 PolygonBuilder::resolve_color(ElementId id) noexcept {
    const auto bucket = static_cast<float>(((id % 100) + 100) % 100);
    const float grey = 0.15f + (bucket / 100.0f) * 0.20f;
    return {grey, grey, grey};
}

std::optional<float> PolygonBuilder::parse_numeric_prefix(const std::string& text) noexcept {
    // Skip annotations like "~" or "approx " ahead of the number
    auto start = text.find_first_of("0123456789");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    if (start > 0 && text[start - 1] == '.') --start;
    if (start > 0 && text[start - 1] == '-') --start;

    const char* first = text.data() + start;
    const char* last = text.data() + text.size();
    float value = 0.0f;
    const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
    if (ec != std::errc{} || ptr == first || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace skyroam::server
