// =============================================================================
// SKYROAM - OSM FILE SOURCE IMPLEMENTATION
// =============================================================================

#include "Server/OsmFileSource.hpp"
#include "Shared/Logger.hpp"

#include <osmium/handler.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/osm/node.hpp>
#include <osmium/osm/way.hpp>
#include <osmium/visitor.hpp>

#include <exception>
#include <filesystem>
#include <system_error>

namespace skyroam::server {

namespace {

// Converts libosmium objects into RawNode / RawWay for the visitors
class ForwardingHandler : public osmium::handler::Handler {
public:
    ForwardingHandler(const ElementSource::NodeVisitor& on_node, const ElementSource::WayVisitor& on_way)
        : m_on_node(on_node)
        , m_on_way(on_way)
    {}

    void node(const osmium::Node& node) {
        if (!m_on_node) {
            return;
        }
        if (!node.location().valid()) {
            ++m_skipped;
            return;
        }
        m_node.id = node.id();
        m_node.lat = node.location().lat();
        m_node.lon = node.location().lon();
        m_on_node(m_node);
    }

    void way(const osmium::Way& way) {
        if (!m_on_way) {
            return;
        }
        m_way.id = way.id();
        m_way.node_ids.clear();
        m_way.tags.clear();
        for (const auto& ref : way.nodes()) {
            m_way.node_ids.push_back(ref.ref());
        }
        for (const auto& tag : way.tags()) {
            m_way.tags.emplace(tag.key(), tag.value());
        }
        m_on_way(m_way);
    }

    [[nodiscard]] std::size_t skipped() const noexcept { return m_skipped; }

private:
    const ElementSource::NodeVisitor& m_on_node;
    const ElementSource::WayVisitor& m_on_way;
    RawNode m_node;
    RawWay m_way;     // Reused to keep node_ids/tags capacity between ways
    std::size_t m_skipped = 0;
};

} // namespace

OsmFileSource::OsmFileSource(std::string path)
    : m_path(std::move(path))
{}

bool OsmFileSource::open() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(m_path, ec)) {
        m_error = "File not found: " + m_path;
        LOG("OSM", m_error);
        return false;
    }
    m_file_size = std::filesystem::file_size(m_path, ec);
    if (ec) {
        m_error = "Cannot stat " + m_path + ": " + ec.message();
        LOG("OSM", m_error);
        return false;
    }
    LOG("OSM", "Opened ", m_path, " (", m_file_size / (1024 * 1024), " MB)");
    return true;
}

bool OsmFileSource::read(ElementMask mask, const NodeVisitor& on_node,
                         const WayVisitor& on_way, const ProgressFn& progress)
{
    osmium::osm_entity_bits::type entities = osmium::osm_entity_bits::nothing;
    if (has_flag(mask, ElementMask::Nodes)) entities |= osmium::osm_entity_bits::node;
    if (has_flag(mask, ElementMask::Ways)) entities |= osmium::osm_entity_bits::way;

    try {
        const osmium::io::File input{m_path};
        osmium::io::Reader reader{input, entities};
        ForwardingHandler handler{on_node, on_way};

        const auto total = static_cast<double>(reader.file_size());
        while (osmium::memory::Buffer buffer = reader.read()) {
            osmium::apply(buffer, handler);
            if (progress && total > 0.0) {
                progress(static_cast<float>(static_cast<double>(reader.offset()) / total));
            }
        }
        reader.close();

        if (handler.skipped() > 0) {
            LOG("OSM", "Skipped ", handler.skipped(), " nodes without a valid location");
        }
    } catch (const std::exception& e) {
        m_error = e.what();
        LOG("OSM", "Read failed: ", m_error);
        return false;
    }

    if (progress) {
        progress(1.0f);
    }
    return true;
}

} // namespace skyroam::server
