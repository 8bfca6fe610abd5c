// =============================================================================
// SKYROAM - OSM FILE SOURCE
// ElementSource over an OpenStreetMap file (.osm.pbf, .osm, .opl) read with
// libosmium. Each read() is a fresh pass over the file.
// =============================================================================
#pragma once

#include "Server/ElementSource.hpp"

#include <cstdint>
#include <string>

namespace skyroam::server {

class OsmFileSource final : public ElementSource {
public:
    explicit OsmFileSource(std::string path);

    bool open() override;

    bool read(ElementMask mask, const NodeVisitor& on_node,
              const WayVisitor& on_way, const ProgressFn& progress) override;

    // File size / 64 is a fair guess at the node count of a PBF extract
    [[nodiscard]] std::size_t size_hint() const override {
        return static_cast<std::size_t>(m_file_size / 64);
    }

    [[nodiscard]] std::string describe() const override { return m_path; }

    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
    std::uintmax_t m_file_size = 0;
};

} // namespace skyroam::server
