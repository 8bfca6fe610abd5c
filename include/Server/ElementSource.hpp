// =============================================================================
// SKYROAM - MAP ELEMENT SOURCE
// Typed element stream the ingestion worker reads from. The file-backed
// implementation lives in OsmFileSource; MemorySource serves tests and
// fallbacks.
// =============================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace skyroam::server {

using ElementId = std::int64_t;

// =============================================================================
// RAW ELEMENTS
// =============================================================================
struct RawNode {
    ElementId id = 0;
    double lat = 0.0;
    double lon = 0.0;
};

struct RawWay {
    ElementId id = 0;
    std::vector<ElementId> node_ids;
    std::unordered_map<std::string, std::string> tags;

    [[nodiscard]] const std::string* tag(const std::string& key) const {
        auto it = tags.find(key);
        return it != tags.end() ? &it->second : nullptr;
    }
};

using RawElement = std::variant<RawNode, RawWay>;

// Which element kinds a pass wants delivered
enum class ElementMask : std::uint8_t {
    Nodes = 1 << 0,
    Ways  = 1 << 1,
    All   = Nodes | Ways
};

[[nodiscard]] constexpr bool has_flag(ElementMask mask, ElementMask flag) noexcept {
    return (static_cast<std::uint8_t>(mask) & static_cast<std::uint8_t>(flag)) != 0;
}

// =============================================================================
// ELEMENT SOURCE INTERFACE
// =============================================================================
class ElementSource {
public:
    using NodeVisitor = std::function<void(const RawNode&)>;
    using WayVisitor = std::function<void(const RawWay&)>;
    // Fraction of the input consumed so far, in [0, 1]
    using ProgressFn = std::function<void(float)>;

    virtual ~ElementSource() = default;

    // Prepare for reading. On failure `error()` describes why.
    virtual bool open() = 0;

    // One full pass over the input, delivering elements selected by `mask`
    // in input order. Returns false on a read error.
    virtual bool read(ElementMask mask, const NodeVisitor& on_node,
                      const WayVisitor& on_way, const ProgressFn& progress) = 0;

    // Rough element count for reserving, 0 if unknown
    [[nodiscard]] virtual std::size_t size_hint() const { return 0; }

    [[nodiscard]] virtual std::string describe() const = 0;

    [[nodiscard]] const std::string& error() const noexcept { return m_error; }

protected:
    std::string m_error;
};

// =============================================================================
// IN-MEMORY SOURCE
// =============================================================================
class MemorySource final : public ElementSource {
public:
    MemorySource() = default;
    explicit MemorySource(std::vector<RawElement> elements) : m_elements(std::move(elements)) {}

    void add(RawElement element) { m_elements.push_back(std::move(element)); }

    bool open() override { return true; }

    bool read(ElementMask mask, const NodeVisitor& on_node,
              const WayVisitor& on_way, const ProgressFn& progress) override
    {
        const std::size_t total = m_elements.size();
        std::size_t done = 0;
        for (const RawElement& e : m_elements) {
            if (const auto* node = std::get_if<RawNode>(&e)) {
                if (has_flag(mask, ElementMask::Nodes) && on_node) on_node(*node);
            } else if (const auto* way = std::get_if<RawWay>(&e)) {
                if (has_flag(mask, ElementMask::Ways) && on_way) on_way(*way);
            }
            ++done;
            if (progress && total > 0) {
                progress(static_cast<float>(done) / static_cast<float>(total));
            }
        }
        return true;
    }

    [[nodiscard]] std::size_t size_hint() const override { return m_elements.size(); }
    [[nodiscard]] std::string describe() const override { return "memory"; }

private:
    std::vector<RawElement> m_elements;
};

} // namespace skyroam::server
