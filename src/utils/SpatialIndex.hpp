#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

#include "BBox.hpp"
#include "Vec2.hpp"

namespace spatial_index
{

constexpr size_t kDefaultNodeCapacity = 8;
constexpr int kDefaultMaxDepth = 10;

struct QuadTreeStatistics {
    size_t total_entries = 0;  // Counts an entry once per node holding it
    size_t total_nodes = 0;
    int max_depth = 0;
    double average_entries_per_node = 0.0;
};

// Region quadtree over axis-aligned boxes. An entry whose box overlaps several child
// regions is stored in every one of them, so Query() results can contain the same value
// more than once; callers deduplicate.
template <typename T>
class QuadTree
{
public:
    struct Entry {
        BBox bounds;
        T value;
    };

    explicit QuadTree(const BBox& region, size_t capacity = kDefaultNodeCapacity, int max_depth = kDefaultMaxDepth)
        : m_capacity_(capacity == 0 ? 1 : capacity), m_max_depth_(max_depth < 0 ? 0 : max_depth)
    {
        m_root_ = std::make_unique<Node>(region, 0);
    }

    // Returns false when the box lies entirely outside the root region.
    bool Insert(const BBox& bounds, const T& value) { return InsertInto(*m_root_, Entry {bounds, value}); }

    // Appends every stored value whose box intersects region (inclusive). May append duplicates.
    void Query(const BBox& region, std::vector<T>& out) const { QueryNode(*m_root_, region, out); }

    [[nodiscard]] std::vector<T> Query(const BBox& region) const
    {
        std::vector<T> results;
        Query(region, results);
        return results;
    }

    [[nodiscard]] std::vector<T> QueryPoint(const Vec2& point) const
    {
        std::vector<T> results;
        QueryNode(*m_root_, BBox::FromPoint(point), results);
        return results;
    }

    [[nodiscard]] QuadTreeStatistics GetStatistics() const
    {
        QuadTreeStatistics stats;
        CollectStatistics(*m_root_, stats);
        if (stats.total_nodes > 0) {
            stats.average_entries_per_node = static_cast<double>(stats.total_entries) / static_cast<double>(stats.total_nodes);
        }
        return stats;
    }

    void Clear() { m_root_ = std::make_unique<Node>(m_root_->region, 0); }

    [[nodiscard]] const BBox& GetRegion() const { return m_root_->region; }
    [[nodiscard]] size_t GetCapacity() const { return m_capacity_; }
    [[nodiscard]] int GetMaxDepth() const { return m_max_depth_; }

private:
    struct Node {
        Node(const BBox& region_in, int depth_in) : region(region_in), depth(depth_in) {}

        BBox region;
        int depth;
        std::vector<Entry> entries;
        std::array<std::unique_ptr<Node>, 4> children;  // nw, ne, sw, se
        bool divided = false;
    };

    bool InsertInto(Node& node, const Entry& entry)
    {
        if (!node.region.Intersects(entry.bounds)) {
            return false;
        }

        if (!node.divided && node.entries.size() < m_capacity_) {
            node.entries.push_back(entry);
            return true;
        }

        if (node.depth >= m_max_depth_) {
            node.entries.push_back(entry);
            return true;
        }

        if (!node.divided) {
            Subdivide(node);
        }

        bool inserted = false;
        for (auto& child : node.children) {
            if (InsertInto(*child, entry)) {
                inserted = true;
            }
        }
        return inserted;
    }

    void Subdivide(Node& node)
    {
        const BBox& reg = node.region;
        Vec2 const kMid = reg.Center();
        int const kChildDepth = node.depth + 1;

        node.children[0] = std::make_unique<Node>(BBox(reg.min_x, kMid.y_ax, kMid.x_ax, reg.max_y), kChildDepth);
        node.children[1] = std::make_unique<Node>(BBox(kMid.x_ax, kMid.y_ax, reg.max_x, reg.max_y), kChildDepth);
        node.children[2] = std::make_unique<Node>(BBox(reg.min_x, reg.min_y, kMid.x_ax, kMid.y_ax), kChildDepth);
        node.children[3] = std::make_unique<Node>(BBox(kMid.x_ax, reg.min_y, reg.max_x, kMid.y_ax), kChildDepth);
        node.divided = true;

        std::vector<Entry> existing;
        existing.swap(node.entries);
        for (const Entry& entry : existing) {
            for (auto& child : node.children) {
                InsertInto(*child, entry);
            }
        }
    }

    void QueryNode(const Node& node, const BBox& region, std::vector<T>& out) const
    {
        if (!node.region.Intersects(region)) {
            return;
        }
        for (const Entry& entry : node.entries) {
            if (entry.bounds.Intersects(region)) {
                out.push_back(entry.value);
            }
        }
        if (node.divided) {
            for (const auto& child : node.children) {
                QueryNode(*child, region, out);
            }
        }
    }

    void CollectStatistics(const Node& node, QuadTreeStatistics& stats) const
    {
        stats.total_nodes++;
        stats.total_entries += node.entries.size();
        if (node.depth > stats.max_depth) {
            stats.max_depth = node.depth;
        }
        if (node.divided) {
            for (const auto& child : node.children) {
                CollectStatistics(*child, stats);
            }
        }
    }

    size_t m_capacity_;
    int m_max_depth_;
    std::unique_ptr<Node> m_root_;
};

}  // namespace spatial_index
