#ifndef EDGE_SET_HPP_INCLUDED
#define EDGE_SET_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

using IndexPair = std::pair<int32_t, int32_t>;

/// Set of undirected edges. Edges are stored with the lowest vertex first, so
/// (a, b) and (b, a) name the same element.
class EdgeSet
{
public:
    EdgeSet() = default;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_edges.empty();
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return m_edges.size();
    }

    void clear() noexcept
    {
        m_edges.clear();
    }

    [[nodiscard]] bool contains(IndexPair edge) const noexcept
    {
        normalize(edge);
        return m_edges.contains(edge);
    }

    // @return True if the edge was not already present.
    bool insert(IndexPair edge)
    {
        normalize(edge);
        return m_edges.insert(edge).second;
    }

    // @return True if the edge was present.
    bool erase(IndexPair edge) noexcept
    {
        normalize(edge);
        return m_edges.erase(edge) != 0;
    }

    [[nodiscard]] std::vector<IndexPair> to_vector() const
    {
        return {m_edges.begin(), m_edges.end()};
    }

    auto begin() const noexcept
    {
        return m_edges.begin();
    }

    auto end() const noexcept
    {
        return m_edges.end();
    }

    static void normalize(IndexPair& edge) noexcept
    {
        if (edge.first > edge.second)
            std::swap(edge.first, edge.second);
    }

private:
    std::set<IndexPair> m_edges;
};

#endif // EDGE_SET_HPP_INCLUDED
