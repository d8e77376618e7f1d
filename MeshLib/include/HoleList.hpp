#ifndef HOLE_LIST_HPP_INCLUDED
#define HOLE_LIST_HPP_INCLUDED

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

/// Slot container with stable indices. Removing an element leaves a hole that
/// the next insertion fills, so an index stays valid until its own element is
/// removed. Mesh element ids are HoleList indices.
template<typename T>
class HoleList
{
public:
    HoleList() = default;

    /// @return The number of live elements.
    [[nodiscard]] int32_t size() const noexcept
    {
        return m_live;
    }

    [[nodiscard]] bool valid(int32_t index) const noexcept
    {
        return index >= 0 && index < static_cast<int32_t>(m_slots.size()) && m_slots[index].live;
    }

    T& operator[](int32_t index) noexcept
    {
        return m_slots[index].value;
    }

    const T& operator[](int32_t index) const noexcept
    {
        return m_slots[index].value;
    }

    /// Stores the element in the most recently freed slot, or appends it.
    /// @return The index of the element.
    int32_t insert(T element)
    {
        int32_t index = static_cast<int32_t>(m_slots.size());

        if (m_holes.empty())
        {
            m_slots.push_back(Slot{std::move(element), true});
        }
        else
        {
            index = m_holes.back();
            m_holes.pop_back();
            m_slots[index] = Slot{std::move(element), true};
        }

        ++m_live;
        m_indicesStale = true;
        return index;
    }

    /// Releases the element (resetting it to T{}) and frees its slot.
    void remove(int32_t index)
    {
        assert(valid(index) && "HoleList::remove on a hole");

        m_slots[index] = Slot{};
        m_holes.push_back(index);
        --m_live;
        m_indicesStale = true;
    }

    void clear() noexcept
    {
        m_slots.clear();
        m_holes.clear();
        m_indices.clear();
        m_live         = 0;
        m_indicesStale = false;
    }

    /// @return Indices of the live elements, ascending. Invalidated by insert/remove.
    [[nodiscard]] const std::vector<int32_t>& valid_indices() const
    {
        if (m_indicesStale)
        {
            m_indices.clear();
            m_indices.reserve(static_cast<size_t>(m_live));
            for (size_t i = 0; i < m_slots.size(); ++i)
            {
                if (m_slots[i].live)
                    m_indices.push_back(static_cast<int32_t>(i));
            }
            m_indicesStale = false;
        }
        return m_indices;
    }

private:
    struct Slot
    {
        T    value{};
        bool live = false;
    };

    std::vector<Slot>            m_slots;
    std::vector<int32_t>         m_holes;
    mutable std::vector<int32_t> m_indices;
    mutable bool                 m_indicesStale = false;
    int32_t                      m_live         = 0;
};

#endif // HOLE_LIST_HPP_INCLUDED
