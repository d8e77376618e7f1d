#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

/**
 * @class ItemFactory
 * @brief Constructs items of a common base type from a registered name.
 *
 * Clipboard transports are registered under their settings names
 * ("TemporaryFile", "OSClipboard") and created from the persisted mode.
 *
 * @tparam T Base type of the created items.
 */
template<typename T>
class ItemFactory
{
public:
    using CreateFunc = std::function<std::unique_ptr<T>()>;

    ItemFactory() = default;

    /// Registers @p createFunc under @p name, replacing an earlier entry.
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        m_creators.insert_or_assign(name, std::move(createFunc));
    }

    /// @return A new item, or nullptr when nothing is registered under @p name.
    std::unique_ptr<T> createItem(const std::string& name) const
    {
        const auto it = m_creators.find(name);
        if (it == m_creators.end())
            return nullptr;
        return it->second();
    }

    [[nodiscard]] bool contains(const std::string& name) const
    {
        return m_creators.find(name) != m_creators.end();
    }

    /// Default-constructing creator for a concrete item type.
    template<typename Derived>
    static std::unique_ptr<T> createItemType()
    {
        return std::make_unique<Derived>();
    }

private:
    std::map<std::string, CreateFunc> m_creators;
};
