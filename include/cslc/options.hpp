#ifndef CSLC_OPTIONS_HPP
#define CSLC_OPTIONS_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cslc/fwd.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

struct Option {
    std::pmr::u8string name;
    std::pmr::u8string value;
};

/// @brief A mapping from option names to values in which each name occurs at most once.
/// Entries are kept in the order in which their names were first inserted.
struct Option_Map {
private:
    std::pmr::vector<Option> m_entries;

public:
    [[nodiscard]]
    explicit Option_Map(std::pmr::memory_resource* memory)
        : m_entries { memory }
    {
    }

    [[nodiscard]]
    Option_Map(std::span<const Style_Attribute> attributes, std::pmr::memory_resource* memory)
        : m_entries { memory }
    {
        for (const Style_Attribute& attribute : attributes) {
            set(attribute.name, attribute.value);
        }
    }

    /// @brief Returns the value of the option named `name`,
    /// or `std::nullopt` if it has not been set.
    [[nodiscard]]
    std::optional<std::u8string_view> find(std::u8string_view name) const;

    [[nodiscard]]
    bool contains(std::u8string_view name) const
    {
        return find(name).has_value();
    }

    /// @brief Sets the option named `name` to `value`,
    /// replacing any value that was set before.
    void set(std::u8string_view name, std::u8string_view value);

    /// @brief Sets the option named `name` to `value` only if it is not set yet.
    /// @returns `true` iff the option was inserted.
    bool set_default(std::u8string_view name, std::u8string_view value);

    /// @brief Appends the given attributes as options after the existing ones.
    /// Options which are already set keep their value,
    /// and within `attributes`, the first occurrence of a name takes precedence.
    void extend(std::span<const Style_Attribute> attributes);

    [[nodiscard]]
    std::size_t size() const
    {
        return m_entries.size();
    }

    [[nodiscard]]
    bool empty() const
    {
        return m_entries.empty();
    }

    [[nodiscard]]
    auto begin() const
    {
        return m_entries.begin();
    }

    [[nodiscard]]
    auto end() const
    {
        return m_entries.end();
    }
};

} // namespace cslc

#endif
