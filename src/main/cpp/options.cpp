#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "cslc/options.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

std::optional<std::u8string_view> Option_Map::find(std::u8string_view name) const
{
    const auto it = std::ranges::find(m_entries, name, &Option::name);
    if (it == m_entries.end()) {
        return {};
    }
    return it->value;
}

void Option_Map::set(std::u8string_view name, std::u8string_view value)
{
    const auto it = std::ranges::find(m_entries, name, &Option::name);
    if (it != m_entries.end()) {
        it->value = value;
        return;
    }
    std::pmr::memory_resource* const memory = m_entries.get_allocator().resource();
    m_entries.push_back({ .name = std::pmr::u8string { name, memory },
                          .value = std::pmr::u8string { value, memory } });
}

bool Option_Map::set_default(std::u8string_view name, std::u8string_view value)
{
    if (contains(name)) {
        return false;
    }
    set(name, value);
    return true;
}

void Option_Map::extend(std::span<const Style_Attribute> attributes)
{
    for (const Style_Attribute& attribute : attributes) {
        set_default(attribute.name, attribute.value);
    }
}

} // namespace cslc
