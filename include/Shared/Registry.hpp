// =============================================================================
// VOXSTREAM - NAMED REGISTRY
// Name <-> sequential id mapping, ids assigned in registration order
// =============================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace voxstream {

template<typename T>
class Registry {
public:
    using Id = std::uint32_t;

    // Register a value under a unique name. Returns nullopt on duplicate names.
    std::optional<Id> register_entry(std::string name, T value) {
        if (m_ids.find(name) != m_ids.end()) {
            return std::nullopt;
        }
        const Id id = static_cast<Id>(m_entries.size());
        m_ids.emplace(name, id);
        m_entries.emplace_back(std::move(name), std::move(value));
        return id;
    }

    [[nodiscard]] std::optional<Id> get_id_by_name(std::string_view name) const {
        auto it = m_ids.find(std::string(name));
        if (it == m_ids.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] const T* get_value_by_id(Id id) const noexcept {
        if (id >= m_entries.size()) {
            return nullptr;
        }
        return &m_entries[id].second;
    }

    [[nodiscard]] const T* get_value_by_name(std::string_view name) const {
        auto id = get_id_by_name(name);
        return id ? get_value_by_id(*id) : nullptr;
    }

    [[nodiscard]] const std::string* get_name_by_id(Id id) const noexcept {
        if (id >= m_entries.size()) {
            return nullptr;
        }
        return &m_entries[id].first;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    // Entries in id order
    [[nodiscard]] auto begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_entries.end(); }

private:
    std::vector<std::pair<std::string, T>> m_entries;
    std::unordered_map<std::string, Id> m_ids;
};

} // namespace voxstream
