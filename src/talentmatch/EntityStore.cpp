#include "talentmatch/EntityStore.hpp"

#include <stdexcept>

#include "text/TextUtil.hpp"

namespace talentmatch {

InMemoryEntityStore::InMemoryEntityStore(const std::vector<Entity>& entities) {
    for (const auto& e : entities) add(e);
}

void InMemoryEntityStore::add(Entity e) {
    if (e.tenant_id.empty()) throw std::runtime_error("entity " + e.id + " has no tenant_id");
    if (e.id.empty()) throw std::runtime_error("entity with empty id in tenant " + e.tenant_id);

    auto key = std::make_pair(e.tenant_id, e.id);
    if (m_entities.count(key)) {
        throw std::runtime_error("duplicate entity id " + e.id + " in tenant " + e.tenant_id);
    }
    m_entities.emplace(std::move(key), std::move(e));
}

std::optional<Entity> InMemoryEntityStore::get_entity(const std::string& tenant_id, const std::string& entity_id) const {
    auto it = m_entities.find(std::make_pair(tenant_id, entity_id));
    if (it == m_entities.end()) return std::nullopt;
    return it->second;
}

std::vector<Entity> InMemoryEntityStore::query_pool(const std::string& tenant_id, const PoolFilter& filter) const {
    std::vector<Entity> out;

    std::string city;
    if (filter.city) city = textutil::canonical_key(*filter.city);

    for (auto it = m_entities.lower_bound(std::make_pair(tenant_id, std::string()));
         it != m_entities.end() && it->first.first == tenant_id; ++it) {
        const Entity& e = it->second;
        if (e.kind != filter.kind) continue;
        if (filter.city && textutil::canonical_key(e.city) != city) continue;

        out.push_back(e);
        if (filter.limit > 0 && out.size() >= filter.limit) break;
    }

    return out;
}

}  // namespace talentmatch
