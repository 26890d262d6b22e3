#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "talentmatch/Models.hpp"

namespace talentmatch {

struct PoolFilter {
    EntityKind kind = EntityKind::Job;
    std::optional<std::string> city;  // canonical city, matched case-insensitively
    size_t limit = 0;                 // 0 = no limit
};

// Read side of whatever persists entities. Implementations only ever return
// entities of the requested tenant.
class EntityStore {
public:
    virtual ~EntityStore() = default;

    virtual std::optional<Entity> get_entity(const std::string& tenant_id, const std::string& entity_id) const = 0;
    virtual std::vector<Entity> query_pool(const std::string& tenant_id, const PoolFilter& filter) const = 0;
};

class InMemoryEntityStore final : public EntityStore {
public:
    InMemoryEntityStore() = default;
    explicit InMemoryEntityStore(const std::vector<Entity>& entities);

    // Throws std::runtime_error on an empty tenant/id or a duplicate id within one tenant.
    void add(Entity e);
    size_t size() const { return m_entities.size(); }

    std::optional<Entity> get_entity(const std::string& tenant_id, const std::string& entity_id) const override;
    std::vector<Entity> query_pool(const std::string& tenant_id, const PoolFilter& filter) const override;

private:
    // (tenant, id); ordered so query_pool is deterministic
    std::map<std::pair<std::string, std::string>, Entity> m_entities;
};

}  // namespace talentmatch
