#pragma once

#include <vector>

#include "talentmatch/Models.hpp"

namespace talentmatch {

// Runs before any scoring or cache access.

// Throws NotFound when the anchor has no resolvable tenant.
void require_tenant(const Entity& anchor);

// false when either tenant id is empty
bool same_tenant(const Entity& a, const Entity& b);

// Throws TenantMismatch (a NotFound) naming the counterpart.
void require_same_tenant(const Entity& anchor, const Entity& counterpart);

struct TenantFilter {
    std::vector<const Entity*> admitted;  // pool order preserved
    size_t rejected = 0;
};

TenantFilter admit_same_tenant(const Entity& anchor, const std::vector<Entity>& pool);

}  // namespace talentmatch
