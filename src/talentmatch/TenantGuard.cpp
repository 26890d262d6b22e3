#include "talentmatch/TenantGuard.hpp"

#include "talentmatch/Errors.hpp"

namespace talentmatch {

void require_tenant(const Entity& anchor) {
    if (anchor.tenant_id.empty()) {
        throw NotFound(kind_str(anchor.kind), anchor.id);
    }
}

bool same_tenant(const Entity& a, const Entity& b) {
    if (a.tenant_id.empty() || b.tenant_id.empty()) return false;
    return a.tenant_id == b.tenant_id;
}

void require_same_tenant(const Entity& anchor, const Entity& counterpart) {
    require_tenant(anchor);
    if (!same_tenant(anchor, counterpart)) {
        throw TenantMismatch(kind_str(counterpart.kind), counterpart.id);
    }
}

TenantFilter admit_same_tenant(const Entity& anchor, const std::vector<Entity>& pool) {
    TenantFilter out;
    out.admitted.reserve(pool.size());
    for (const auto& e : pool) {
        if (same_tenant(anchor, e)) {
            out.admitted.push_back(&e);
        } else {
            ++out.rejected;
        }
    }
    return out;
}

}  // namespace talentmatch
