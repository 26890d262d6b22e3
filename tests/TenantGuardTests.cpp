#include <gtest/gtest.h>

#include <string>

#include "TestEntities.hpp"
#include "talentmatch/Errors.hpp"
#include "talentmatch/TenantGuard.hpp"

using namespace talentmatch;
using namespace testdata;

TEST(TenantGuardTest, SameTenantRequiresNonEmptyEqualIds) {
    EXPECT_TRUE(same_tenant(candidate("c1", {}, "acme"), job("j1", {}, "acme")));
    EXPECT_FALSE(same_tenant(candidate("c1", {}, "acme"), job("j1", {}, "globex")));
    EXPECT_FALSE(same_tenant(candidate("c1", {}, ""), job("j1", {}, "")));
}

TEST(TenantGuardTest, AnchorWithoutTenantIsNotFound) {
    EXPECT_THROW(require_tenant(candidate("c1", {}, "")), NotFound);
    EXPECT_NO_THROW(require_tenant(candidate("c1", {}, "acme")));
}

TEST(TenantGuardTest, MismatchLooksExactlyLikeNotFound) {
    const Entity c = candidate("c1", {}, "acme");
    const Entity j = job("j7", {}, "globex");

    std::string mismatch_message;
    try {
        require_same_tenant(c, j);
        FAIL() << "expected TenantMismatch";
    } catch (const NotFound& e) {
        mismatch_message = e.what();
    }

    EXPECT_EQ(mismatch_message, std::string(NotFound("job", "j7").what()));
}

TEST(TenantGuardTest, PoolFilterDropsOtherTenantsAndKeepsOrder) {
    const Entity anchor = candidate("c1", {}, "acme");
    const std::vector<Entity> pool = {
        job("j1", {}, "acme"),
        job("j2", {}, "globex"),
        job("j3", {}, "acme"),
        job("j4", {}, ""),
    };

    const TenantFilter f = admit_same_tenant(anchor, pool);
    ASSERT_EQ(f.admitted.size(), 2u);
    EXPECT_EQ(f.admitted[0]->id, "j1");
    EXPECT_EQ(f.admitted[1]->id, "j3");
    EXPECT_EQ(f.rejected, 2u);
}
