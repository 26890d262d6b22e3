#pragma once

#include <string>
#include <vector>

#include "talentmatch/Models.hpp"
#include "talentmatch/WeightConfig.hpp"

namespace talentmatch {

struct RequirementCheck {
    std::string name;
    bool matched = false;
};

struct SkillScore {
    double must_ratio = 0.0;
    double needed_ratio = 0.0;
    double weighted = 0.0;         // must*must_ratio + needed*needed_ratio, clamped to [0,1]
    double base_overlap = 0.0;     // category-agnostic overlap over all skills

    bool low_skill_floor = false;  // either side has fewer distinct skills than min_skill_floor
    bool categorized = true;       // false when a legacy flat list forced the needed-only fallback

    // over all skills regardless of category, sorted ascending
    std::vector<std::string> overlap;
    std::vector<std::string> anchor_only;
    std::vector<std::string> counterpart_only;

    // requirement view of the job side of the pair
    std::vector<RequirementCheck> must_checklist;
    std::vector<RequirementCheck> needed_checklist;
};

// |A ∩ B| / max(|A|, |B|, 1); empty vs empty is 0.
double overlap_ratio(const std::vector<std::string>& a, const std::vector<std::string>& b);

SkillScore score_skills(const Entity& anchor, const Entity& counterpart, const WeightConfiguration& w);

}  // namespace talentmatch
