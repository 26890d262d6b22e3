#include "talentmatch/SkillScorer.hpp"

#include <algorithm>
#include <unordered_set>

namespace talentmatch {

using SkillSet = std::unordered_set<std::string>;

struct Partition {
    SkillSet must;
    SkillSet needed;
    SkillSet all;
};

static Partition partition(const Entity& e, bool collapse_to_needed) {
    Partition p;
    p.all.reserve(e.skills.size() * 2 + 8);

    for (const auto& s : e.skills) {
        if (s.name.empty()) continue;
        p.all.insert(s.name);
    }

    // "must" wins when the same name shows up under both categories
    for (const auto& s : e.skills) {
        if (s.name.empty()) continue;
        if (!collapse_to_needed && s.category == SkillCategory::Must) p.must.insert(s.name);
    }
    for (const auto& name : p.all) {
        if (p.must.find(name) == p.must.end()) p.needed.insert(name);
    }
    return p;
}

static size_t intersection_size(const SkillSet& a, const SkillSet& b) {
    const SkillSet& small = a.size() <= b.size() ? a : b;
    const SkillSet& large = a.size() <= b.size() ? b : a;

    size_t n = 0;
    for (const auto& s : small) {
        if (large.find(s) != large.end()) ++n;
    }
    return n;
}

static double overlap_sets(const SkillSet& a, const SkillSet& b) {
    const size_t denom = std::max<size_t>({a.size(), b.size(), 1});
    return static_cast<double>(intersection_size(a, b)) / static_cast<double>(denom);
}

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

static std::vector<std::string> sorted(const SkillSet& s) {
    std::vector<std::string> out(s.begin(), s.end());
    std::sort(out.begin(), out.end());
    return out;
}

static std::vector<RequirementCheck> checklist(const SkillSet& required, const SkillSet& offered) {
    std::vector<RequirementCheck> out;
    out.reserve(required.size());
    for (const auto& name : sorted(required)) {
        out.push_back(RequirementCheck{name, offered.find(name) != offered.end()});
    }
    return out;
}

double overlap_ratio(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const SkillSet sa(a.begin(), a.end());
    const SkillSet sb(b.begin(), b.end());
    return overlap_sets(sa, sb);
}

SkillScore score_skills(const Entity& anchor, const Entity& counterpart, const WeightConfiguration& w) {
    SkillScore out;

    // A legacy flat list on either side means categories cannot be compared;
    // both sides fall back to "needed" so must contributes nothing.
    const bool collapse = !anchor.skills_categorized || !counterpart.skills_categorized;
    out.categorized = !collapse;

    const Partition a = partition(anchor, collapse);
    const Partition b = partition(counterpart, collapse);

    out.must_ratio = overlap_sets(a.must, b.must);
    out.needed_ratio = overlap_sets(a.needed, b.needed);
    out.weighted = clamp01(w.must * out.must_ratio + w.needed * out.needed_ratio);
    out.base_overlap = overlap_sets(a.all, b.all);

    const size_t min_skills = static_cast<size_t>(std::max(0, w.min_skill_floor));
    out.low_skill_floor = a.all.size() < min_skills || b.all.size() < min_skills;

    for (const auto& s : sorted(a.all)) {
        if (b.all.find(s) != b.all.end()) {
            out.overlap.push_back(s);
        } else {
            out.anchor_only.push_back(s);
        }
    }
    for (const auto& s : sorted(b.all)) {
        if (a.all.find(s) == a.all.end()) out.counterpart_only.push_back(s);
    }

    const bool job_is_anchor = anchor.kind == EntityKind::Job && counterpart.kind != EntityKind::Job;
    const Partition& job = job_is_anchor ? a : b;
    const Partition& other = job_is_anchor ? b : a;
    out.must_checklist = checklist(job.must, other.all);
    out.needed_checklist = checklist(job.needed, other.all);

    return out;
}

}  // namespace talentmatch
