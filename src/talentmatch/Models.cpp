#include "talentmatch/Models.hpp"

#include <unordered_map>

namespace talentmatch {

const char* kind_str(EntityKind k) {
    switch (k) {
        case EntityKind::Candidate: return "candidate";
        case EntityKind::Job: return "job";
        default: return "unknown";
    }
}

const char* category_str(SkillCategory c) {
    switch (c) {
        case SkillCategory::Must: return "must";
        case SkillCategory::Needed: return "needed";
        default: return "unknown";
    }
}

const char* provenance_str(SkillProvenance p) {
    switch (p) {
        case SkillProvenance::Extracted: return "extracted";
        case SkillProvenance::Synthetic: return "synthetic";
        default: return "unknown";
    }
}

EntityKind opposite(EntityKind k) {
    return k == EntityKind::Candidate ? EntityKind::Job : EntityKind::Candidate;
}

std::vector<SkillRef> dedupe_skills(const std::vector<SkillRef>& skills) {
    std::vector<SkillRef> out;
    out.reserve(skills.size());

    std::unordered_map<std::string, size_t> pos;
    pos.reserve(skills.size() * 2 + 8);

    for (const auto& s : skills) {
        if (s.name.empty()) continue;

        auto it = pos.find(s.name);
        if (it == pos.end()) {
            pos.emplace(s.name, out.size());
            out.push_back(s);
            continue;
        }

        SkillRef& kept = out[it->second];
        if (s.category == SkillCategory::Must && kept.category != SkillCategory::Must) {
            kept.category = SkillCategory::Must;
            kept.provenance = s.provenance;
        }
    }
    return out;
}

}  // namespace talentmatch
