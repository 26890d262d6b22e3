#include "talentmatch/Explainer.hpp"

#include "io/JsonIO.hpp"
#include "talentmatch/Errors.hpp"

namespace talentmatch {

using json = nlohmann::json;

static json nullable(const std::optional<double>& v, int decimals) {
    if (!v) return nullptr;
    return round_decimals(*v, decimals);
}

static size_t matched_count(const std::vector<RequirementCheck>& list) {
    size_t n = 0;
    for (const auto& c : list) {
        if (c.matched) ++n;
    }
    return n;
}

static json checklist_to_json(const std::vector<RequirementCheck>& list) {
    json arr = json::array();
    for (const auto& c : list) {
        arr.push_back({{"name", c.name}, {"matched", c.matched}});
    }
    return arr;
}

Explanation explain_match(const MatchResult& r) {
    if (!r.breakdown) {
        throw MatchError("no breakdown for " + r.anchor_id + " -> " + r.counterpart_id);
    }
    const MatchBreakdown& b = *r.breakdown;
    const SkillScore& s = b.skills;

    Explanation e;
    e.anchor_id = r.anchor_id;
    e.anchor_kind = r.anchor_kind;
    e.score = r.score;
    e.weights_version = r.weights_version;

    for (size_t i = 0; i < kComponentCount; ++i) {
        ComponentExplanation& c = e.components[i];
        c.component = static_cast<Component>(i);
        c.raw = b.components[i].raw;
        c.weight = b.components[i].weight;
        c.weighted = b.components[i].weighted;
        c.included = b.components[i].included();
    }
    e.weight_sum = b.weight_sum;

    e.skill_overlap = s.overlap;
    if (r.anchor_kind == EntityKind::Job) {
        e.job_id = r.anchor_id;
        e.candidate_id = r.counterpart_id;
        e.job_only_skills = s.anchor_only;
        e.candidate_only_skills = s.counterpart_only;
    } else {
        e.candidate_id = r.anchor_id;
        e.job_id = r.counterpart_id;
        e.candidate_only_skills = s.anchor_only;
        e.job_only_skills = s.counterpart_only;
    }

    e.must_ratio = s.must_ratio;
    e.needed_ratio = s.needed_ratio;
    e.weighted_skill_score = s.weighted;
    e.base_skill_overlap = s.base_overlap;

    e.title_similarity = b.at(Component::Title).raw;
    e.semantic_similarity = b.at(Component::Semantic).raw;
    e.embedding_similarity = b.at(Component::Embedding).raw;
    e.distance_km = b.distance_km;
    e.distance_score = b.at(Component::Distance).raw;

    e.skills_must_list = s.must_checklist;
    e.skills_nice_list = s.needed_checklist;

    e.low_skill_floor = s.low_skill_floor;
    e.degenerate_weights = b.degenerate_weights;
    e.skills_categorized = s.categorized;

    return e;
}

json Explanation::to_json() const {
    json j;

    j["candidate_id"] = candidate_id;
    j["job_id"] = job_id;
    j["anchor_id"] = anchor_id;
    j["anchor_kind"] = kind_str(anchor_kind);

    j["score"] = round_decimals(score, 4);
    j["weights_version"] = weights_version;
    if (weights) j["weights"] = weights_to_json(*weights);

    j["skill_overlap"] = skill_overlap;
    j["candidate_only_skills"] = candidate_only_skills;
    j["job_only_skills"] = job_only_skills;
    j["must_ratio"] = round_decimals(must_ratio, 4);
    j["needed_ratio"] = round_decimals(needed_ratio, 4);
    j["weighted_skill_score"] = round_decimals(weighted_skill_score, 4);
    j["base_skill_overlap"] = round_decimals(base_skill_overlap, 4);

    j["title_similarity"] = nullable(title_similarity, 4);
    j["semantic_similarity"] = nullable(semantic_similarity, 4);
    j["embedding_similarity"] = nullable(embedding_similarity, 4);
    j["distance_km"] = nullable(distance_km, 1);
    j["distance_score"] = nullable(distance_score, 4);

    json comps = json::object();
    for (const auto& c : components) {
        comps[component_str(c.component)] = {
            {"raw", nullable(c.raw, 4)},
            {"weight", c.weight},
            {"weighted", round_decimals(c.weighted, 4)},
            {"included", c.included}
        };
    }
    j["components"] = comps;
    j["weight_sum"] = round_decimals(weight_sum, 4);

    j["skills_must_list"] = checklist_to_json(skills_must_list);
    j["skills_nice_list"] = checklist_to_json(skills_nice_list);
    j["must_total"] = skills_must_list.size();
    j["must_matched"] = matched_count(skills_must_list);
    j["nice_total"] = skills_nice_list.size();
    j["nice_matched"] = matched_count(skills_nice_list);

    j["low_skill_floor"] = low_skill_floor;
    j["degenerate_weights"] = degenerate_weights;
    j["skills_categorized"] = skills_categorized;

    return j;
}

void Explanation::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

}  // namespace talentmatch
