#include "talentmatch/CompositeScorer.hpp"

#include <algorithm>
#include <cmath>

#include "talentmatch/GeoScorer.hpp"
#include "talentmatch/Similarity.hpp"

namespace talentmatch {

const char* component_str(Component c) {
    switch (c) {
        case Component::Skill: return "skill";
        case Component::Title: return "title";
        case Component::Semantic: return "semantic";
        case Component::Embedding: return "embedding";
        case Component::Distance: return "distance";
        default: return "unknown";
    }
}

static double clamp01(double x) {
    if (!(x >= 0.0)) return 0.0;  // also catches NaN
    if (x > 1.0) return 1.0;
    return x;
}

static void set_component(MatchBreakdown& b, Component c, std::optional<double> raw, double weight) {
    ComponentValue& v = b.at(c);
    v.raw = raw;
    v.weight = weight;
    v.weighted = raw ? weight * *raw : 0.0;
}

MatchBreakdown compute_components(const Entity& anchor, const Entity& counterpart, const WeightConfiguration& w) {
    MatchBreakdown b;

    b.skills = score_skills(anchor, counterpart, w);
    set_component(b, Component::Skill, b.skills.weighted, w.skill);

    set_component(b, Component::Title, title_similarity(anchor.title, counterpart.title), w.title);
    set_component(b, Component::Semantic, semantic_similarity(anchor.text_blob, counterpart.text_blob), w.semantic);
    set_component(b, Component::Embedding, embedding_similarity(anchor.embedding, counterpart.embedding), w.embedding);

    b.distance_km = distance_km(anchor.location, counterpart.location);
    std::optional<double> dist_score;
    if (b.distance_km) dist_score = distance_score(*b.distance_km);
    set_component(b, Component::Distance, dist_score, w.distance);

    return b;
}

double combine(MatchBreakdown& b) {
    double num = 0.0;
    double den = 0.0;
    for (const auto& c : b.components) {
        if (!c.included()) continue;
        num += c.weighted;
        den += c.weight;
    }
    b.weight_sum = den;

    if (den <= 0.0) {
        b.degenerate_weights = true;
        return clamp01(b.at(Component::Skill).raw.value_or(0.0));
    }

    b.degenerate_weights = false;
    return clamp01(num / den);
}

MatchResult score_pair(const Entity& anchor, const Entity& counterpart,
                       const WeightConfiguration& w, bool keep_breakdown) {
    MatchBreakdown b = compute_components(anchor, counterpart, w);

    MatchResult r;
    r.anchor_id = anchor.id;
    r.anchor_kind = anchor.kind;
    r.counterpart_id = counterpart.id;
    r.counterpart_kind = counterpart.kind;
    r.score = combine(b);
    r.weights_version = w.version;
    r.tie_break_key = counterpart.id;
    if (keep_breakdown) r.breakdown = std::move(b);
    return r;
}

void sort_results(std::vector<MatchResult>& results, double tie_epsilon) {
    // epsilon buckets, not pairwise |a-b| <= eps: the comparator must stay a strict weak ordering
    const bool bucketed = tie_epsilon >= kMinTieEpsilon;
    auto bucket = [tie_epsilon](double s) -> long long {
        return std::llround(s / tie_epsilon);
    };

    std::sort(results.begin(), results.end(),
              [&](const MatchResult& a, const MatchResult& b) {
                  if (bucketed) {
                      const long long ka = bucket(a.score);
                      const long long kb = bucket(b.score);
                      if (ka != kb) return ka > kb;
                  } else if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.tie_break_key < b.tie_break_key;
              });
}

}  // namespace talentmatch
