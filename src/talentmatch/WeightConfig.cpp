#include "talentmatch/WeightConfig.hpp"

#include <cmath>
#include <sstream>

namespace talentmatch {

static constexpr double kSumTolerance = 0.05;

bool WeightUpdate::empty() const {
    return !skill && !title && !semantic && !embedding && !distance &&
           !must && !needed && !min_skill_floor;
}

static void check_unit(std::vector<ValidationIssue>& out, const char* field, double v) {
    if (!std::isfinite(v)) {
        out.push_back(ValidationIssue{"not_finite", field, "must be a finite number"});
        return;
    }
    if (v < 0.0 || v > 1.0) {
        std::ostringstream oss;
        oss << "must be in [0,1], got " << v;
        out.push_back(ValidationIssue{"out_of_range", field, oss.str()});
    }
}

std::vector<ValidationIssue> validate_weights(const WeightConfiguration& w) {
    std::vector<ValidationIssue> issues;
    check_unit(issues, "skill_weight", w.skill);
    check_unit(issues, "title_weight", w.title);
    check_unit(issues, "semantic_weight", w.semantic);
    check_unit(issues, "embedding_weight", w.embedding);
    check_unit(issues, "distance_weight", w.distance);
    check_unit(issues, "must_category_weight", w.must);
    check_unit(issues, "needed_category_weight", w.needed);

    if (w.min_skill_floor < 0) {
        issues.push_back(ValidationIssue{"negative", "min_skill_floor",
                                         "must be >= 0, got " + std::to_string(w.min_skill_floor)});
    }
    return issues;
}

std::vector<std::string> weight_warnings(const WeightConfiguration& w) {
    std::vector<std::string> out;

    const double top = w.skill + w.title + w.semantic + w.embedding + w.distance;
    if (std::fabs(top - 1.0) > kSumTolerance) {
        std::ostringstream oss;
        oss << "component weights sum to " << top << " (expected close to 1.0)";
        out.push_back(oss.str());
    }

    const double cat = w.must + w.needed;
    if (std::fabs(cat - 1.0) > kSumTolerance) {
        std::ostringstream oss;
        oss << "category weights sum to " << cat << " (recommended 1.0)";
        out.push_back(oss.str());
    }
    return out;
}

WeightConfiguration apply_update(const WeightConfiguration& base, const WeightUpdate& u) {
    WeightConfiguration w = base;
    if (u.skill) w.skill = *u.skill;
    if (u.title) w.title = *u.title;
    if (u.semantic) w.semantic = *u.semantic;
    if (u.embedding) w.embedding = *u.embedding;
    if (u.distance) w.distance = *u.distance;
    if (u.must) w.must = *u.must;
    if (u.needed) w.needed = *u.needed;
    if (u.min_skill_floor) w.min_skill_floor = *u.min_skill_floor;
    return w;
}

}  // namespace talentmatch
