#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace talentmatch {

enum class EntityKind {
    Candidate,
    Job
};

enum class SkillCategory {
    Must,
    Needed
};

enum class SkillProvenance {
    Extracted,
    Synthetic
};

struct SkillRef {
    std::string name;  // canonical, unique within one entity
    SkillCategory category = SkillCategory::Needed;
    SkillProvenance provenance = SkillProvenance::Extracted;
};

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

// Owned by the ingestion side; the scoring core only reads it.
struct Entity {
    std::string id;
    std::string tenant_id;
    EntityKind kind = EntityKind::Candidate;

    std::string title;
    std::string city;                  // canonical city, empty when unknown
    std::optional<GeoPoint> location;

    std::vector<SkillRef> skills;
    bool skills_categorized = true;    // false for legacy flat skill lists

    std::optional<std::vector<float>> embedding;
    std::string text_blob;             // free text for the semantic component

    std::int64_t updated_at = 0;       // unix seconds
};

const char* kind_str(EntityKind k);
const char* category_str(SkillCategory c);
const char* provenance_str(SkillProvenance p);

EntityKind opposite(EntityKind k);

// Collapses duplicate skill names; "must" wins over "needed" for the same name.
std::vector<SkillRef> dedupe_skills(const std::vector<SkillRef>& skills);

}  // namespace talentmatch
