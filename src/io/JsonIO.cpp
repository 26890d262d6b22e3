#include "io/JsonIO.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "talentmatch/Errors.hpp"
#include "talentmatch/Explainer.hpp"
#include "text/TextUtil.hpp"

namespace talentmatch {

using json = nlohmann::json;

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where;
    if (key) oss << "." << key;
    oss << "[" << i << "]";
    return oss.str();
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// absent or null -> def
static std::string optional_string(const json& j, const char* key, const std::string& where,
                                   const std::string& def = "") {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static double require_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static EntityKind parse_kind(const std::string& s, const std::string& where) {
    if (s == "candidate") return EntityKind::Candidate;
    if (s == "job") return EntityKind::Job;
    throw std::runtime_error(where + " must be one of: candidate, job");
}

static SkillCategory parse_category(const std::string& s, const std::string& where) {
    const std::string k = textutil::canonical_key(s);
    if (k == "must") return SkillCategory::Must;
    if (k == "needed") return SkillCategory::Needed;
    throw std::runtime_error(where + " must be one of: must, needed");
}

static SkillProvenance parse_provenance(const std::string& s, const std::string& where) {
    const std::string k = textutil::canonical_key(s);
    if (k == "extracted") return SkillProvenance::Extracted;
    if (k == "synthetic") return SkillProvenance::Synthetic;
    throw std::runtime_error(where + " must be one of: extracted, synthetic");
}

static SkillRef parse_skill_ref(const json& j, const std::string& where) {
    require_object(j, where);

    SkillRef s;
    s.name = textutil::canonical_key(require_string(j, "name", where));
    if (s.name.empty()) {
        throw std::runtime_error(where + ".name must not be empty");
    }
    s.category = parse_category(optional_string(j, "category", where, "needed"), where + ".category");
    s.provenance = parse_provenance(optional_string(j, "provenance", where, "extracted"), where + ".provenance");
    return s;
}

static std::optional<GeoPoint> parse_location(const json& j, const std::string& where) {
    if (!j.contains("location") || j.at("location").is_null()) return std::nullopt;

    const json& loc = j.at("location");
    const std::string lw = where + ".location";
    require_object(loc, lw);

    GeoPoint p;
    p.lat = require_number(loc, "lat", lw);
    p.lon = require_number(loc, "lon", lw);
    return p;
}

static std::optional<std::vector<float>> parse_embedding(const json& j, const std::string& where) {
    if (!j.contains("embedding") || j.at("embedding").is_null()) return std::nullopt;

    const json& arr = j.at("embedding");
    require_array(arr, where + ".embedding");

    std::vector<float> v;
    v.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_number()) {
            throw std::runtime_error(index_path(where, "embedding", i) + " must be a number");
        }
        v.push_back(arr.at(i).get<float>());
    }
    return v;
}

Entity parse_entity(const json& j, const std::string& where) {
    require_object(j, where);

    Entity e;
    e.id = require_string(j, "id", where);
    e.tenant_id = require_string(j, "tenant_id", where);
    e.kind = parse_kind(require_string(j, "kind", where), where + ".kind");

    e.title = optional_string(j, "title", where);
    e.city = textutil::canonical_key(optional_string(j, "city", where));
    e.location = parse_location(j, where);
    e.embedding = parse_embedding(j, where);
    e.text_blob = optional_string(j, "text_blob", where);

    if (j.contains("updated_at") && !j.at("updated_at").is_null()) {
        if (!j.at("updated_at").is_number_integer()) {
            throw std::runtime_error(where + ".updated_at must be an integer");
        }
        e.updated_at = j.at("updated_at").get<std::int64_t>();
    }

    std::vector<SkillRef> skills;
    if (j.contains("skills_detailed") && !j.at("skills_detailed").is_null()) {
        const json& arr = j.at("skills_detailed");
        require_array(arr, where + ".skills_detailed");
        for (size_t i = 0; i < arr.size(); ++i) {
            skills.push_back(parse_skill_ref(arr.at(i), index_path(where, "skills_detailed", i)));
        }
        e.skills_categorized = true;
    } else if (j.contains("skill_set") && !j.at("skill_set").is_null()) {
        const json& arr = j.at("skill_set");
        require_array(arr, where + ".skill_set");
        for (size_t i = 0; i < arr.size(); ++i) {
            if (!arr.at(i).is_string()) {
                throw std::runtime_error(index_path(where, "skill_set", i) + " must be a string");
            }
            SkillRef s;
            s.name = textutil::canonical_key(arr.at(i).get<std::string>());
            if (!s.name.empty()) skills.push_back(std::move(s));
        }
        e.skills_categorized = false;
    }
    e.skills = dedupe_skills(skills);

    return e;
}

std::vector<Entity> parse_entities(const json& j, const std::string& where) {
    const json* arr = &j;
    std::string base = where;

    if (j.is_object()) {
        if (!j.contains("entities")) {
            throw std::runtime_error(where + " missing required field: entities");
        }
        arr = &j.at("entities");
        base = where + ".entities";
    }
    require_array(*arr, base);

    std::vector<Entity> out;
    out.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        out.push_back(parse_entity(arr->at(i), index_path(base, nullptr, i)));
    }
    return out;
}

json read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON " + path.string() + ": " + e.what());
    }
    return j;
}

void write_json_file(const std::filesystem::path& path, const json& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());

    out << j.dump(2) << "\n";
}

std::vector<Entity> load_entities(const std::filesystem::path& path) {
    return parse_entities(read_json_file(path), "root");
}

double round_decimals(double x, int decimals) {
    const double f = std::pow(10.0, decimals);
    return std::round(x * f) / f;
}

json weights_to_json(const WeightConfiguration& w) {
    return {
        {"skill", w.skill},
        {"title", w.title},
        {"semantic", w.semantic},
        {"embedding", w.embedding},
        {"distance", w.distance},
        {"must", w.must},
        {"needed", w.needed},
        {"min_skill_floor", w.min_skill_floor},
        {"version", w.version}
    };
}

WeightUpdate parse_weight_update(const json& j, const std::string& where) {
    require_object(j, where);

    WeightUpdate u;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();
        const std::string field = where + "." + key;

        if (key == "version") continue;  // assigned by the store

        if (key == "min_skill_floor") {
            if (!v.is_number_integer()) throw std::runtime_error(field + " must be an integer");
            if (v.is_number_unsigned()) {
                if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                    throw ValidationError({ValidationIssue{"out_of_range", "min_skill_floor",
                                                           "must be <= " + std::to_string(std::numeric_limits<int>::max())}});
                }
                u.min_skill_floor = static_cast<int>(v.get<std::uint64_t>());
                continue;
            }
            const long long floor_value = v.get<long long>();
            if (floor_value < 0) {
                throw ValidationError({ValidationIssue{"negative", "min_skill_floor",
                                                       "must be >= 0, got " + std::to_string(floor_value)}});
            }
            if (floor_value > std::numeric_limits<int>::max()) {
                throw ValidationError({ValidationIssue{"out_of_range", "min_skill_floor",
                                                       "must be <= " + std::to_string(std::numeric_limits<int>::max())}});
            }
            u.min_skill_floor = static_cast<int>(floor_value);
            continue;
        }

        if (!v.is_number()) throw std::runtime_error(field + " must be a number");
        const double d = v.get<double>();

        if (key == "skill") u.skill = d;
        else if (key == "title") u.title = d;
        else if (key == "semantic") u.semantic = d;
        else if (key == "embedding") u.embedding = d;
        else if (key == "distance") u.distance = d;
        else if (key == "must") u.must = d;
        else if (key == "needed") u.needed = d;
        else throw std::runtime_error(where + " has unknown field: " + key);
    }
    return u;
}

json result_to_json(const MatchResult& r) {
    json j;
    j["anchor_id"] = r.anchor_id;
    j["anchor_kind"] = kind_str(r.anchor_kind);
    j["counterpart_id"] = r.counterpart_id;
    j["counterpart_kind"] = kind_str(r.counterpart_kind);
    j["score"] = round_decimals(r.score, 4);
    j["weights_version"] = r.weights_version;
    if (r.breakdown) j["explanation"] = explain_match(r).to_json();
    return j;
}

json results_to_json(const std::vector<MatchResult>& results) {
    json arr = json::array();
    for (const auto& r : results) arr.push_back(result_to_json(r));
    return arr;
}

}  // namespace talentmatch
