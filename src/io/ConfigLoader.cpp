#include "io/ConfigLoader.hpp"

#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <stdexcept>

#include "io/JsonIO.hpp"
#include "talentmatch/Errors.hpp"

namespace talentmatch {

using json = nlohmann::json;

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

static void require_known_keys(const json& j, const std::string& where,
                               std::initializer_list<const char*> known) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool ok = false;
        for (const char* k : known) {
            if (it.key() == k) ok = true;
        }
        if (!ok) throw ConfigError(where + " has unknown field: " + it.key());
    }
}

static double get_number(const json& j, const char* key, const std::string& where, double def, double min_value) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_number()) throw ConfigError(where + "." + key + " must be a number");
    const double v = j.at(key).get<double>();
    if (v < min_value) throw ConfigError(where + "." + key + " must be >= " + std::to_string(min_value));
    return v;
}

static long long get_integer(const json& j, const char* key, const std::string& where, long long def, long long min_value) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_number_integer()) throw ConfigError(where + "." + key + " must be an integer");
    const long long v = j.at(key).get<long long>();
    if (v < min_value) throw ConfigError(where + "." + key + " must be >= " + std::to_string(min_value));
    return v;
}

AppConfig parse_config(const json& j) {
    AppConfig cfg;

    if (!j.is_object()) throw ConfigError("root must be an object");
    require_known_keys(j, "root", {"weights", "cache", "ranking"});

    if (j.contains("weights")) {
        try {
            cfg.weights = apply_update(cfg.weights, parse_weight_update(j.at("weights"), "root.weights"));
        } catch (const ConfigError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw ConfigError(e.what());
        }
    }

    if (j.contains("cache")) {
        const json& c = j.at("cache");
        if (!c.is_object()) throw ConfigError("root.cache must be an object");
        require_known_keys(c, "root.cache", {"capacity", "ttl_seconds"});

        cfg.engine.cache.capacity = static_cast<size_t>(
            get_integer(c, "capacity", "root.cache", static_cast<long long>(cfg.engine.cache.capacity), 0));
        if (c.contains("ttl_seconds")) {
            const double ttl = get_number(c, "ttl_seconds", "root.cache", 0.0, 0.0);
            cfg.engine.cache.ttl = std::chrono::milliseconds(static_cast<long long>(ttl * 1000.0));
        }
    }

    if (j.contains("ranking")) {
        const json& r = j.at("ranking");
        if (!r.is_object()) throw ConfigError("root.ranking must be an object");
        require_known_keys(r, "root.ranking", {"tie_epsilon", "max_pool_size", "parallelism", "time_budget_ms"});

        RankLimits& l = cfg.engine.limits;
        l.tie_epsilon = get_number(r, "tie_epsilon", "root.ranking", l.tie_epsilon, 0.0);
        if (l.tie_epsilon != 0.0 && (l.tie_epsilon < kMinTieEpsilon || l.tie_epsilon > 1.0)) {
            throw ConfigError("root.ranking.tie_epsilon must be 0 or within [1e-12, 1]");
        }
        l.max_pool_size = static_cast<size_t>(
            get_integer(r, "max_pool_size", "root.ranking", static_cast<long long>(l.max_pool_size), 0));
        l.parallelism = static_cast<unsigned>(
            get_integer(r, "parallelism", "root.ranking", static_cast<long long>(l.parallelism), 1));
        l.time_budget = std::chrono::milliseconds(
            get_integer(r, "time_budget_ms", "root.ranking", l.time_budget.count(), 0));
    }

    return cfg;
}

static double env_double(const std::string& name, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + "=" + value + " is not a number");
    }
    if (used != value.size()) throw ConfigError(name + "=" + value + " is not a number");
    return v;
}

static long long env_integer(const std::string& name, const std::string& value, long long min_value) {
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + "=" + value + " is not an integer");
    }
    if (used != value.size()) throw ConfigError(name + "=" + value + " is not an integer");
    if (v < min_value) throw ConfigError(name + " must be >= " + std::to_string(min_value));
    return v;
}

void apply_env_overrides(AppConfig& cfg, const EnvLookup& env) {
    struct WeightVar {
        const char* name;
        double WeightConfiguration::*field;
    };
    static const WeightVar vars[] = {
        {"WEIGHT_SKILLS", &WeightConfiguration::skill},
        {"WEIGHT_TITLE_SIM", &WeightConfiguration::title},
        {"WEIGHT_SEMANTIC", &WeightConfiguration::semantic},
        {"WEIGHT_EMBEDDING", &WeightConfiguration::embedding},
        {"WEIGHT_DISTANCE", &WeightConfiguration::distance},
        {"MUST_CATEGORY_WEIGHT", &WeightConfiguration::must},
        {"NEEDED_CATEGORY_WEIGHT", &WeightConfiguration::needed},
    };

    for (const auto& v : vars) {
        if (auto s = env(v.name)) cfg.weights.*v.field = env_double(v.name, *s);
    }

    if (auto s = env("MIN_SKILL_FLOOR")) {
        const long long v = env_integer("MIN_SKILL_FLOOR", *s, 0);
        if (v > std::numeric_limits<int>::max()) throw ConfigError("MIN_SKILL_FLOOR=" + *s + " is out of range");
        cfg.weights.min_skill_floor = static_cast<int>(v);
    }

    if (auto s = env("MATCH_CACHE_CAPACITY")) {
        cfg.engine.cache.capacity = static_cast<size_t>(env_integer("MATCH_CACHE_CAPACITY", *s, 0));
    }

    if (auto s = env("MATCH_CACHE_TTL")) {
        const double secs = env_double("MATCH_CACHE_TTL", *s);
        if (secs < 0.0) throw ConfigError("MATCH_CACHE_TTL must be >= 0");
        cfg.engine.cache.ttl = std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
    }
}

AppConfig load_config(const std::string& path, const EnvLookup& env) {
    AppConfig cfg;

    if (!path.empty()) {
        json j;
        try {
            j = read_json_file(path);
        } catch (const std::runtime_error& e) {
            throw ConfigError(e.what());
        }
        cfg = parse_config(j);
    }

    apply_env_overrides(cfg, env);
    return cfg;
}

json config_to_json(const AppConfig& cfg) {
    const auto& c = cfg.engine.cache;
    const auto& l = cfg.engine.limits;

    return {
        {"weights", weights_to_json(cfg.weights)},
        {"cache", {
            {"capacity", c.capacity},
            {"ttl_seconds", static_cast<double>(c.ttl.count()) / 1000.0}
        }},
        {"ranking", {
            {"tie_epsilon", l.tie_epsilon},
            {"max_pool_size", l.max_pool_size},
            {"parallelism", l.parallelism},
            {"time_budget_ms", l.time_budget.count()}
        }}
    };
}

}  // namespace talentmatch
