#include "commands/rank.hpp"

#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"
#include "talentmatch/EntityStore.hpp"
#include "talentmatch/MatchEngine.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace talentmatch;

int cmd_rank(int argc, char** argv) {
    try {
        const std::string entities_path = require_arg(argc, argv, "--entities");
        const std::string tenant = require_arg(argc, argv, "--tenant");
        const std::string anchor_id = require_arg(argc, argv, "--anchor");

        RankQuery q;
        const int topk = get_arg_int(argc, argv, "--topk", static_cast<int>(q.top_k));
        if (topk < 0) throw std::runtime_error("--topk must be >= 0");
        q.top_k = static_cast<size_t>(topk);
        q.city_filter = !has_flag(argc, argv, "--no_city_filter");
        q.drop_zero_scores = !has_flag(argc, argv, "--keep_zero");
        q.include_breakdown = has_flag(argc, argv, "--explain");
        if (has_flag(argc, argv, "--max_km")) {
            q.max_distance_km = get_arg_double(argc, argv, "--max_km", 0.0);
        }

        const AppConfig cfg = config_from_args(argc, argv);
        MatchEngine engine(cfg.weights, cfg.engine);

        const InMemoryEntityStore store(load_entities(entities_path));
        std::cerr << "loaded " << store.size() << " entities from " << entities_path << "\n";

        const std::vector<MatchResult> results = engine.rank_by_id(store, tenant, anchor_id, q);

        nlohmann::json out;
        out["tenant_id"] = tenant;
        out["anchor_id"] = anchor_id;
        out["weights_version"] = engine.weights()->version;
        out["count"] = results.size();
        out["results"] = results_to_json(results);

        emit_json(argc, argv, out);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "rank failed: " << e.what() << "\n";
        return 1;
    }
}
