#include "commands/explain.hpp"

#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"
#include "talentmatch/EntityStore.hpp"
#include "talentmatch/Explainer.hpp"
#include "talentmatch/MatchEngine.hpp"

#include <iostream>
#include <string>

using namespace talentmatch;

int cmd_explain(int argc, char** argv) {
    try {
        const std::string entities_path = require_arg(argc, argv, "--entities");
        const std::string tenant = require_arg(argc, argv, "--tenant");
        const std::string anchor_id = require_arg(argc, argv, "--anchor");
        const std::string counterpart_id = require_arg(argc, argv, "--counterpart");

        const AppConfig cfg = config_from_args(argc, argv);
        MatchEngine engine(cfg.weights, cfg.engine);

        const InMemoryEntityStore store(load_entities(entities_path));

        const MatchResult r = engine.explain_by_id(store, tenant, anchor_id, counterpart_id);

        Explanation ex = explain_match(r);
        ex.weights = *engine.weights();

        emit_json(argc, argv, ex.to_json());
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "explain failed: " << e.what() << "\n";
        return 1;
    }
}
