#include "commands/config.hpp"

#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"
#include "talentmatch/Errors.hpp"
#include "talentmatch/MatchEngine.hpp"

#include <iostream>
#include <string>

using namespace talentmatch;

// Prints the effective configuration. With --update <file>, applies a partial
// weight update on top and prints the result (or every validation issue).
int cmd_config(int argc, char** argv) {
    try {
        AppConfig cfg = config_from_args(argc, argv);
        MatchEngine engine(cfg.weights, cfg.engine);

        const std::string update_path = get_arg(argc, argv, "--update", "");
        if (!update_path.empty()) {
            const WeightUpdate u = parse_weight_update(read_json_file(update_path), "root");
            engine.update_weights(u);
        }

        cfg.weights = *engine.weights();
        emit_json(argc, argv, config_to_json(cfg));
        return 0;
    } catch (const ValidationError& e) {
        std::cerr << "config rejected:\n";
        for (const auto& issue : e.issues()) {
            std::cerr << "  [" << issue.code << "] " << issue.field << ": " << issue.message << "\n";
        }
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "config failed: " << e.what() << "\n";
        return 1;
    }
}
