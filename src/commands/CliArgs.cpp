#include "commands/CliArgs.hpp"

#include <iostream>
#include <stdexcept>

#include "io/JsonIO.hpp"

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got: " + s);
    }
    if (used != s.size()) throw std::runtime_error(key + " expects an integer, got: " + s);
    return v;
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects a number, got: " + s);
    }
    if (used != s.size()) throw std::runtime_error(key + " expects a number, got: " + s);
    return v;
}

std::string require_arg(int argc, char** argv, const std::string& key) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) throw std::runtime_error("missing required argument: " + key);
    return v;
}

talentmatch::AppConfig config_from_args(int argc, char** argv) {
    talentmatch::AppConfig cfg = talentmatch::load_config(get_arg(argc, argv, "--config", ""));

    auto& l = cfg.engine.limits;
    const int parallelism = get_arg_int(argc, argv, "--parallelism", static_cast<int>(l.parallelism));
    if (parallelism < 1) throw std::runtime_error("--parallelism must be >= 1");
    l.parallelism = static_cast<unsigned>(parallelism);

    const int budget = get_arg_int(argc, argv, "--time_budget_ms", static_cast<int>(l.time_budget.count()));
    if (budget < 0) throw std::runtime_error("--time_budget_ms must be >= 0");
    l.time_budget = std::chrono::milliseconds(budget);

    const int max_pool = get_arg_int(argc, argv, "--max_pool", static_cast<int>(l.max_pool_size));
    if (max_pool < 0) throw std::runtime_error("--max_pool must be >= 0");
    l.max_pool_size = static_cast<size_t>(max_pool);

    return cfg;
}

void emit_json(int argc, char** argv, const nlohmann::json& j) {
    const std::string out = get_arg(argc, argv, "--out", "");
    if (out.empty()) {
        std::cout << j.dump(2) << "\n";
        return;
    }
    talentmatch::write_json_file(out, j);
    std::cerr << "wrote " << out << "\n";
}
