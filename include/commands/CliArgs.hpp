#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "io/ConfigLoader.hpp"

// `--key value` lookups over argv. Numeric getters throw std::runtime_error on junk.
bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// get_arg, but a missing or empty value is an error
std::string require_arg(int argc, char** argv, const std::string& key);

// --config file + environment, then --parallelism, --time_budget_ms, --max_pool
talentmatch::AppConfig config_from_args(int argc, char** argv);

// stdout, or the file named by --out
void emit_json(int argc, char** argv, const nlohmann::json& j);
