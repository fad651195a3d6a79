#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace carboncalc {

std::string expand_environment_variables(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    size_t pos = 0;

    while (pos < value.size()) {
        if (value[pos] != '$') {
            result += value[pos++];
            continue;
        }

        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < value.size() && value[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < value.size() &&
               (std::isalnum(static_cast<unsigned char>(value[pos])) || value[pos] == '_')) {
            pos++;
        }
        std::string var_name = value.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= value.size() || value[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++; // Skip '}'
        }

        // A lone '$' is kept literally
        if (var_name.empty() && !braces) {
            result += value.substr(start, pos - start);
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        if (env_value) {
            result += env_value;
        }
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    // Resolve relative to config directory
    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

namespace {

void reject_unknown_keys(const json& object, const std::set<std::string>& allowed,
                         const std::string& where) {
    if (!object.is_object()) {
        throw ConfigParseError("'" + where + "' must be a JSON object");
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            throw ConfigParseError("Unknown key in " + where + ": " + it.key());
        }
    }
}

std::string get_path(const json& object, const std::string& key) {
    return expand_environment_variables(object.at(key).get<std::string>());
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);
        reject_unknown_keys(j, {"inputs", "output", "logging", "strict"}, "run config");

        if (j.contains("inputs")) {
            config.inputs_path = get_path(j, "inputs");
        }

        // Parse output (optional)
        if (j.contains("output")) {
            const json& output = j["output"];
            reject_unknown_keys(output, {"json", "csv_dir", "parquet_dir", "pretty_print"}, "output");
            if (output.contains("json")) {
                config.output.json_path = get_path(output, "json");
            }
            if (output.contains("csv_dir")) {
                config.output.csv_dir = get_path(output, "csv_dir");
            }
            if (output.contains("parquet_dir")) {
                config.output.parquet_dir = get_path(output, "parquet_dir");
            }
            if (output.contains("pretty_print")) {
                config.output.pretty_print = output["pretty_print"].get<bool>();
            }
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            const json& logging = j["logging"];
            reject_unknown_keys(logging, {"level", "json", "file"}, "logging");
            if (logging.contains("level")) {
                try {
                    config.logging.min_level = string_to_level(logging["level"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(e.what());
                }
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.log_file_path = get_path(logging, "file");
                config.logging.enable_file = !config.logging.log_file_path.empty();
            }
        }

        if (j.contains("strict")) {
            config.strict = j["strict"].get<bool>();
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    config.inputs_path = resolve_relative_path(config.inputs_path, file_path);
    config.output.json_path = resolve_relative_path(config.output.json_path, file_path);
    config.output.csv_dir = resolve_relative_path(config.output.csv_dir, file_path);
    config.output.parquet_dir = resolve_relative_path(config.output.parquet_dir, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace carboncalc
