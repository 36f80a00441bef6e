#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace ormaudit {

// ============================================================================
// TOML Parsing Helpers (env expansion, typed access)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    if (!std::filesystem::exists(file_path)) {
        throw std::runtime_error(std::format("Config file not found: {}", file_path));
    }
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------
// Absent keys fall back to defaults; present keys of the wrong type throw.

[[noreturn]] void type_error(std::string_view section, std::string_view key, std::string_view expected) {
    throw std::runtime_error(std::format("{}.{} must be {}", section, key, expected));
}

std::string toml_string(const toml::table& tbl, std::string_view section, std::string_view key,
                        std::string fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* s = node.as_string()) return s->get();
    type_error(section, key, "a string");
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view section,
                                           std::string_view key, std::vector<std::string> fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;

    const auto* arr = node.as_array();
    if (!arr) type_error(section, key, "an array of strings");

    std::vector<std::string> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* s = elem.as_string();
        if (!s) type_error(section, key, "an array of strings");
        result.emplace_back(s->get());
    }
    return result;
}

std::optional<ScalarType> parse_coercion_target(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "number") return ScalarType::NUMBER;
    if (lower == "boolean") return ScalarType::BOOLEAN;
    if (lower == "string") return ScalarType::STRING;
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ProjectConfig ConfigLoader::extract_project(const toml::table& root) {
    ProjectConfig cfg;
    const auto* project = root["project"].as_table();
    if (!project) return cfg;
    const auto& p = *project;

    cfg.root = toml_string(p, "project", "root", cfg.root);
    cfg.files = toml_string_array(p, "project", "files", cfg.files);
    return cfg;
}

SchemaConfig ConfigLoader::extract_schema(const toml::table& root) {
    SchemaConfig cfg;
    const auto* schema = root["schema"].as_table();
    if (!schema) return cfg;
    const auto& s = *schema;

    if (s.contains("path")) {
        cfg.path = toml_string(s, "schema", "path", "");
    }
    cfg.table_functions = toml_string_array(s, "schema", "table_functions", cfg.table_functions);
    cfg.enum_functions = toml_string_array(s, "schema", "enum_functions", cfg.enum_functions);
    return cfg;
}

AnalysisConfig ConfigLoader::extract_analysis(const toml::table& root) {
    AnalysisConfig cfg;
    const auto* analysis = root["analysis"].as_table();
    if (!analysis) return cfg;
    const auto& a = *analysis;

    cfg.db_handles = toml_string_array(a, "analysis", "db_handles", cfg.db_handles);
    cfg.request_accessors = toml_string_array(a, "analysis", "request_accessors", cfg.request_accessors);
    cfg.body_accessors = toml_string_array(a, "analysis", "body_accessors", cfg.body_accessors);
    cfg.validation_methods = toml_string_array(a, "analysis", "validation_methods", cfg.validation_methods);
    cfg.route_dirs = toml_string_array(a, "analysis", "route_dirs", cfg.route_dirs);
    cfg.extensions = toml_string_array(a, "analysis", "extensions", cfg.extensions);

    if (const auto node = a["workers"]) {
        const auto* workers = node.as_integer();
        if (!workers) type_error("analysis", "workers", "an integer");
        // Negative counts are reported by validate_config()
        cfg.workers = workers->get() < 0 ? 0 : static_cast<size_t>(workers->get());
    }

    if (const auto node = a["coercions"]) {
        const auto* coercions = node.as_table();
        if (!coercions) type_error("analysis", "coercions", "a table");

        cfg.coercions.clear();
        for (const auto& [wrapper, target] : *coercions) {
            const auto* s = target.as_string();
            const auto type = s ? parse_coercion_target(s->get()) : std::nullopt;
            if (!type) {
                throw std::runtime_error(std::format(
                    "analysis.coercions.{} must be \"number\", \"boolean\" or \"string\"", wrapper.str()));
            }
            cfg.coercions.emplace(std::string(wrapper.str()), *type);
        }
    }
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;

    const std::string format = utils::to_lower(toml_string(*output, "output", "format", "text"));
    if (format == "text") {
        cfg.format = OutputFormat::TEXT;
    } else if (format == "json") {
        cfg.format = OutputFormat::JSON;
    } else {
        throw std::runtime_error(std::format("output.format must be \"text\" or \"json\", got \"{}\"", format));
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = toml_string(*logging, "logging", "level", "info"s);
    return cfg;
}

AnalyzerConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AnalyzerConfig config;
    config.project = extract_project(tbl);
    config.schema = extract_schema(tbl);
    config.analysis = extract_analysis(tbl);
    config.output = extract_output(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AnalyzerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AnalyzerConfig& config) {
    std::vector<std::string> errors;

    if (config.project.root.empty()) {
        errors.emplace_back("project.root must not be empty");
    }

    if (config.schema.path && config.schema.path->empty()) {
        errors.emplace_back("schema.path must not be empty when set");
    }
    if (config.schema.table_functions.empty()) {
        errors.emplace_back("schema.table_functions must name at least one function");
    }

    if (config.analysis.db_handles.empty()) {
        errors.emplace_back("analysis.db_handles must name at least one handle");
    }
    if (config.analysis.workers < 1) {
        errors.emplace_back("analysis.workers must be >= 1");
    }
    for (const auto& ext : config.analysis.extensions) {
        if (ext.empty() || ext.front() != '.') {
            errors.push_back(std::format("analysis.extensions entry \"{}\" must start with '.'", ext));
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got \"{}\"",
                                     config.logging.level));
    }

    return errors;
}

} // namespace ormaudit
