#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace ormaudit {

// ============================================================================
// ConfigLoader - Extract typed config from ormaudit.toml
// ============================================================================

/**
 * @brief Loads AnalyzerConfig from TOML
 *
 * `${VAR}` references in string values are expanded from the environment.
 * Unknown keys are ignored; a known key of the wrong type fails the load.
 * TOML library exceptions never escape: every failure is a LoadResult error.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AnalyzerConfig config;

        static LoadResult ok(AnalyzerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }

        /**
         * @brief Same outcome as a Result; failures are CONFIG_ERROR
         */
        [[nodiscard]] Result<AnalyzerConfig> to_result() const {
            if (success) return Result<AnalyzerConfig>::ok(config);
            return Result<AnalyzerConfig>::error(ErrorCategory::CONFIG_ERROR, error_message);
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to ormaudit.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AnalyzerConfig& config);

private:
    static AnalyzerConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AnalyzerConfig config);

    static ProjectConfig extract_project(const toml::table& root);
    static SchemaConfig extract_schema(const toml::table& root);
    static AnalysisConfig extract_analysis(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
};

} // namespace ormaudit
