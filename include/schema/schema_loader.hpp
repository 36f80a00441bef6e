#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "parser/source_file.hpp"
#include "schema/schema_model.hpp"

#include <optional>
#include <string>

namespace ormaudit {

/**
 * @brief Builds a SchemaModel from a schema declaration file
 *
 * Recognized declarations (function names configurable):
 *
 *   export const status = pgEnum('status', ['active', 'pending']);
 *   export const users = pgTable('users', {
 *       id: serial('id').primaryKey(),
 *       email: text('email').notNull(),
 *       status: status('status').notNull().default('active'),
 *   });
 *
 * A declaration that does not have this shape is skipped; only a missing
 * or unreadable file is an error.
 */
class SchemaLoader {
public:
    /**
     * @brief Load and parse a schema file
     * @return SCHEMA_ERROR if the file does not exist, IO_ERROR if it cannot be read
     */
    [[nodiscard]] static Result<SchemaModel> load_schema(
        const std::string& path, const SchemaConfig& config = {});

    /**
     * @brief Extract tables and enums from an already parsed file
     */
    [[nodiscard]] static SchemaModel parse_schema(
        const SourceFile& file, const SchemaConfig& config = {});

    /**
     * @brief Locate the schema file of a project
     *
     * Checks the usual locations first, then the `schema` property of
     * drizzle.config.ts / drizzle.config.js.
     */
    [[nodiscard]] static std::optional<std::string> discover_schema_path(const std::string& root);
};

} // namespace ormaudit
