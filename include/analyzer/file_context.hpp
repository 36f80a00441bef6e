#pragma once

#include "config/config_types.hpp"
#include "parser/source_file.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace ormaudit {

/**
 * @brief Per-file names the chain analyzer needs
 *
 * handles:        identifiers that refer to the database object
 *                 (configured names, `import { db as database }`, and the
 *                 parameter of a `db.transaction(async (tx) => ...)` callback)
 * import_aliases: local name -> exported name for renamed imports
 *                 (`import { users as usersTable }` -> usersTable -> users)
 */
struct FileContext {
    std::unordered_set<std::string> handles;
    std::unordered_map<std::string, std::string> import_aliases;

    [[nodiscard]] static FileContext build(const SourceFile& file, const AnalysisConfig& config);

    [[nodiscard]] bool is_handle(const std::string& name) const { return handles.contains(name); }
};

} // namespace ormaudit
