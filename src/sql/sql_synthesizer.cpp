#include "sql/sql_synthesizer.hpp"
#include "core/utils.hpp"

#include <format>

namespace ormaudit {

namespace {

/**
 * @brief Per-statement rendering state: main table and parameter counter
 */
class StatementWriter {
public:
    StatementWriter(const ChainInfo& chain, const SchemaModel& schema)
        : schema_(schema), table_(schema.find_table(chain.table_name)) {}

    [[nodiscard]] std::string column(const std::string& name) const {
        if (table_) {
            if (const auto* col = table_->find_column(name)) return col->sql_name;
        }
        return name;
    }

    [[nodiscard]] std::string qualified(const std::string& table_name, const std::string& column_name) const {
        const auto* t = schema_.find_table(table_name);
        const std::string tname = t ? t->sql_name : table_name;
        const Column* col = t ? t->find_column(column_name) : nullptr;
        return std::format("{}.{}", tname, col ? col->sql_name : column_name);
    }

    std::string value(const ValueInfo& v, const std::string& column_name) {
        if (v.kind == ValueKind::LITERAL) {
            const std::string text = v.value.value_or("");
            switch (v.data_type) {
                case ScalarType::STRING: return std::format("'{}'", utils::escape_sql_string(text));
                case ScalarType::NULL_VALUE: return "NULL";
                default: return text;
            }
        }

        QueryParameter param;
        param.position = next_position_++;
        param.source = v.source.value_or("unknown");
        if (table_) {
            if (const auto* col = table_->find_column(column_name)) {
                param.column_type = column_type_to_string(col->type);
            }
        }
        parameters_.push_back(std::move(param));
        return std::format("${}", parameters_.back().position);
    }

    std::string where_clause(const std::vector<WhereCondition>& conditions) {
        if (conditions.empty()) return {};
        std::string out = " WHERE ";
        for (size_t i = 0; i < conditions.size(); ++i) {
            const auto& c = conditions[i];
            if (i > 0) out += " AND ";
            out += column(c.column);
            out += ' ';
            out += c.op;
            if (c.op != "IS NULL" && c.op != "IS NOT NULL") {
                out += ' ';
                out += value(c.value, c.column);
            }
        }
        return out;
    }

    [[nodiscard]] std::vector<QueryParameter> take_parameters() { return std::move(parameters_); }

private:
    const SchemaModel& schema_;
    const Table* table_;
    std::vector<QueryParameter> parameters_;
    int next_position_ = 1;
};

} // anonymous namespace

std::optional<GeneratedSql> SqlSynthesizer::generate(const ChainInfo& chain, const SchemaModel& schema) {
    StatementWriter w(chain, schema);
    const std::string table = schema.table_sql_name(chain.table_name);

    GeneratedSql out;
    out.type = chain.operation;
    out.tables.push_back(table);

    switch (chain.operation) {
        case StatementType::SELECT: {
            std::string sql = "SELECT ";
            if (chain.select_columns && !chain.select_columns->empty()) {
                for (size_t i = 0; i < chain.select_columns->size(); ++i) {
                    if (i > 0) sql += ", ";
                    sql += w.column((*chain.select_columns)[i]);
                }
            } else {
                sql += '*';
            }
            sql += std::format(" FROM {}", table);

            for (const auto& join : chain.joins) {
                const std::string join_table = schema.table_sql_name(join.table);
                out.tables.push_back(join_table);

                std::string on;
                for (size_t i = 0; i < join.on_conditions.size(); ++i) {
                    const auto& c = join.on_conditions[i];
                    if (i > 0) on += " AND ";
                    on += std::format("{} {} {}", w.qualified(c.left_table, c.left_column), c.op,
                                      w.qualified(c.right_table, c.right_column));
                }
                sql += std::format(" {} JOIN {} ON {}", join_kind_to_string(join.kind), join_table, on);
            }

            sql += w.where_clause(chain.where_conditions);

            if (!chain.group_by.empty()) {
                sql += " GROUP BY ";
                for (size_t i = 0; i < chain.group_by.size(); ++i) {
                    if (i > 0) sql += ", ";
                    sql += w.qualified(chain.group_by[i].table, chain.group_by[i].column);
                }
            }

            if (!chain.order_by.empty()) {
                sql += " ORDER BY ";
                for (size_t i = 0; i < chain.order_by.size(); ++i) {
                    const auto& o = chain.order_by[i];
                    if (i > 0) sql += ", ";
                    // Keys on a joined table are qualified; primary table keys are not
                    const bool joined = !o.column.table.empty() && o.column.table != chain.table_name;
                    sql += std::format("{} {}",
                                       joined ? w.qualified(o.column.table, o.column.column)
                                              : w.column(o.column.column),
                                       o.direction == SortDirection::DESC ? "DESC" : "ASC");
                }
            }

            if (chain.limit) sql += std::format(" LIMIT {}", utils::format_number(*chain.limit));
            if (chain.offset) sql += std::format(" OFFSET {}", utils::format_number(*chain.offset));

            out.sql = std::move(sql);
            break;
        }

        case StatementType::INSERT: {
            if (!chain.insert_values || chain.insert_values->empty()) return std::nullopt;

            std::string columns;
            std::string values;
            for (size_t i = 0; i < chain.insert_values->size(); ++i) {
                const auto& cv = (*chain.insert_values)[i];
                if (i > 0) {
                    columns += ", ";
                    values += ", ";
                }
                columns += w.column(cv.column);
                values += w.value(cv.value, cv.column);
            }
            out.sql = std::format("INSERT INTO {} ({}) VALUES ({})", table, columns, values);
            break;
        }

        case StatementType::UPDATE: {
            if (!chain.set_values || chain.set_values->empty()) return std::nullopt;

            std::string assignments;
            for (size_t i = 0; i < chain.set_values->size(); ++i) {
                const auto& cv = (*chain.set_values)[i];
                if (i > 0) assignments += ", ";
                assignments += std::format("{} = {}", w.column(cv.column), w.value(cv.value, cv.column));
            }
            out.sql = std::format("UPDATE {} SET {}", table, assignments);
            out.sql += w.where_clause(chain.where_conditions);
            break;
        }

        case StatementType::DELETE: {
            out.sql = std::format("DELETE FROM {}", table);
            out.sql += w.where_clause(chain.where_conditions);
            break;
        }
    }

    out.parameters = w.take_parameters();
    return out;
}

} // namespace ormaudit
