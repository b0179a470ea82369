#include "messages.hpp"

namespace shared::proto {

std::string Query::to_sql() const {
    std::string sql = "SELECT * FROM ";
    sql += entity_type_name(type);
    if (chunk) {
        sql += " WHERE chunk_index = ";
        sql += std::to_string(*chunk);
    }
    return sql;
}

bool Query::matches(const AnyRow& row) const {
    if (row_entity_type(row) != type) return false;
    if (!chunk) return true;

    const auto rowChunk = row_chunk(row);
    return rowChunk && *rowChunk == *chunk;
}

ServiceMessage make_row_message(RowOp op, const AnyRow& row, const AnyRow* previous) {
    return std::visit([&](const auto& r) -> ServiceMessage {
        using Row = std::decay_t<decltype(r)>;
        RowEvent<Row> ev;
        ev.op = op;
        ev.row = r;
        if (previous) {
            if (const auto* prev = std::get_if<Row>(previous)) {
                ev.previous = *prev;
            }
        }
        return ev;
    }, row);
}

} // namespace shared::proto
