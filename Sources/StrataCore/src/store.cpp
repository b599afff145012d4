#include "strata/store.hpp"
#include "strata/log.hpp"
#include <map>
#include <sstream>
#include <stdexcept>

namespace strata {

namespace {

// Scalar class of one stored value. Filters only match values of the
// parameter's class. Null list elements and absent values are class 0; the
// marker row of an empty list is neither null nor a value.
enum class value_class : int64_t {
    null = 0,
    integer = 1,
    real = 2,
    boolean = 3,
    string = 4,
    text = 5,
    short_blob = 6,
    blob = 7,
    empty_list = 8
};

struct stored_value {
    value_class cls;
    column_value_t column;
};

stored_value store_scalar(const entity_value_t& v) {
    return std::visit([](const auto& x) -> stored_value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, int64_t>) {
            return {value_class::integer, x};
        } else if constexpr (std::is_same_v<T, double>) {
            return {value_class::real, x};
        } else if constexpr (std::is_same_v<T, bool>) {
            return {value_class::boolean, static_cast<int64_t>(x ? 1 : 0)};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return {value_class::string, x};
        } else if constexpr (std::is_same_v<T, text>) {
            return {value_class::text, x.value};
        } else if constexpr (std::is_same_v<T, short_blob>) {
            return {value_class::short_blob, x.bytes};
        } else if constexpr (std::is_same_v<T, blob>) {
            return {value_class::blob, x.bytes};
        } else {
            return {value_class::null, nullptr};
        }
    }, v);
}

template<typename S>
stored_value store_element(const std::optional<S>& element) {
    if (!element.has_value()) return {value_class::null, nullptr};
    return store_scalar(to_value(*element));
}

// Flattens a value into (idx, class, column) rows. An empty list is one
// marker row with idx -1 and no value.
std::vector<std::pair<int64_t, stored_value>> flatten(const entity_value_t& v) {
    std::vector<std::pair<int64_t, stored_value>> rows;
    auto flatten_list = [&rows](const auto& list) {
        if (list.empty()) {
            rows.push_back({-1, stored_value{value_class::empty_list, nullptr}});
            return;
        }
        int64_t idx = 0;
        for (const auto& element : list) {
            rows.push_back({idx++, store_element(element)});
        }
    };

    if (const auto* l = std::get_if<long_list>(&v)) {
        flatten_list(*l);
    } else if (const auto* d = std::get_if<double_list>(&v)) {
        flatten_list(*d);
    } else if (const auto* s = std::get_if<string_list>(&v)) {
        flatten_list(*s);
    } else {
        rows.push_back({0, store_scalar(v)});
    }
    return rows;
}

template<typename T>
const T* column_as(const column_value_t& c) {
    return std::get_if<T>(&c);
}

entity_value_t load_scalar(value_kind kind, const column_value_t& c) {
    switch (kind) {
        case value_kind::integer:
            if (auto* v = column_as<int64_t>(c)) return entity_value_t{std::in_place_type<int64_t>, *v};
            break;
        case value_kind::real:
            if (auto* v = column_as<double>(c)) return entity_value_t{std::in_place_type<double>, *v};
            break;
        case value_kind::boolean:
            if (auto* v = column_as<int64_t>(c)) return entity_value_t{std::in_place_type<bool>, *v != 0};
            break;
        case value_kind::string:
            if (auto* v = column_as<std::string>(c)) return entity_value_t{std::in_place_type<std::string>, *v};
            break;
        case value_kind::text:
            if (auto* v = column_as<std::string>(c)) return entity_value_t{text(*v)};
            break;
        case value_kind::short_blob:
            if (auto* v = column_as<std::vector<uint8_t>>(c)) return entity_value_t{short_blob(*v)};
            break;
        case value_kind::blob:
            if (auto* v = column_as<std::vector<uint8_t>>(c)) return entity_value_t{blob(*v)};
            break;
        default:
            break;
    }
    return entity_value_t{};
}

template<typename S>
std::optional<S> load_element(const column_value_t& c) {
    if (auto* v = column_as<S>(c)) return *v;
    return std::nullopt;
}

value_class element_class_of(value_kind list_kind) {
    switch (list_kind) {
        case value_kind::long_list: return value_class::integer;
        case value_kind::double_list: return value_class::real;
        case value_kind::string_list: return value_class::string;
        default: return value_class::null;
    }
}

const char* sql_operator(filter_operator op) {
    switch (op) {
        case filter_operator::equal: return "=";
        case filter_operator::not_equal: return "<>";
        case filter_operator::less_than: return "<";
        case filter_operator::less_than_or_equal: return "<=";
        case filter_operator::greater_than: return ">";
        case filter_operator::greater_than_or_equal: return ">=";
        case filter_operator::in: return "IN";
    }
    return "=";
}

constexpr const char* property_match =
    "EXISTS (SELECT 1 FROM Property p WHERE p.kind = e.kind AND p.id = e.id AND p.name = ?";

// Appends the SQL condition for one filter term and its parameters
void append_filter(std::ostringstream& sql, std::vector<column_value_t>& params, const filter_term& term) {
    sql << " AND " << property_match;
    params.push_back(term.name);

    value_kind kind = kind_of(term.value);

    if (kind == value_kind::absent) {
        // Absent sorts before every other value
        switch (term.op) {
            case filter_operator::equal:
            case filter_operator::less_than_or_equal:
                sql << " AND p.value_class = 0";
                break;
            case filter_operator::not_equal:
            case filter_operator::greater_than:
                sql << " AND p.value_class <> 0";
                break;
            case filter_operator::greater_than_or_equal:
                break;
            case filter_operator::less_than:
            case filter_operator::in:
                sql << " AND 0";
                break;
        }
        sql << ")";
        return;
    }

    if (is_list_kind(kind)) {
        if (term.op != filter_operator::in) {
            throw std::invalid_argument("The list value of filter '" + term.name +
                                        "' can only be used with the in operator.");
        }
        std::vector<column_value_t> candidates;
        bool has_null = false;
        auto collect = [&](const auto& list) {
            for (const auto& element : list) {
                if (!element.has_value()) {
                    has_null = true;
                } else {
                    candidates.push_back(store_scalar(to_value(*element)).column);
                }
            }
        };
        if (const auto* l = std::get_if<long_list>(&term.value)) collect(*l);
        else if (const auto* d = std::get_if<double_list>(&term.value)) collect(*d);
        else if (const auto* s = std::get_if<string_list>(&term.value)) collect(*s);

        sql << " AND (";
        if (!candidates.empty()) {
            sql << "(p.value_class = ? AND p.value IN (";
            params.push_back(static_cast<int64_t>(element_class_of(kind)));
            for (size_t i = 0; i < candidates.size(); ++i) {
                if (i > 0) sql << ", ";
                sql << "?";
                params.push_back(std::move(candidates[i]));
            }
            sql << "))";
        } else {
            sql << "0";
        }
        if (has_null) {
            sql << " OR p.value_class = 0";
        }
        sql << "))";
        return;
    }

    if (term.op == filter_operator::in) {
        throw std::invalid_argument("The in filter '" + term.name + "' requires a list value.");
    }

    stored_value param = store_scalar(term.value);
    sql << " AND p.value_class = ? AND p.value " << sql_operator(term.op) << " ?)";
    params.push_back(static_cast<int64_t>(param.cls));
    params.push_back(std::move(param.column));
}

void append_where(std::ostringstream& sql, std::vector<column_value_t>& params, const query& q) {
    sql << " WHERE e.kind = ?";
    params.push_back(q.kind());
    for (const auto& term : q.filters()) {
        append_filter(sql, params, term);
    }
}

} // namespace

entity_store::entity_store(const store_config& config)
    : config_(config)
    , db_(std::make_unique<database>(config.path,
          config.read_only ? database::open_mode::read_only : database::open_mode::read_write,
          config.busy_timeout_ms)) {
    if (!config.read_only) {
        ensure_tables();
    } else if (!db_->table_exists("Entity") || !db_->table_exists("Property")) {
        LOG_ERROR("store", "%s has no entity tables", config.path.c_str());
        throw db_error("Read-only store " + config.path + " has no entity tables");
    }
}

void entity_store::ensure_tables() {
    db_->execute(
        "CREATE TABLE IF NOT EXISTS Entity ("
        "kind TEXT NOT NULL, "
        "id INTEGER NOT NULL, "
        "PRIMARY KEY (kind, id))");
    db_->execute(
        "CREATE TABLE IF NOT EXISTS Property ("
        "kind TEXT NOT NULL, "
        "id INTEGER NOT NULL, "
        "name TEXT NOT NULL, "
        "idx INTEGER NOT NULL, "
        "value_kind INTEGER NOT NULL, "
        "value_class INTEGER NOT NULL, "
        "value, "
        "PRIMARY KEY (kind, id, name, idx))");
    db_->execute(
        "CREATE INDEX IF NOT EXISTS Property_filter "
        "ON Property (kind, name, value_class, value)");
    // Highest id ever assigned per kind. Ids of removed entities are not reused.
    db_->execute(
        "CREATE TABLE IF NOT EXISTS EntitySequence ("
        "kind TEXT PRIMARY KEY NOT NULL, "
        "last_id INTEGER NOT NULL)");
}

int64_t entity_store::next_id(const std::string& kind) {
    return db_->query_int(
        "SELECT MAX(COALESCE((SELECT last_id FROM EntitySequence WHERE kind = ?), 0), "
        "COALESCE((SELECT MAX(id) FROM Entity WHERE kind = ?), 0)) + 1",
        {kind, kind}).value_or(1);
}

key entity_store::put(entity& e) {
    if (e.kind().empty()) {
        throw std::invalid_argument("The entity has no kind.");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    strata::key k = e.key();
    transaction tx(*db_);

    if (k.id == 0) {
        k.id = next_id(k.kind);
        e.set_key(k);
    }
    db_->execute(
        "INSERT INTO EntitySequence (kind, last_id) VALUES (?, ?) "
        "ON CONFLICT(kind) DO UPDATE SET last_id = MAX(last_id, excluded.last_id)",
        {k.kind, k.id});

    db_->execute("INSERT OR IGNORE INTO Entity (kind, id) VALUES (?, ?)", {k.kind, k.id});
    db_->execute("DELETE FROM Property WHERE kind = ? AND id = ?", {k.kind, k.id});
    write_properties(e);

    tx.commit();
    LOG_DEBUG("store", "put %s(%lld) with %zu properties", k.kind.c_str(),
              static_cast<long long>(k.id), e.properties().size());
    return k;
}

void entity_store::write_properties(const entity& e) {
    const strata::key& k = e.key();
    for (const auto& [name, value] : e.properties()) {
        auto kind = static_cast<int64_t>(kind_of(value));
        for (auto& [idx, stored] : flatten(value)) {
            db_->execute(
                "INSERT INTO Property (kind, id, name, idx, value_kind, value_class, value) "
                "VALUES (?, ?, ?, ?, ?, ?, ?)",
                {k.kind, k.id, name, idx, kind, static_cast<int64_t>(stored.cls), std::move(stored.column)});
        }
    }
}

std::optional<entity> entity_store::get(const strata::key& k) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(k);
}

std::optional<entity> entity_store::load(const strata::key& k) {
    if (!db_->query_int("SELECT id FROM Entity WHERE kind = ? AND id = ?", {k.kind, k.id})) {
        return std::nullopt;
    }

    auto rows = db_->query(
        "SELECT name, idx, value_kind, value FROM Property "
        "WHERE kind = ? AND id = ? ORDER BY name, idx",
        {k.kind, k.id});

    // Group rows by property name (already ordered by idx)
    std::map<std::string, std::vector<const database::row_t*>> grouped;
    for (const auto& row : rows) {
        grouped[std::get<std::string>(row.at("name"))].push_back(&row);
    }

    entity e(k);
    for (const auto& [name, prop_rows] : grouped) {
        auto kind = static_cast<value_kind>(std::get<int64_t>(prop_rows.front()->at("value_kind")));
        bool empty_marker = std::get<int64_t>(prop_rows.front()->at("idx")) < 0;

        switch (kind) {
            case value_kind::long_list: {
                long_list list;
                if (!empty_marker) {
                    for (const auto* row : prop_rows) list.push_back(load_element<int64_t>(row->at("value")));
                }
                e.set_property(name, std::move(list));
                break;
            }
            case value_kind::double_list: {
                double_list list;
                if (!empty_marker) {
                    for (const auto* row : prop_rows) list.push_back(load_element<double>(row->at("value")));
                }
                e.set_property(name, std::move(list));
                break;
            }
            case value_kind::string_list: {
                string_list list;
                if (!empty_marker) {
                    for (const auto* row : prop_rows) list.push_back(load_element<std::string>(row->at("value")));
                }
                e.set_property(name, std::move(list));
                break;
            }
            default:
                e.set_property(name, load_scalar(kind, prop_rows.front()->at("value")));
                break;
        }
    }
    return e;
}

bool entity_store::remove(const strata::key& k) {
    std::lock_guard<std::mutex> lock(mutex_);
    transaction tx(*db_);
    db_->execute("DELETE FROM Entity WHERE kind = ? AND id = ?", {k.kind, k.id});
    bool removed = db_->changes() > 0;
    db_->execute("DELETE FROM Property WHERE kind = ? AND id = ?", {k.kind, k.id});
    tx.commit();
    return removed;
}

std::vector<key> entity_store::run_keys(const query& q) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_keys(q);
}

std::vector<key> entity_store::select_keys(const query& q) {
    std::ostringstream sql;
    std::vector<column_value_t> params;

    sql << "SELECT e.id AS id FROM Entity e";
    append_where(sql, params, q);

    sql << " ORDER BY ";
    for (const auto& s : q.sorts()) {
        // Ascending uses the smallest element of a multi-valued property,
        // descending the largest.
        bool asc = s.direction == sort_direction::ascending;
        sql << "(SELECT " << (asc ? "MIN" : "MAX")
            << "(p.value) FROM Property p WHERE p.kind = e.kind AND p.id = e.id AND p.name = ?) "
            << (asc ? "ASC" : "DESC") << ", ";
        params.push_back(s.name);
    }
    sql << "e.id ASC";

    if (q.limit_count() > 0 || q.offset_count() > 0) {
        sql << " LIMIT ? OFFSET ?";
        params.push_back(q.limit_count() > 0 ? static_cast<int64_t>(q.limit_count()) : int64_t{-1});
        params.push_back(static_cast<int64_t>(q.offset_count()));
    }

    LOG_DEBUG("store", "run: %s", sql.str().c_str());

    std::vector<strata::key> keys;
    for (const auto& row : db_->query(sql.str(), params)) {
        keys.push_back(strata::key{q.kind(), std::get<int64_t>(row.at("id"))});
    }
    return keys;
}

std::vector<entity> entity_store::run(const query& q) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<entity> result;
    for (const auto& k : select_keys(q)) {
        if (auto e = load(k)) {
            result.push_back(std::move(*e));
        }
    }
    return result;
}

size_t entity_store::count(const query& q) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream sql;
    std::vector<column_value_t> params;

    sql << "SELECT COUNT(*) FROM Entity e";
    append_where(sql, params, q);

    return static_cast<size_t>(db_->query_int(sql.str(), params).value_or(0));
}

} // namespace strata
