#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include "schema.hpp"
#include "criterion.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Store configuration
// ============================================================================

struct store_config {
    /// Database file path. Use ":memory:" for an in-memory store.
    std::string path = ":memory:";

    /// Open without write access. Tables must already exist.
    bool read_only = false;

    /// How long SQLite waits on a locked database before failing.
    int busy_timeout_ms = 5000;
};

// ============================================================================
// entity_store - embedded entity store that executes query filters
//
// Each property is stored as one row per value; a multi-valued property has
// one row per element. An equality filter on a multi-valued property
// therefore matches when any element is equal.
//
// All operations are serialized on one mutex, so a store may be shared
// across threads. Ids are allocated per kind and never reused.
// ============================================================================

class entity_store {
public:
    entity_store() : entity_store(store_config{}) {}
    explicit entity_store(const store_config& config);

    entity_store(const entity_store&) = delete;
    entity_store& operator=(const entity_store&) = delete;

    /// Stores e, replacing all existing properties of the same key. Assigns a
    /// fresh id when e has none and writes it back. Throws
    /// std::invalid_argument if e has no kind.
    strata::key put(entity& e);

    std::optional<entity> get(const strata::key& k);

    /// Returns true if an entity was removed.
    bool remove(const strata::key& k);

    /// Executes q. Throws std::invalid_argument for a list value used with an
    /// operator other than in.
    std::vector<entity> run(const query& q);

    std::vector<strata::key> run_keys(const query& q);

    /// Number of entities matching q's filters, ignoring limit and offset.
    size_t count(const query& q);

    const store_config& config() const { return config_; }

private:
    store_config config_;
    std::unique_ptr<database> db_;
    std::mutex mutex_;

    void ensure_tables();
    int64_t next_id(const std::string& kind);
    std::vector<strata::key> select_keys(const query& q);
    std::optional<entity> load(const strata::key& k);
    void write_properties(const entity& e);
};

// ============================================================================
// model_query<M> - typed query over one model kind
// ============================================================================

template<Model M>
class model_query {
public:
    explicit model_query(entity_store& store)
        : store_(store), query_(strata::meta<M>().kind()) {}

    model_query& filter(const criterion& c) {
        c.apply(query_);
        return *this;
    }

    template<typename... Rest>
    model_query& filter(const criterion& first, const Rest&... rest) {
        first.apply(query_);
        (rest.apply(query_), ...);
        return *this;
    }

    model_query& sort(const sort_criterion& s) {
        s.apply(query_);
        return *this;
    }

    model_query& limit(size_t count) {
        query_.limit(count);
        return *this;
    }

    model_query& offset(size_t count) {
        query_.offset(count);
        return *this;
    }

    std::vector<M> as_list() const {
        const auto& m = strata::meta<M>();
        std::vector<M> models;
        for (const auto& e : store_.run(query_)) {
            models.push_back(m.entity_to_model(e));
        }
        return models;
    }

    /// First match, or nullopt when nothing matches.
    std::optional<M> as_single() const {
        strata::query single = query_;
        single.limit(1);
        auto entities = store_.run(single);
        if (entities.empty()) return std::nullopt;
        return strata::meta<M>().entity_to_model(entities.front());
    }

    std::vector<strata::key> as_key_list() const {
        return store_.run_keys(query_);
    }

    size_t count() const { return store_.count(query_); }

    const strata::query& query() const { return query_; }

private:
    entity_store& store_;
    strata::query query_;
};

/// Stores model under k (a new id when k has none) and returns the key.
template<Model M>
strata::key put_model(entity_store& store, const M& model, strata::key k = {}) {
    const auto& m = strata::meta<M>();
    if (k.kind.empty()) k.kind = m.kind();
    entity e = m.model_to_entity(model, std::move(k));
    return store.put(e);
}

template<Model M>
std::optional<M> get_model(entity_store& store, int64_t id) {
    const auto& m = strata::meta<M>();
    auto e = store.get(strata::key{m.kind(), id});
    if (!e) return std::nullopt;
    return m.entity_to_model(*e);
}

} // namespace strata

#endif // __cplusplus
