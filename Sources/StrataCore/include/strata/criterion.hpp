#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "schema.hpp"
#include "convert.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Query accumulator
// ============================================================================

enum class filter_operator {
    equal,
    not_equal,
    less_than,
    less_than_or_equal,
    greater_than,
    greater_than_or_equal,
    in
};

const char* operator_name(filter_operator op);

enum class sort_direction {
    ascending,
    descending
};

struct filter_term {
    std::string name;
    filter_operator op;
    entity_value_t value;

    bool operator==(const filter_term& other) const {
        return name == other.name && op == other.op && value == other.value;
    }
    bool operator!=(const filter_term& other) const { return !(*this == other); }
};

struct sort_term {
    std::string name;
    sort_direction direction = sort_direction::ascending;

    bool operator==(const sort_term& other) const {
        return name == other.name && direction == other.direction;
    }
};

/// Collects filter terms (a conjunction) and sort orders for one entity kind.
/// Terms keep their append order.
class query {
public:
    explicit query(std::string kind = "") : kind_(std::move(kind)) {}

    query& add_filter(std::string name, filter_operator op, entity_value_t value);
    query& add_sort(std::string name, sort_direction direction = sort_direction::ascending);

    query& limit(size_t count) {
        limit_ = count;
        return *this;
    }

    query& offset(size_t count) {
        offset_ = count;
        return *this;
    }

    const std::string& kind() const { return kind_; }
    const std::vector<filter_term>& filters() const { return filters_; }
    const std::vector<sort_term>& sorts() const { return sorts_; }
    size_t limit_count() const { return limit_; }
    size_t offset_count() const { return offset_; }

private:
    std::string kind_;
    std::vector<filter_term> filters_;
    std::vector<sort_term> sorts_;
    size_t limit_ = 0;
    size_t offset_ = 0;
};

// ============================================================================
// criterion - one filter predicate bound to one attribute
// ============================================================================

enum class criterion_kind {
    equal,
    not_equal,
    less_than,
    less_than_or_equal,
    greater_than,
    greater_than_or_equal,
    in,
    contains,
    is_null,
    is_not_null
};

class criterion {
public:
    // Factories. All throw std::invalid_argument when attr is null or the
    // parameter is absent.
    static criterion equal(const attribute_meta* attr, entity_value_t parameter);
    static criterion not_equal(const attribute_meta* attr, entity_value_t parameter);
    static criterion less_than(const attribute_meta* attr, entity_value_t parameter);
    static criterion less_than_or_equal(const attribute_meta* attr, entity_value_t parameter);
    static criterion greater_than(const attribute_meta* attr, entity_value_t parameter);
    static criterion greater_than_or_equal(const attribute_meta* attr, entity_value_t parameter);

    /// parameter must be a list value; the attribute matches any element of it.
    static criterion in(const attribute_meta* attr, entity_value_t parameter);

    /// attr must be multi-valued; matches when one of its elements equals parameter.
    static criterion contains(const attribute_meta* attr, entity_value_t parameter);

    // Test for a stored absent value. These take no parameter.
    static criterion is_null(const attribute_meta* attr);
    static criterion is_not_null(const attribute_meta* attr);

    // Host-value overloads
    template<typename T>
    static criterion equal(const attribute_meta* attr, const T& v) { return equal(attr, to_value(v)); }
    template<typename T>
    static criterion not_equal(const attribute_meta* attr, const T& v) { return not_equal(attr, to_value(v)); }
    template<typename T>
    static criterion less_than(const attribute_meta* attr, const T& v) { return less_than(attr, to_value(v)); }
    template<typename T>
    static criterion less_than_or_equal(const attribute_meta* attr, const T& v) {
        return less_than_or_equal(attr, to_value(v));
    }
    template<typename T>
    static criterion greater_than(const attribute_meta* attr, const T& v) { return greater_than(attr, to_value(v)); }
    template<typename T>
    static criterion greater_than_or_equal(const attribute_meta* attr, const T& v) {
        return greater_than_or_equal(attr, to_value(v));
    }
    template<typename T>
    static criterion contains(const attribute_meta* attr, const T& v) { return contains(attr, to_value(v)); }
    template<host_collection C>
    static criterion in(const attribute_meta* attr, const C& candidates) {
        return in(attr, convert::to_list(std::optional<C>(candidates)));
    }

    criterion_kind kind() const { return kind_; }
    const attribute_meta& attribute() const { return *attribute_; }
    const entity_value_t& parameter() const { return parameter_; }

    /// Operator written to the query. contains and is_null use equal;
    /// is_not_null uses greater_than against the absent value.
    filter_operator op() const;

    /// Appends exactly one filter term to q.
    void apply(query& q) const;

private:
    criterion(criterion_kind kind, const attribute_meta* attr, entity_value_t parameter);

    criterion_kind kind_;
    const attribute_meta* attribute_;
    entity_value_t parameter_;
};

/// Applies criteria in order (AND).
void apply_all(query& q, std::initializer_list<criterion> criteria);
void apply_all(query& q, const std::vector<criterion>& criteria);

// ============================================================================
// sort_criterion
// ============================================================================

class sort_criterion {
public:
    /// Throws std::invalid_argument if attr is null.
    sort_criterion(const attribute_meta* attr, sort_direction direction);

    static sort_criterion asc(const attribute_meta* attr) {
        return sort_criterion(attr, sort_direction::ascending);
    }
    static sort_criterion desc(const attribute_meta* attr) {
        return sort_criterion(attr, sort_direction::descending);
    }

    const attribute_meta& attribute() const { return *attribute_; }
    sort_direction direction() const { return direction_; }

    void apply(query& q) const;

private:
    const attribute_meta* attribute_;
    sort_direction direction_;
};

} // namespace strata

#endif // __cplusplus
