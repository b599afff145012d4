#include "strata/criterion.hpp"
#include <stdexcept>

namespace strata {

const char* operator_name(filter_operator op) {
    switch (op) {
        case filter_operator::equal: return "EQUAL";
        case filter_operator::not_equal: return "NOT_EQUAL";
        case filter_operator::less_than: return "LESS_THAN";
        case filter_operator::less_than_or_equal: return "LESS_THAN_OR_EQUAL";
        case filter_operator::greater_than: return "GREATER_THAN";
        case filter_operator::greater_than_or_equal: return "GREATER_THAN_OR_EQUAL";
        case filter_operator::in: return "IN";
    }
    return "UNKNOWN";
}

query& query::add_filter(std::string name, filter_operator op, entity_value_t value) {
    filters_.push_back(filter_term{std::move(name), op, std::move(value)});
    return *this;
}

query& query::add_sort(std::string name, sort_direction direction) {
    sorts_.push_back(sort_term{std::move(name), direction});
    return *this;
}

// ============================================================================
// criterion
// ============================================================================

namespace {

void require_attribute(const attribute_meta* attr) {
    if (attr == nullptr) {
        throw std::invalid_argument("The attributeMeta parameter is null.");
    }
}

void require_parameter(const entity_value_t& parameter) {
    if (is_absent(parameter)) {
        throw std::invalid_argument("The parameter parameter is null.");
    }
}

} // namespace

criterion::criterion(criterion_kind kind, const attribute_meta* attr, entity_value_t parameter)
    : kind_(kind), attribute_(attr), parameter_(std::move(parameter)) {
    require_attribute(attr);
    if (kind != criterion_kind::is_null && kind != criterion_kind::is_not_null) {
        require_parameter(parameter_);
    }
}

criterion criterion::equal(const attribute_meta* attr, entity_value_t parameter) {
    return criterion(criterion_kind::equal, attr, std::move(parameter));
}

criterion criterion::not_equal(const attribute_meta* attr, entity_value_t parameter) {
    return criterion(criterion_kind::not_equal, attr, std::move(parameter));
}

criterion criterion::less_than(const attribute_meta* attr, entity_value_t parameter) {
    return criterion(criterion_kind::less_than, attr, std::move(parameter));
}

criterion criterion::less_than_or_equal(const attribute_meta* attr, entity_value_t parameter) {
    return criterion(criterion_kind::less_than_or_equal, attr, std::move(parameter));
}

criterion criterion::greater_than(const attribute_meta* attr, entity_value_t parameter) {
    return criterion(criterion_kind::greater_than, attr, std::move(parameter));
}

criterion criterion::greater_than_or_equal(const attribute_meta* attr, entity_value_t parameter) {
    return criterion(criterion_kind::greater_than_or_equal, attr, std::move(parameter));
}

criterion criterion::in(const attribute_meta* attr, entity_value_t parameter) {
    criterion c(criterion_kind::in, attr, std::move(parameter));
    if (!is_list_kind(kind_of(c.parameter_))) {
        throw std::invalid_argument(std::string("The in parameter must be a list, got ") +
                                    kind_name(kind_of(c.parameter_)) + ".");
    }
    return c;
}

criterion criterion::contains(const attribute_meta* attr, entity_value_t parameter) {
    criterion c(criterion_kind::contains, attr, std::move(parameter));
    if (!attr->multi_valued()) {
        throw std::invalid_argument("contains requires a multi-valued attribute, '" +
                                    attr->name() + "' is " + kind_name(attr->storage_kind()) + ".");
    }
    if (is_list_kind(kind_of(c.parameter_))) {
        throw std::invalid_argument("The contains parameter must be a single element.");
    }
    return c;
}

criterion criterion::is_null(const attribute_meta* attr) {
    return criterion(criterion_kind::is_null, attr, entity_value_t{});
}

criterion criterion::is_not_null(const attribute_meta* attr) {
    return criterion(criterion_kind::is_not_null, attr, entity_value_t{});
}

filter_operator criterion::op() const {
    switch (kind_) {
        case criterion_kind::equal: return filter_operator::equal;
        case criterion_kind::not_equal: return filter_operator::not_equal;
        case criterion_kind::less_than: return filter_operator::less_than;
        case criterion_kind::less_than_or_equal: return filter_operator::less_than_or_equal;
        case criterion_kind::greater_than: return filter_operator::greater_than;
        case criterion_kind::greater_than_or_equal: return filter_operator::greater_than_or_equal;
        case criterion_kind::in: return filter_operator::in;
        case criterion_kind::contains: return filter_operator::equal;
        case criterion_kind::is_null: return filter_operator::equal;
        // Every non-null value sorts after null
        case criterion_kind::is_not_null: return filter_operator::greater_than;
    }
    return filter_operator::equal;
}

void criterion::apply(query& q) const {
    q.add_filter(attribute_->name(), op(), parameter_);
}

void apply_all(query& q, std::initializer_list<criterion> criteria) {
    for (const auto& c : criteria) {
        c.apply(q);
    }
}

void apply_all(query& q, const std::vector<criterion>& criteria) {
    for (const auto& c : criteria) {
        c.apply(q);
    }
}

// ============================================================================
// sort_criterion
// ============================================================================

sort_criterion::sort_criterion(const attribute_meta* attr, sort_direction direction)
    : attribute_(attr), direction_(direction) {
    require_attribute(attr);
}

void sort_criterion::apply(query& q) const {
    q.add_sort(attribute_->name(), direction_);
}

} // namespace strata
