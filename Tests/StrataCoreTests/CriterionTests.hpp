#pragma once

#include <strata/strata.hpp>
#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <vector>

struct Posting {
    std::string title;
    int32_t score = 0;
    double rating = 0.0;
    std::optional<std::set<std::string>> tags;
};
STRATA_MODEL(Posting, title, score, rating, tags);

namespace criterion_tests {

using strata::criterion;
using strata::entity_value_t;
using strata::filter_operator;
using strata::filter_term;

template<typename F>
bool throws_invalid_argument(F&& f) {
    try {
        f();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

const strata::attribute_meta* attr(const std::string& name) {
    return strata::meta<Posting>().find_attribute(name);
}

// ============================================================================
// test_contains_null_parameter_throws
// ============================================================================

void test_contains_null_parameter_throws() {
    std::cout << "  test_contains_null_parameter_throws..." << std::flush;

    assert(throws_invalid_argument([] { criterion::contains(attr("tags"), entity_value_t{}); }));
    assert(throws_invalid_argument([] { criterion::contains(attr("tags"), std::optional<std::string>{}); }));
    assert(throws_invalid_argument([] { criterion::contains(attr("tags"), static_cast<const char*>(nullptr)); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_contains_appends_equal - contains("tags", "x") is ("tags", EQUAL, "x")
// ============================================================================

void test_contains_appends_equal() {
    std::cout << "  test_contains_appends_equal..." << std::flush;

    strata::query q("Posting");
    criterion::contains(attr("tags"), "x").apply(q);

    assert(q.filters().size() == 1);
    assert((q.filters()[0] == filter_term{"tags", filter_operator::equal, std::string("x")}));
    assert(std::string(strata::operator_name(q.filters()[0].op)) == "EQUAL");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_invalid_construction - null attribute, absent parameter, bad shape
// ============================================================================

void test_invalid_construction() {
    std::cout << "  test_invalid_construction..." << std::flush;

    const strata::attribute_meta* none = nullptr;
    const entity_value_t absent;
    const entity_value_t five = strata::to_value(5);

    assert(throws_invalid_argument([&] { criterion::equal(none, five); }));
    assert(throws_invalid_argument([&] { criterion::is_null(none); }));
    assert(throws_invalid_argument([&] { criterion::is_not_null(none); }));
    assert(throws_invalid_argument([&] { strata::sort_criterion::asc(none); }));

    assert(throws_invalid_argument([&] { criterion::equal(attr("score"), absent); }));
    assert(throws_invalid_argument([&] { criterion::not_equal(attr("score"), absent); }));
    assert(throws_invalid_argument([&] { criterion::less_than(attr("score"), absent); }));
    assert(throws_invalid_argument([&] { criterion::less_than_or_equal(attr("score"), absent); }));
    assert(throws_invalid_argument([&] { criterion::greater_than(attr("score"), absent); }));
    assert(throws_invalid_argument([&] { criterion::greater_than_or_equal(attr("score"), absent); }));
    assert(throws_invalid_argument([&] { criterion::in(attr("score"), absent); }));

    // in needs a list, contains needs a multi-valued attribute
    assert(throws_invalid_argument([&] { criterion::in(attr("score"), five); }));
    assert(throws_invalid_argument([&] { criterion::contains(attr("score"), five); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_operator_mapping
// ============================================================================

void test_operator_mapping() {
    std::cout << "  test_operator_mapping..." << std::flush;

    const auto* score = attr("score");

    assert(criterion::equal(score, 1).op() == filter_operator::equal);
    assert(criterion::not_equal(score, 1).op() == filter_operator::not_equal);
    assert(criterion::less_than(score, 1).op() == filter_operator::less_than);
    assert(criterion::less_than_or_equal(score, 1).op() == filter_operator::less_than_or_equal);
    assert(criterion::greater_than(score, 1).op() == filter_operator::greater_than);
    assert(criterion::greater_than_or_equal(score, 1).op() == filter_operator::greater_than_or_equal);
    assert(criterion::in(score, strata::long_list{1, 2}).op() == filter_operator::in);

    // Host collections are converted to a storage list
    auto host_in = criterion::in(score, std::vector<int32_t>{4, 5});
    assert(host_in.op() == filter_operator::in);
    assert((host_in.parameter() == strata::entity_value_t{strata::long_list{4, 5}}));
    auto names_in = criterion::in(attr("tags"), std::set<std::string>{"b", "a"});
    assert((names_in.parameter() == strata::entity_value_t{strata::string_list{"a", "b"}}));
    assert(criterion::contains(attr("tags"), "a").op() == filter_operator::equal);

    auto null_check = criterion::is_null(score);
    assert(null_check.kind() == strata::criterion_kind::is_null);
    assert(null_check.op() == filter_operator::equal);
    assert(strata::is_absent(null_check.parameter()));

    auto set_check = criterion::is_not_null(score);
    assert(set_check.op() == filter_operator::greater_than);
    assert(strata::is_absent(set_check.parameter()));

    // Host parameters are widened to storage kinds
    assert(std::holds_alternative<int64_t>(criterion::equal(score, int16_t{3}).parameter()));
    assert(std::holds_alternative<double>(criterion::less_than(attr("rating"), 2.5f).parameter()));
    assert(std::holds_alternative<std::string>(criterion::equal(attr("title"), "t").parameter()));
    assert(&criterion::equal(score, 1).attribute() == score);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_criteria_order - terms appear exactly in application order
// ============================================================================

void test_criteria_order() {
    std::cout << "  test_criteria_order..." << std::flush;

    std::vector<criterion> criteria{
        criterion::greater_than_or_equal(attr("score"), 10),
        criterion::contains(attr("tags"), "travel"),
        criterion::less_than(attr("rating"), 4.5),
        criterion::is_not_null(attr("title")),
        criterion::in(attr("score"), strata::long_list{10, 20}),
    };

    strata::query q("Posting");
    strata::apply_all(q, criteria);

    std::vector<filter_term> expected;
    for (const auto& c : criteria) {
        expected.push_back(filter_term{c.attribute().name(), c.op(), c.parameter()});
    }
    assert(q.filters() == expected);

    // apply_all on a query with existing terms only appends
    strata::query q2("Posting");
    q2.add_filter("title", filter_operator::equal, strata::to_value("first"));
    strata::apply_all(q2, {criterion::equal(attr("score"), 1), criterion::equal(attr("score"), 2)});
    assert(q2.filters().size() == 3);
    assert(q2.filters()[0].name == "title");
    assert(std::get<int64_t>(q2.filters()[1].value) == 1);
    assert(std::get<int64_t>(q2.filters()[2].value) == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sort_criterion
// ============================================================================

void test_sort_criterion() {
    std::cout << "  test_sort_criterion..." << std::flush;

    strata::query q("Posting");
    strata::sort_criterion::desc(attr("score")).apply(q);
    strata::sort_criterion::asc(attr("title")).apply(q);
    q.limit(5).offset(10);

    assert(q.sorts().size() == 2);
    assert((q.sorts()[0] == strata::sort_term{"score", strata::sort_direction::descending}));
    assert((q.sorts()[1] == strata::sort_term{"title", strata::sort_direction::ascending}));
    assert(q.limit_count() == 5);
    assert(q.offset_count() == 10);
    assert(q.filters().empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all criterion tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Criterion Tests ---" << std::endl;

    test_contains_null_parameter_throws();
    test_contains_appends_equal();
    test_invalid_construction();
    test_operator_mapping();
    test_criteria_order();
    test_sort_criterion();

    std::cout << "--- Criterion Tests: All passed ---" << std::endl;
}

} // namespace criterion_tests
