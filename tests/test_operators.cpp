#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <assertlab/constraints/message_writer.hpp>
#include <assertlab/constraints/operators.hpp>
#include <assertlab/constraints/syntax.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

#include "test_helper.hpp"

using assertlab::core::ConfigurationError;
using assertlab::core::Value;
using namespace assertlab::constraints;

namespace {

bool passes(const ConstraintPtr& constraint, const Value& actual) {
    return constraint->apply_to(actual)->is_success();
}

std::string message_for(const ConstraintPtr& constraint, const Value& actual) {
    auto result = constraint->apply_to(actual);
    MessageWriter writer;
    result->write_message_to(writer);
    return writer.str();
}

ConstraintPtr leaf_equal(int expected) {
    return std::make_shared<EqualConstraint>(Value::from(expected));
}

} // anonymous namespace

static bool test_precedence() {
    TestTally result;

    // (x < 10 and x > 0) or x == 50
    ConstraintPtr range_or_fifty =
        Is::less_than(10).and_().greater_than(0).or_().equal_to(50).resolve();
    result.assert_true(passes(range_or_fifty, Value::from(5)), "5 lies in the range");
    result.assert_true(passes(range_or_fifty, Value::from(50)), "50 matches the alternative");
    result.assert_false(passes(range_or_fifty, Value::from(70)), "70 matches neither");
    result.assert_false(passes(range_or_fifty, Value::from(-1)), "-1 matches neither");
    result.assert_eq(std::string("less than 10 and greater than 0 or 50"),
                     range_or_fifty->description(), "Left-to-right description");

    std::string message = message_for(range_or_fifty, Value::from(70));
    result.assert_contains(message, "  Expected: less than 10 and greater than 0 or 50",
                           "Expected line shows the whole expression");
    result.assert_contains(message, "  But was:  70", "Actual line");
    result.assert_contains(message, "Failing branch: less than 10", "Failing AND branch reported");

    // x == 1 or (x > 5 and x < 8): AND binds tighter than OR on the right
    ConstraintPtr one_or_window =
        Is::equal_to(1).or_().greater_than(5).and_().less_than(8).resolve();
    result.assert_true(passes(one_or_window, Value::from(1)), "1 matches the left operand");
    result.assert_true(passes(one_or_window, Value::from(6)), "6 lies in the window");
    result.assert_false(passes(one_or_window, Value::from(9)), "9 lies outside");

    // not binds tighter than and
    ConstraintPtr not_null_and_positive = Is::not_().null().and_().greater_than(0).resolve();
    result.assert_true(passes(not_null_and_positive, Value::from(3)), "not null and positive");
    result.assert_false(passes(not_null_and_positive, Value{}), "null fails the prefix branch");

    // a or b or c is left associative and short-circuits
    ConstraintPtr chain = Is::equal_to(1).or_().equal_to(2).or_().equal_to(3).resolve();
    result.assert_true(passes(chain, Value::from(3)), "Last alternative");
    result.assert_eq(std::string("1 or 2 or 3"), chain->description(), "Chained OR description");

    result.print_summary();
    return result.all_passed();
}

static bool test_collection_operator_scope() {
    TestTally result;

    // all (x > 0 and x < 10)
    ConstraintPtr all_in_range = Has::all().greater_than(0).and_().less_than(10).resolve();
    result.assert_no_throw([&] { (void)passes(all_in_range, Value::from(std::vector{1, 2, 3})); },
                           "AND after all applies to the items");
    result.assert_true(passes(all_in_range, Value::from(std::vector{1, 2, 3})),
                       "Every item lies in the range");
    result.assert_false(passes(all_in_range, Value::from(std::vector{1, 20, 3})),
                        "One item outside the range");
    result.assert_eq(std::string("all items greater than 0 and less than 10"),
                     all_in_range->description(), "Quantifier wraps the whole conjunction");

    // some (x == 1 or x == 7)
    ConstraintPtr some_alternative = Has::some().equal_to(1).or_().equal_to(7).resolve();
    result.assert_true(passes(some_alternative, Value::from(std::vector{5, 7})),
                       "OR after some applies to the items");
    result.assert_false(passes(some_alternative, Value::from(std::vector{5, 6})), "No item matches");

    // none (x < 0 or x > 100)
    ConstraintPtr none_outside = Has::none().less_than(0).or_().greater_than(100).resolve();
    result.assert_true(passes(none_outside, Value::from(std::vector{0, 50, 100})),
                       "No item outside the bounds");
    result.assert_false(passes(none_outside, Value::from(std::vector{0, 101})),
                        "One item above the bounds");

    // not keeps its tight binding: (not null) and (> 0)
    ConstraintPtr not_then_and = Is::not_().null().and_().greater_than(0).resolve();
    result.assert_eq(std::string("not null and greater than 0"), not_then_and->description(),
                     "Not still binds tighter than and");

    result.print_summary();
    return result.all_passed();
}

static bool test_builder() {
    TestTally result;

    ConstraintBuilder builder;
    builder.append(std::make_shared<NotOperator>());
    builder.append(leaf_equal(4));
    builder.append(std::make_shared<AndOperator>());
    builder.append(leaf_equal(5));
    result.assert_true(builder.is_resolvable(), "Expression ending in a constraint resolves");
    ConstraintPtr resolved = builder.resolve();
    result.assert_true(resolved == builder.resolve(), "Resolution is cached");
    result.assert_true(passes(resolved, Value::from(5)), "not 4 and 5 accepts 5");
    result.assert_throws<ConfigurationError>([&] { builder.append(std::make_shared<OrOperator>()); },
                                             "A resolved builder cannot be extended");

    ConstraintBuilder partial;
    partial.append(leaf_equal(1));
    partial.append(std::make_shared<AndOperator>());
    result.assert_false(partial.is_resolvable(), "Trailing binary operator is partial");
    result.assert_throws<ConfigurationError>([&] { (void)partial.resolve(); },
                                             "Partial expression cannot resolve");

    ConstraintBuilder no_left;
    result.assert_throws<ConfigurationError>(
        [&] { no_left.append(std::make_shared<AndOperator>()); },
        "Binary operator without a left operand");

    ConstraintBuilder adjacent;
    adjacent.append(leaf_equal(1));
    result.assert_throws<ConfigurationError>([&] { adjacent.append(leaf_equal(2)); },
                                             "Two constraints need an operator");
    result.assert_throws<ConfigurationError>(
        [&] { adjacent.append(std::make_shared<NotOperator>()); },
        "Prefix operator after a constraint");

    ConstraintBuilder property_only;
    property_only.append(std::make_shared<PropertyOperator>("name"));
    result.assert_true(property_only.is_resolvable(), "Trailing property operator resolves");
    result.assert_eq(std::string("property name"), property_only.resolve()->description(),
                     "Resolved to an existence check");

    ConstraintBuilder dangling;
    dangling.append(std::make_shared<NotOperator>());
    result.assert_throws<ConfigurationError>([&] { (void)dangling.resolve(); },
                                             "Dangling prefix operator cannot resolve");

    result.print_summary();
    return result.all_passed();
}

static bool test_logical_operators() {
    TestTally result;

    auto in_range = Is::greater_than(0) && Is::less_than(10);
    result.assert_true(passes(in_range.resolve(), Value::from(5)), "&& joins two expressions");
    result.assert_false(passes(in_range.resolve(), Value::from(10)), "&& fails on the right");

    auto small_or_big = Is::less_than(0) || Is::greater_than(100);
    result.assert_true(passes(small_or_big.resolve(), Value::from(-5)), "|| left side");
    result.assert_true(passes(small_or_big.resolve(), Value::from(500)), "|| right side");
    result.assert_false(passes(small_or_big.resolve(), Value::from(50)), "|| neither side");

    auto not_empty = !Is::empty();
    result.assert_true(passes(not_empty.resolve(), Value::from(std::vector{1})), "! negates");
    result.assert_eq(std::string("not <empty>"), not_empty.resolve()->description(),
                     "Negation description");

    auto combined = !(Is::null() || Is::empty()) && Has::member(3);
    result.assert_true(passes(combined.resolve(), Value::from(std::vector{1, 2, 3})),
                       "Composed operators nest");

    ConstraintPtr existing = Is::equal_to(2).resolve();
    result.assert_true(passes(Is::all().matches(existing).resolve(), Value::from(std::vector{2, 2})),
                       "Prebuilt constraint used as an operand");

    result.print_summary();
    return result.all_passed();
}

static bool test_binary_results() {
    TestTally result;

    ConstraintPtr both = Is::greater_than(0).and_().less_than(10).resolve();
    auto failed = both->apply_to(Value::from(12));
    result.assert_false(failed->is_success(), "AND fails when the right side fails");
    result.assert_true(failed->actual_value().as_integer() == 12, "Actual value kept");
    MessageWriter writer;
    failed->write_message_to(writer);
    result.assert_contains(writer.str(), "Failing branch: less than 10", "Right branch reported");

    ConstraintPtr either = Is::equal_to("abc").or_().equal_to("abd").resolve();
    std::string message = message_for(either, Value::from("abx"));
    result.assert_contains(message, "Strings differ at index 2",
                           "OR failure carries the left branch detail");

    result.print_summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running Operator Tests" << std::endl;
    std::cout << "======================" << std::endl;

    bool all_tests_passed = true;

    try {
        std::cout << "\nTest: Precedence\n";
        all_tests_passed &= test_precedence();

        std::cout << "\nTest: Collection Operator Scope\n";
        all_tests_passed &= test_collection_operator_scope();

        std::cout << "\nTest: Builder\n";
        all_tests_passed &= test_builder();

        std::cout << "\nTest: Logical Operators\n";
        all_tests_passed &= test_logical_operators();

        std::cout << "\nTest: Binary Results\n";
        all_tests_passed &= test_binary_results();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return all_tests_passed ? 0 : 1;
}
