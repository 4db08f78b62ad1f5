#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <assertlab/comparers/equality_comparer.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>
#include <assertlab/core/value_format.hpp>

#include "test_helper.hpp"

using assertlab::comparers::EqualityComparer;
using assertlab::comparers::EqualityOptions;
using assertlab::core::Tolerance;
using assertlab::core::Value;
using assertlab::core::ValueKind;

namespace {

struct Point {
    static constexpr std::string_view type_name = "Point";
    int x = 0;
    int y = 0;

    auto members() const {
        return std::make_tuple(assertlab::core::member("x", x), assertlab::core::member("y", y));
    }
};

struct Node {
    static constexpr std::string_view type_name = "Node";
    int value = 0;
    std::shared_ptr<Node> next;

    auto members() const {
        return std::make_tuple(assertlab::core::member("value", value),
                               assertlab::core::member("next", next));
    }
};

/// Amount compared with currency ignored when either side is a wildcard
class Money : public assertlab::core::StructurallyEquatable {
  public:
    Money(double amount, std::string currency) : amount_(amount), currency_(std::move(currency)) {}

    bool structurally_equals(const Value& other,
                             assertlab::core::ElementComparer& comparer) const override {
        if (other.kind() != ValueKind::structural) {
            return false;
        }
        const auto* money = dynamic_cast<const Money*>(&other.as_structural());
        if (money == nullptr) {
            return false;
        }
        return comparer.equal(Value(amount_), Value(money->amount_)) &&
               (currency_ == "*" || currency_ == money->currency_);
    }

    std::optional<std::vector<Value>> elements() const override {
        return std::vector<Value>{Value(amount_), Value(currency_)};
    }

    std::string describe() const override { return currency_ + " " + std::to_string(amount_); }

  private:
    double amount_;
    std::string currency_;
};

} // anonymous namespace

static bool test_value_conversion() {
    TestTally result;

    result.assert_true(Value::from(42).kind() == ValueKind::integer, "int becomes integer");
    result.assert_true(Value::from(42u).kind() == ValueKind::unsigned_integer,
                       "unsigned becomes unsigned_integer");
    result.assert_true(Value::from(1.5f).kind() == ValueKind::floating, "float becomes floating");
    result.assert_true(Value::from("text").kind() == ValueKind::string, "literal becomes string");
    result.assert_true(Value::from(std::optional<int>{}).is_null(), "empty optional is null");
    result.assert_true(Value::from(std::vector<int>{1, 2}).kind() == ValueKind::sequence,
                       "vector becomes sequence");
    result.assert_true(Value::from(std::map<int, int>{{1, 2}}).kind() == ValueKind::dictionary,
                       "map becomes dictionary");
    result.assert_true(Value::from(std::pair(1, 2)).as_tuple().flavor ==
                           assertlab::core::TupleFlavor::pair,
                       "pair keeps the pair flavor");
    result.assert_true(Value::from(std::set<int>{1}).as_sequence().order ==
                           assertlab::core::SequenceOrder::ordered,
                       "set is an ordered sequence");
    result.assert_true(Value::from(std::unordered_set<int>{1}).as_sequence().order ==
                           assertlab::core::SequenceOrder::unordered,
                       "unordered_set is an unordered sequence");

    Value point = Value::from(Point{1, 2});
    result.assert_true(point.kind() == ValueKind::record, "members() type becomes record");
    result.assert_eq(std::string("<Point { x = 1, y = 2 }>"), assertlab::core::format_value(point),
                     "Record formatting");

    result.assert_true(Value::from(5).identity() == nullptr, "Scalars have no identity");
    Value list = Value::from(std::vector<int>{1});
    Value copy = list;
    result.assert_true(list.identity() != nullptr && list.identity() == copy.identity(),
                       "Copies of a composite share identity");

    result.print_summary();
    return result.all_passed();
}

static bool test_reflexivity_and_cycles() {
    TestTally result;
    EqualityComparer comparer;

    Value nested = Value::from(std::vector<std::vector<int>>{{1, 2}, {3}});
    result.assert_true(comparer.are_equal(nested, nested), "A value equals itself");

    auto node = std::make_shared<assertlab::core::Sequence>();
    Value self_referential(node);
    node->items.push_back(Value(std::int64_t{1}));
    node->items.push_back(self_referential.back_reference());
    result.assert_true(comparer.are_equal(self_referential, self_referential),
                       "Self-referential sequence equals itself");

    auto other = std::make_shared<assertlab::core::Sequence>();
    Value twin(other);
    other->items.push_back(Value(std::int64_t{1}));
    other->items.push_back(twin.back_reference());
    result.assert_true(comparer.are_equal(self_referential, twin),
                       "Two isomorphic cycles compare equal without recursing forever");
    result.assert_eq(std::string("< 1, <...> >"), assertlab::core::format_value(self_referential),
                     "Cycles print as <...>");

    auto first = std::make_shared<Node>();
    first->value = 7;
    first->next = first;
    auto second = std::make_shared<Node>();
    second->value = 7;
    second->next = second;
    result.assert_true(comparer.are_equal(Value::from(first), Value::from(second)),
                       "Cyclic shared_ptr graphs compare equal");
    second->value = 8;
    result.assert_false(comparer.are_equal(Value::from(first), Value::from(second)),
                        "Cyclic graphs with different payloads differ");
    first->next.reset();
    second->next.reset();

    result.print_summary();
    return result.all_passed();
}

static bool test_cycle_ownership() {
    TestTally result;
    EqualityComparer comparer;

    std::weak_ptr<assertlab::core::Sequence> manual_node;
    {
        Value list = Value::sequence({Value::from(1)});
        list.sequence_node()->items.push_back(list.back_reference());
        manual_node = list.sequence_node();
        result.assert_true(comparer.are_equal(list, list), "Closed list equals itself");
        result.assert_true(list.as_sequence().items[1].identity() == list.identity(),
                           "Back reference keeps the node identity");
    }
    result.assert_true(manual_node.expired(), "Closed list is freed with its root");

    result.assert_true(Value::from(5).back_reference().as_integer() == 5,
                       "Scalars are returned unchanged");

    auto first = std::make_shared<Node>();
    auto second = std::make_shared<Node>();
    first->value = 1;
    first->next = second;
    second->value = 2;
    second->next = first;

    std::weak_ptr<assertlab::core::Record> root_node;
    std::weak_ptr<assertlab::core::Record> inner_node;
    {
        Value built = Value::from(first);
        root_node = built.record_node();
        const Value* next = built.as_record().find_member("next");
        inner_node = next->record_node();
        const Value* back = next->as_record().find_member("next");
        result.assert_true(back->identity() == built.identity(),
                           "Converted cycle points back at the root node");
        result.assert_true(comparer.are_equal(built, Value::from(first)),
                           "Converted cycle equals a fresh conversion");
    }
    result.assert_true(root_node.expired(), "Converted root is freed");
    result.assert_true(inner_node.expired(), "Converted inner node is freed");

    auto shared_leaf = std::make_shared<std::vector<int>>(std::vector{1, 2});
    std::vector<std::shared_ptr<std::vector<int>>> twice{shared_leaf, shared_leaf};
    Value diamond = Value::from(twice);
    result.assert_true(diamond.as_sequence().items[0].identity() ==
                           diamond.as_sequence().items[1].identity(),
                       "A pointee reached twice outside a cycle is shared");

    first->next.reset();

    result.print_summary();
    return result.all_passed();
}

static bool test_numerics() {
    TestTally result;
    EqualityComparer comparer;

    result.assert_true(comparer.are_equal(Value::from(1), Value::from(1.0)),
                       "Integer and double with equal value");
    result.assert_true(comparer.are_equal(Value::from(3u), Value::from(3)),
                       "Unsigned and signed with equal value");
    result.assert_false(comparer.are_equal(Value::from(-1), Value::from(std::numeric_limits<std::uint64_t>::max())),
                        "Negative signed never equals a large unsigned");

    double nan = std::numeric_limits<double>::quiet_NaN();
    result.assert_true(comparer.are_equal(Value(nan), Value(nan)), "NaN equals NaN");

    double inf = std::numeric_limits<double>::infinity();
    Tolerance wide(1e300);
    result.assert_false(comparer.are_equal(Value(inf), Value(1e308), wide),
                        "Infinite expected requires an exact match");

    Tolerance linear(0.1);
    result.assert_true(comparer.are_equal(Value(1.0), Value(1.05), linear),
                       "Linear tolerance accepts a close value");
    Tolerance tight(0.01);
    result.assert_false(comparer.are_equal(Value(1.0), Value(1.05), tight),
                        "Linear tolerance rejects a distant value");

    Tolerance percent = Tolerance(5).percent();
    result.assert_true(comparer.are_equal(Value(100.0), Value(104.0), percent),
                       "Percent tolerance relative to expected");

    EqualityComparer lenient({}, Tolerance(0.5));
    result.assert_true(lenient.are_equal(Value(1.0), Value(1.4)),
                       "Unset tolerance is replaced by the default for floating values");
    result.assert_false(lenient.are_equal(Value::from(1), Value::from(2)),
                        "Default floating-point tolerance does not apply to integers");
    Tolerance exact = Tolerance::exact();
    result.assert_false(lenient.are_equal(Value(1.0), Value(1.4), exact),
                        "Explicit exact tolerance is never replaced");

    result.print_summary();
    return result.all_passed();
}

static bool test_strings_and_primitives() {
    TestTally result;
    EqualityComparer comparer;
    EqualityComparer ignoring_case(EqualityOptions{.ignore_case = true});

    result.assert_true(comparer.are_equal(Value::from("abc"), Value::from("abc")), "Equal strings");
    result.assert_false(comparer.are_equal(Value::from("abc"), Value::from("ABC")),
                        "Case matters by default");
    result.assert_true(ignoring_case.are_equal(Value::from("abc"), Value::from("ABC")),
                       "Case ignored when requested");
    result.assert_true(comparer.are_equal(Value(true), Value(true)), "Equal booleans");
    result.assert_false(comparer.are_equal(Value(true), Value::from(1)),
                        "Boolean never equals a number");
    result.assert_true(comparer.are_equal(Value{}, Value{}), "Null equals null");
    result.assert_false(comparer.are_equal(Value{}, Value::from(0)), "Null differs from zero");

    result.assert_throws<assertlab::core::ToleranceError>(
        [&] {
            Tolerance tolerance(0.1);
            (void)comparer.are_equal(Value::from("a"), Value::from("a"), tolerance);
        },
        "Tolerance on strings is a configuration error");

    result.print_summary();
    return result.all_passed();
}

static bool test_sequences() {
    TestTally result;
    EqualityComparer comparer;

    Value expected = Value::from(std::vector<int>{1, 2, 3});
    result.assert_true(comparer.are_equal(expected, Value::from(std::vector<int>{1, 2, 3})),
                       "Equal sequences");
    result.assert_false(comparer.are_equal(expected, Value::from(std::vector<int>{1, 3, 2})),
                        "Order matters by default");
    result.assert_eq(std::size_t{1}, comparer.failure_points().size(), "One failure point");
    result.assert_eq(std::size_t{1}, comparer.failure_points().front().position,
                     "Failure at index 1");

    result.assert_false(comparer.are_equal(Value::from(std::vector<int>{1, 2}), expected),
                        "Different lengths differ");
    const auto& point = comparer.failure_points().front();
    result.assert_eq(std::size_t{2}, point.position, "Length mismatch reported at shorter end");
    result.assert_false(point.expected.has_value(), "No expected item past the end");
    result.assert_true(point.actual.has_value() && point.actual->as_integer() == 3,
                       "Extra actual item recorded");

    Value outer = Value::from(std::vector<std::vector<int>>{{1, 2}, {3, 4}});
    result.assert_false(
        comparer.are_equal(outer, Value::from(std::vector<std::vector<int>>{{1, 2}, {3, 5}})),
        "Nested difference detected");
    result.assert_eq(std::size_t{2}, comparer.failure_points().size(),
                     "Nested failure points recorded outermost first");
    result.assert_eq(std::size_t{1}, comparer.failure_points()[1].position, "Inner index");

    EqualityComparer any_order(EqualityOptions{.in_any_order = true});
    result.assert_true(any_order.are_equal(expected, Value::from(std::vector<int>{3, 1, 2})),
                       "Permutation matches in any order");
    result.assert_false(any_order.are_equal(Value::from(std::vector<int>{1, 1, 2}),
                                            Value::from(std::vector<int>{1, 2, 2})),
                        "Each expected item is consumed once");
    result.assert_false(any_order.are_equal(expected, Value::from(std::vector<int>{1, 2, 3, 3})),
                        "Cardinality mismatch in any order");

    // 1.1 lies within tolerance of both 1.0 and 1.2; only pairing it with 1.2 leaves a
    // partner for 1.0
    Tolerance close = Tolerance(0.15);
    result.assert_true(any_order.are_equal(Value::from(std::vector{1.0, 1.2}),
                                           Value::from(std::vector{1.1, 1.0}), close),
                       "Any-order pairing moves an earlier match aside");
    Tolerance same = Tolerance(0.15);
    result.assert_false(any_order.are_equal(Value::from(std::vector{1.0, 1.5}),
                                            Value::from(std::vector{1.1, 1.1}), same),
                        "Expected item without any partner");

    result.assert_true(comparer.are_equal(Value::from(std::unordered_set<int>{1, 2, 3}),
                                          Value::from(std::vector<int>{3, 2, 1})),
                       "Unordered container compares in any order");

    result.print_summary();
    return result.all_passed();
}

static bool test_tuples_dictionaries_records() {
    TestTally result;
    EqualityComparer comparer;

    result.assert_true(comparer.are_equal(Value::from(std::tuple(1, std::string("a"), 2.0)),
                                          Value::from(std::tuple(1, std::string("a"), 2.0))),
                       "Equal tuples");
    result.assert_false(comparer.are_equal(Value::from(std::tuple(1, 2)),
                                           Value::from(std::tuple(1, 3))),
                        "Tuples differing in one position");
    result.assert_false(comparer.are_equal(Value::from(std::tuple(1, 2)),
                                           Value::from(std::tuple(1, 2, 3))),
                        "Tuples of different arity are unequal");
    result.assert_true(comparer.are_equal(Value::from(std::pair(1, 2)),
                                          Value::from(std::pair(1, 2))),
                       "Equal pairs");
    result.assert_false(comparer.are_equal(Value::from(std::pair(1, 2)),
                                           Value::from(std::tuple(1, 2))),
                        "Pair and tuple are different shapes");

    std::map<std::string, int> ordered{{"a", 1}, {"b", 2}};
    std::unordered_map<std::string, int> hashed{{"b", 2}, {"a", 1}};
    result.assert_true(comparer.are_equal(Value::from(ordered), Value::from(hashed)),
                       "Dictionaries compare by key regardless of order");
    hashed["b"] = 3;
    result.assert_false(comparer.are_equal(Value::from(ordered), Value::from(hashed)),
                        "Dictionary value difference detected");

    result.assert_true(comparer.are_equal(Value::from(Point{1, 2}), Value::from(Point{1, 2})),
                       "Records compared member by member");
    result.assert_false(comparer.are_equal(Value::from(Point{1, 2}), Value::from(Point{2, 1})),
                        "Record member difference detected");

    result.print_summary();
    return result.all_passed();
}

static bool test_structural() {
    TestTally result;
    EqualityComparer comparer;

    result.assert_true(comparer.are_equal(Value::from(Money(5.0, "EUR")),
                                          Value::from(Money(5.0, "EUR"))),
                       "Structural values decide equality");
    result.assert_false(comparer.are_equal(Value::from(Money(5.0, "EUR")),
                                           Value::from(Money(5.0, "USD"))),
                        "Structural difference detected");
    result.assert_true(comparer.are_equal(Value::from(Money(5.0, "USD")),
                                          Value::from(Money(5.0, "*"))),
                       "Either direction accepting is enough");

    Tolerance tolerance(0.5);
    result.assert_true(comparer.are_equal(Value::from(Money(5.0, "EUR")),
                                          Value::from(Money(5.3, "EUR")), tolerance),
                       "Element comparer carries the tolerance");

    EqualityComparer as_collection(EqualityOptions{.compare_as_collection = true});
    result.assert_true(
        as_collection.are_equal(Value::from(Money(5.0, "EUR")),
                                Value::sequence({Value(5.0), Value(std::string("EUR"))})),
        "Compare as collection uses exposed elements");

    result.print_summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running Comparer Tests" << std::endl;
    std::cout << "======================" << std::endl;

    bool all_tests_passed = true;

    try {
        std::cout << "\nTest: Value Conversion\n";
        all_tests_passed &= test_value_conversion();

        std::cout << "\nTest: Reflexivity and Cycles\n";
        all_tests_passed &= test_reflexivity_and_cycles();

        std::cout << "\nTest: Cycle Ownership\n";
        all_tests_passed &= test_cycle_ownership();

        std::cout << "\nTest: Numerics\n";
        all_tests_passed &= test_numerics();

        std::cout << "\nTest: Strings and Primitives\n";
        all_tests_passed &= test_strings_and_primitives();

        std::cout << "\nTest: Sequences\n";
        all_tests_passed &= test_sequences();

        std::cout << "\nTest: Tuples, Dictionaries and Records\n";
        all_tests_passed &= test_tuples_dictionaries_records();

        std::cout << "\nTest: Structural Equality\n";
        all_tests_passed &= test_structural();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return all_tests_passed ? 0 : 1;
}
