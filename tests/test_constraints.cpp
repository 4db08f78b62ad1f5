#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <assertlab/constraints/message_writer.hpp>
#include <assertlab/constraints/syntax.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

#include "test_helper.hpp"

using assertlab::core::ConfigurationError;
using assertlab::core::Value;
using namespace assertlab::constraints;

namespace {

struct Person {
    static constexpr std::string_view type_name = "Person";
    std::string name;
    int age = 0;

    auto members() const {
        return std::make_tuple(assertlab::core::member("name", name),
                               assertlab::core::member("age", age));
    }
};

struct Serializable : assertlab::core::Attribute {
    static constexpr std::string_view type_name = "Serializable";
    std::string format = "json";

    auto members() const { return std::make_tuple(assertlab::core::member("format", format)); }
};

struct Obsolete : assertlab::core::Attribute {
    static constexpr std::string_view type_name = "Obsolete";

    auto members() const { return std::tuple<>(); }
};

struct Document {
    static constexpr std::string_view type_name = "Document";
    std::string title;

    auto members() const { return std::make_tuple(assertlab::core::member("title", title)); }
    auto attributes() const { return std::make_tuple(Serializable{}); }
};

template <typename T>
bool passes(const ConstraintSource auto& constraint, const T& actual) {
    return constraint.resolve()->apply_to_value(actual)->is_success();
}

template <typename T>
std::string message_for(const ConstraintSource auto& constraint, const T& actual) {
    auto result = constraint.resolve()->apply_to_value(actual);
    MessageWriter writer;
    result->write_message_to(writer);
    return writer.str();
}

} // anonymous namespace

static bool test_equality() {
    TestTally result;

    result.assert_true(passes(Is::equal_to(5), 5), "Equal integers pass");
    result.assert_false(passes(Is::equal_to(5), 6), "Different integers fail");
    result.assert_true(passes(Is::equal_to(5.0).within(0.1), 5.05), "Within linear tolerance");
    result.assert_true(passes(Is::equal_to(100.0).within(5).percent(), 104.0),
                       "Within percent tolerance");
    result.assert_true(passes(Is::equal_to("Hello").ignore_case(), "hELLO"), "Ignoring case");
    result.assert_true(passes(Is::equal_to(std::vector{1, 2, 3}).in_any_order(),
                              std::vector{3, 2, 1}),
                       "Collections in any order");
    result.assert_true(passes(Is::equivalent_to(std::vector{1, 2, 2}), std::vector{2, 1, 2}),
                       "Equivalent collections");
    result.assert_false(passes(Is::equivalent_to(std::vector{1, 2, 2}), std::vector{2, 1, 1}),
                        "Equivalent respects multiplicity");

    result.assert_eq(std::string("5"), Is::equal_to(5).resolve()->description(),
                     "Plain description");
    result.assert_eq(std::string("5.0d +/- 0.1"),
                     Is::equal_to(5.0).within(0.1).resolve()->description(),
                     "Description with tolerance");
    result.assert_eq(std::string("\"a\", ignoring case"),
                     Is::equal_to("a").ignore_case().resolve()->description(),
                     "Description with ignore case");
    result.assert_eq(std::string("equivalent to < 1, 2 >"),
                     Is::equivalent_to(std::vector{1, 2}).resolve()->description(),
                     "Equivalent description");

    result.assert_throws<ConfigurationError>([] { (void)Is::equal_to(1.0).within(1).within(2); },
                                             "Within may appear once");
    result.assert_throws<ConfigurationError>([] { (void)Is::equal_to(1.0).percent(); },
                                             "A unit requires a preceding within");

    auto described = Is::equal_to(5.0);
    result.assert_eq(std::string("5.0d"), described.resolve()->description(),
                     "Description read before any modifier");
    result.assert_throws<ConfigurationError>([&] { (void)described.within(0.1); },
                                             "Modifier after the description was read");
    result.assert_eq(std::string("5.0d"), described.resolve()->description(),
                     "Description unchanged by the rejected modifier");
    result.assert_false(passes(described, 5.05), "Rejected tolerance is not applied");

    result.print_summary();
    return result.all_passed();
}

static bool test_equality_messages() {
    TestTally result;

    std::string simple = message_for(Is::equal_to(5), 6);
    result.assert_eq(std::string("  Expected: 5\n  But was:  6"), simple, "Expected and actual lines");

    std::string text = message_for(Is::equal_to("hello"), "hallo");
    result.assert_contains(text, "String lengths are both 5. Strings differ at index 1.",
                           "String difference index");
    std::string longer = message_for(Is::equal_to("abc"), "abcd");
    result.assert_contains(longer, "Expected string length 3 but was 4. Strings differ at index 3.",
                           "String length difference");

    std::string items = message_for(Is::equal_to(std::vector{1, 2, 3}), std::vector{1, 2, 4});
    result.assert_contains(items, "Values differ at index [2]", "Collection difference index");
    result.assert_contains(items, "    Expected: 3", "Differing expected item");
    result.assert_contains(items, "    But was:  4", "Differing actual item");

    std::string missing = message_for(Is::equal_to(std::vector{1, 2, 3}), std::vector{1, 2});
    result.assert_contains(missing, "Expected has 3 items, actual has 2 items", "Item counts");
    result.assert_contains(missing, "    Missing:  3", "Missing item");

    std::string nested = message_for(Is::equal_to(std::vector<std::vector<int>>{{1}, {2, 3}}),
                                     std::vector<std::vector<int>>{{1}, {2, 4}});
    result.assert_contains(nested, "Values differ at index [1, 1]", "Nested indices");

    result.print_summary();
    return result.all_passed();
}

static bool test_comparisons() {
    TestTally result;

    result.assert_true(passes(Is::greater_than(5), 6), "6 > 5");
    result.assert_false(passes(Is::greater_than(5), 5), "5 is not > 5");
    result.assert_true(passes(Is::greater_than_or_equal_to(5), 5), "5 >= 5");
    result.assert_true(passes(Is::less_than(5.5), 5), "Mixed integer and double");
    result.assert_true(passes(Is::less_than_or_equal_to(5u), 5), "Mixed signed and unsigned");
    result.assert_true(passes(Is::less_than(10).within(1), 10.5),
                       "Tolerance widens the upper bound");
    result.assert_true(passes(Is::greater_than(10).within(1), 9.5),
                       "Tolerance widens the lower bound");
    result.assert_true(passes(Is::greater_than("apple"), "banana"), "Strings compare ordinally");

    using namespace std::chrono_literals;
    result.assert_true(passes(Is::less_than(std::chrono::milliseconds(100)), 99ms),
                       "Durations compare");

    result.assert_false(passes(Is::greater_than(5), nullptr), "Null actual fails");
    result.assert_throws<ConfigurationError>([] { (void)passes(Is::greater_than(5), "x"); },
                                             "Incomparable kinds are a configuration error");
    result.assert_throws<ConfigurationError>([] { (void)Is::greater_than(5).ignore_case(); },
                                             "Comparisons do not take ignore_case");

    result.assert_eq(std::string("greater than 5 within +/- 1"),
                     Is::greater_than(5).within(1).resolve()->description(),
                     "Comparison description");

    result.print_summary();
    return result.all_passed();
}

static bool test_strings() {
    TestTally result;

    result.assert_true(passes(Does::start_with("he"), "hello"), "Starts with");
    result.assert_false(passes(Does::start_with("He"), "hello"), "Starts with is case sensitive");
    result.assert_true(passes(Does::start_with("He").ignore_case(), "hello"),
                       "Starts with ignoring case");
    result.assert_true(passes(Does::end_with("lo"), "hello"), "Ends with");
    result.assert_true(passes(Does::contain("ell"), "hello"), "Contains substring");
    result.assert_true(passes(Does::match("^h.l+o$"), "hello"), "Regex match");
    result.assert_true(passes(Does::match("WORLD").ignore_case(), "hello world"),
                       "Regex ignoring case");
    result.assert_false(passes(Does::end_with("x"), nullptr), "Null actual fails");

    result.assert_throws<ConfigurationError>([] { (void)passes(Does::start_with("1"), 12); },
                                             "Non-string actual is a configuration error");
    result.assert_throws<ConfigurationError>([] { (void)Does::match("(unclosed"); },
                                             "Invalid pattern is a configuration error");
    result.assert_throws<ConfigurationError>([] { (void)Does::end_with("x").within(1); },
                                             "String constraints take no tolerance");

    result.assert_eq(std::string("String starting with \"he\""),
                     Does::start_with("he").resolve()->description(), "Starts with description");
    result.assert_eq(std::string("String matching \"a+\", ignoring case"),
                     Does::match("a+").ignore_case().resolve()->description(),
                     "Regex description");

    result.print_summary();
    return result.all_passed();
}

static bool test_paths() {
    TestTally result;

    result.assert_true(passes(Is::same_path("/a/b/../c"), "/a/c"), "Same path after folding ..");
    result.assert_true(passes(Is::same_path("/a/./c/"), "/a//c"), "Same path after cleanup");
    result.assert_true(passes(Is::same_path("C:\\x\\y"), "C:/x/y"), "Either separator");
    result.assert_false(passes(Is::same_path("/A/b"), "/a/b"), "Case sensitive by default");
    result.assert_true(passes(Is::same_path("/A/b").ignore_case(), "/a/b"), "Ignoring case");
    result.assert_true(passes(Is::sub_path_of("/a"), "/a/b"), "Sub path");
    result.assert_false(passes(Is::sub_path_of("/a"), "/a"), "A path is not its own sub path");
    result.assert_false(passes(Is::sub_path_of("/a"), "/ab"), "Prefix is not a sub path");
    result.assert_true(passes(Is::same_path_or_under("/a"), "/a"), "Same path or under: same");
    result.assert_true(passes(Is::same_path_or_under("/a"), "/a/b/c"), "Same path or under: under");
    result.assert_true(passes(Is::same_path("/../a"), "/a"), "Rooted path drops leading ..");

    result.assert_eq(std::string("Subpath of \"/a\""), Is::sub_path_of("/a").resolve()->description(),
                     "Sub path description");

    result.print_summary();
    return result.all_passed();
}

static bool test_basic_leaves() {
    TestTally result;

    result.assert_true(passes(Is::null(), nullptr), "Null");
    result.assert_false(passes(Is::null(), 0), "Zero is not null");
    result.assert_true(passes(Is::true_(), true), "True");
    result.assert_true(passes(Is::false_(), false), "False");
    result.assert_false(passes(Is::true_(), 1), "One is not true");
    result.assert_true(passes(Is::empty(), ""), "Empty string");
    result.assert_true(passes(Is::empty(), std::vector<int>{}), "Empty vector");
    result.assert_true(passes(Is::empty(), std::map<int, int>{}), "Empty map");
    result.assert_false(passes(Is::empty(), std::vector<int>{1}), "Non-empty vector");
    result.assert_throws<ConfigurationError>([] { (void)passes(Is::empty(), 5); },
                                             "Empty of a number is a configuration error");

    result.assert_true(passes(Is::any_of(1, 2, 3), 2), "Any of");
    result.assert_false(passes(Is::any_of(1, 2, 3), 4), "None of");
    result.assert_true(passes(Is::any_of("a", "b").ignore_case(), "B"), "Any of ignoring case");

    result.assert_true(passes(Has::member(2), std::vector{1, 2, 3}), "Collection member");
    result.assert_true(passes(Has::member(2.0).within(0.1), std::vector{1.0, 2.05}),
                       "Member with tolerance");
    result.assert_true(passes(Does::contain(2), std::vector{1, 2}), "Contain on collection");
    result.assert_throws<ConfigurationError>([] { (void)passes(Has::member(1), 1); },
                                             "Member of a scalar is a configuration error");
    result.assert_throws<ConfigurationError>([] { (void)Is::null().ignore_case(); },
                                             "Null takes no modifiers");

    result.print_summary();
    return result.all_passed();
}

static bool test_prefixes() {
    TestTally result;

    result.assert_true(passes(Is::not_().null(), 5), "Not null");
    result.assert_true(passes(Is::not_().equal_to(5), 6), "Not equal");
    result.assert_true(passes(Is::all().greater_than(0), std::vector{1, 2, 3}), "All positive");
    result.assert_false(passes(Is::all().greater_than(1), std::vector{1, 2, 3}), "Not all > 1");
    result.assert_true(passes(Has::some().equal_to(3), std::vector{1, 2, 3}), "Some item");
    result.assert_true(passes(Has::none().equal_to(9), std::vector{1, 2, 3}), "No item");
    result.assert_true(passes(Is::all().not_().null(), std::vector{1, 2}), "All not null");
    result.assert_true(passes(Is::all().greater_than(0), std::vector<int>{}),
                       "All items of an empty collection");

    result.assert_eq(std::string("not null"), Is::not_().null().resolve()->description(),
                     "Not description");
    result.assert_eq(std::string("not equal to 5"), Is::not_().equal_to(5).resolve()->description(),
                     "Prefix equal description");
    result.assert_eq(std::string("all items greater than 0"),
                     Is::all().greater_than(0).resolve()->description(), "All description");
    result.assert_eq(std::string("some item equal to 3"),
                     Has::some().equal_to(3).resolve()->description(), "Some description");

    std::map<std::string, int> scores{{"a", 1}};
    result.assert_true(passes(Has::some().equal_to(std::pair<std::string, int>("a", 1)), scores),
                       "Dictionary entries are pairs");

    result.print_summary();
    return result.all_passed();
}

static bool test_properties_and_attributes() {
    TestTally result;
    Person adult{"Ann", 30};

    result.assert_true(passes(Has::property("age").greater_than(17), adult), "Property value");
    result.assert_false(passes(Has::property("age").less_than(17), adult), "Property mismatch");
    result.assert_true(passes(Has::property("name"), adult), "Property exists");
    result.assert_false(passes(Has::property("email"), adult), "Property missing");
    result.assert_true(passes(Has::property("name").and_().property("age"), adult),
                       "Two existence checks joined");
    result.assert_throws<ConfigurationError>(
        [&] { (void)passes(Has::property("email").equal_to("x"), adult); },
        "Missing property with a constraint is a configuration error");
    result.assert_throws<ConfigurationError>([] { (void)passes(Has::property("age"), nullptr); },
                                             "Property lookup on null");

    auto failed = Has::property("age").equal_to(31).resolve()->apply_to_value(adult);
    result.assert_true(failed->actual_value().as_integer() == 30,
                       "Property result reports the member value");

    Document document{"Release notes"};
    result.assert_true(passes(Has::attribute<Serializable>(), document), "Attribute exists");
    result.assert_false(passes(Has::attribute<Obsolete>(), document), "Attribute absent");
    result.assert_true(
        passes(Has::attribute<Serializable>().property("format").equal_to("json"), document),
        "Constraint on attribute member");
    result.assert_throws<ConfigurationError>(
        [&] { (void)passes(Has::attribute<Obsolete>().property("x"), document); },
        "Constraint on a missing attribute is a configuration error");
    result.assert_throws<ConfigurationError>([] { (void)Has::attribute<Person>(); },
                                             "Non-attribute type is rejected");

    result.assert_eq(std::string("type with attribute <Serializable>"),
                     Has::attribute<Serializable>().resolve()->description(),
                     "Attribute existence description");

    result.print_summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running Constraint Tests" << std::endl;
    std::cout << "========================" << std::endl;

    bool all_tests_passed = true;

    try {
        std::cout << "\nTest: Equality\n";
        all_tests_passed &= test_equality();

        std::cout << "\nTest: Equality Messages\n";
        all_tests_passed &= test_equality_messages();

        std::cout << "\nTest: Comparisons\n";
        all_tests_passed &= test_comparisons();

        std::cout << "\nTest: Strings\n";
        all_tests_passed &= test_strings();

        std::cout << "\nTest: Paths\n";
        all_tests_passed &= test_paths();

        std::cout << "\nTest: Basic Leaves\n";
        all_tests_passed &= test_basic_leaves();

        std::cout << "\nTest: Prefix Constraints\n";
        all_tests_passed &= test_prefixes();

        std::cout << "\nTest: Properties and Attributes\n";
        all_tests_passed &= test_properties_and_attributes();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return all_tests_passed ? 0 : 1;
}
