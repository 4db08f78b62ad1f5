/**
 * @file basic-assertions.cpp
 * @brief Fluent constraints and the assertion facade
 *
 * This example builds a few constraint expressions, prints their descriptions, and
 * shows the failure messages produced when they do not hold. A multiple-assertion
 * block collects every failure before reporting.
 *
 * Compile with:
 *   g++ -std=c++23 -I../../include basic-assertions.cpp -o basic-assertions
 *
 * Run with:
 *   ./basic-assertions
 */

#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <assertlab/assertlab.hpp>

using namespace assertlab;
using namespace assertlab::constraints;

struct Order {
    static constexpr std::string_view type_name = "Order";
    std::string customer;
    double total = 0.0;
    std::vector<std::string> items;

    auto members() const {
        return std::make_tuple(core::member("customer", customer), core::member("total", total),
                               core::member("items", items));
    }
};

// Run one assertion and print whatever it reports
template <typename F>
void show(const std::string& title, F&& assertion) {
    std::cout << "--- " << title << "\n";
    try {
        assertion();
        std::cout << "passed\n\n";
    } catch (const core::MultipleAssertException& e) {
        std::cout << e.what() << "\n\n";
    } catch (const core::AssertionException& e) {
        std::cout << e.what() << "\n\n";
    }
}

int main() {
    std::cout << "assertlab Basic Assertions Example\n";
    std::cout << "==================================\n\n";

    Order order{"Ada", 41.97, {"tea", "scones", "jam"}};

    // Descriptions come straight from the constraint tree
    auto range = Is::greater_than(0).and_().less_than(10).or_().equal_to(50).resolve();
    std::cout << "Expression reads: " << range->description() << "\n\n";

    show("floating point within tolerance",
         [] { Assert::that(0.1 + 0.2, Is::equal_to(0.3).within(1e-9)); });

    show("collection in any order", [&] {
        Assert::that(order.items,
                     Is::equivalent_to(std::vector<std::string>{"jam", "tea", "scones"}));
    });

    show("property of a record",
         [&] { Assert::that(order, Has::property("total").greater_than(40.0)); });

    show("string difference", [] { Assert::that(std::string("scones"), Is::equal_to("stones")); });

    show("failing branch of an AND", [&] { Assert::that(70, range); });

    show("collection difference", [&] {
        Assert::that(order.items, Is::equal_to(std::vector<std::string>{"tea", "cake", "jam"}),
                     "order for {} changed", order.customer);
    });

    show("multiple failures reported together", [&] {
        Assert::multiple([&] {
            Assert::that(order.customer, Does::start_with("B"));
            Assert::that(order.total, Is::less_than(40));
            Assert::contains(std::string("tea"), order.items);
        });
    });

    std::map<std::string, int> stock{{"tea", 4}, {"jam", 0}};
    show("dictionary entries", [&] {
        Assert::that(stock, Has::some().equal_to(std::pair<std::string, int>("jam", 0)));
    });

    return 0;
}
