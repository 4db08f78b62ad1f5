/**
 * @file config-based.cpp
 * @brief Configuration-driven assertion settings using TOML files
 *
 * This example loads tolerance, formatter and trace settings from a TOML file and
 * installs them on an isolated execution context, so the same assertions can run
 * with different comparison defaults without recompiling code.
 *
 * Compile with:
 *   g++ -std=c++23 -I../../include config-based.cpp -o config-based
 *
 * Run with:
 *   ./config-based example-config.toml
 */

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <assertlab/assertlab.hpp>

using namespace assertlab;
using namespace assertlab::constraints;

// Create a sample TOML configuration file
void create_sample_config(const std::string& filename) {
    std::ofstream config_file(filename);
    if (!config_file) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }

    config_file << R"(
# assertlab configuration

[tolerance]
mode = "linear"     # none, linear, percent, ulps, time_span
amount = 0.01       # milliseconds for time_span

[formatter]
max_items = 5       # items shown per collection in messages
max_string_length = 40

[trace]
level = "info"      # off, error, warning, info, debug
target = "stderr"
)";

    std::cout << "Created sample configuration file: " << filename << "\n";
}

void print_config_summary(const config::Config& cfg) {
    std::cout << "Configuration Summary:\n";
    std::cout << "=====================\n";
    std::cout << "Tolerance:          " << cfg.tolerance.mode << " " << cfg.tolerance.amount
              << "\n";
    std::cout << "Collection items:   " << cfg.formatter.max_items << "\n";
    std::cout << "String length:      " << cfg.formatter.max_string_length << "\n";
    std::cout << "Trace:              " << cfg.trace.level << " -> " << cfg.trace.target
              << "\n\n";
}

int main(int argc, char** argv) {
    std::cout << "assertlab Configuration-Based Example\n";
    std::cout << "=====================================\n\n";

    std::string config_filename;

    if (argc < 2) {
        // No config file provided, create a sample one
        config_filename = "example-config.toml";
        std::cout << "No configuration file provided. Creating sample config...\n\n";
        try {
            create_sample_config(config_filename);
        } catch (const std::exception& e) {
            std::cerr << "Error creating config file: " << e.what() << "\n";
            return 1;
        }
    } else {
        config_filename = argv[1];
    }

    std::cout << "Loading configuration from: " << config_filename << "\n\n";

    config::Config cfg;
    try {
        cfg = config::Config::from_file(config_filename);
        cfg.configure_trace();
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }

    print_config_summary(cfg);

    context::IsolatedContext isolated;
    cfg.apply_to(isolated.context());

    std::vector<double> readings{0.998, 1.004, 1.009, 0.993, 1.0, 1.001, 0.999};
    try {
        Assert::that(readings, Is::all().equal_to(1.0));
        std::cout << "All readings equal 1.0 within the configured tolerance\n";
    } catch (const core::AssertionException& e) {
        std::cout << "Readings outside the configured tolerance:\n" << e.what() << "\n";
    }

    try {
        Assert::that(readings, Is::equal_to(std::vector<double>{1.0, 1.0, 1.0}));
    } catch (const core::AssertionException& e) {
        std::cout << "\nMessage with the configured formatter limits:\n" << e.what() << "\n";
    }

    utils::InternalTrace::shutdown();
    return 0;
}
