#pragma once

// Core value model
#include "core/errors.hpp"
#include "core/tolerance.hpp"
#include "core/value.hpp"
#include "core/value_format.hpp"

// Equality comparers
#include "comparers/equality_comparer.hpp"

// Constraints and fluent syntax
#include "constraints/basic.hpp"
#include "constraints/binary.hpp"
#include "constraints/comparison.hpp"
#include "constraints/equality.hpp"
#include "constraints/path.hpp"
#include "constraints/prefix.hpp"
#include "constraints/string.hpp"
#include "constraints/syntax.hpp"

// Execution context
#include "context/execution_context.hpp"
#include "context/test_result.hpp"

// Assertions
#include "assert/assert.hpp"

// Configuration
#include "config/config.hpp"

/**
 * @file assertlab.hpp
 * @brief Main header for assertlab - a constraint-based assertion engine for C++23
 *
 * Assertions are expressed as constraint trees built with a fluent grammar and
 * evaluated against host-neutral values. Outcomes are recorded on the execution
 * context that is current for the calling flow.
 *
 * Basic usage:
 * @code
 * #include <assertlab/assertlab.hpp>
 * using namespace assertlab;
 * using namespace assertlab::constraints;
 *
 * Assert::that(0.1 + 0.2, Is::equal_to(0.3).within(1e-9));
 * Assert::that(std::vector{1, 2, 3}, Is::equivalent_to(std::vector{3, 2, 1}));
 * Assert::that(42, Is::less_than(10).or_().equal_to(42));
 *
 * Assert::multiple([] {
 *     Assert::that(std::string("hello"), Does::start_with("he"));
 *     Assert::that(5, Is::greater_than(3));
 * });
 * @endcode
 *
 * The TBB-backed parallel executor is not included here; include
 * <assertlab/parallel/tbb_context.hpp> from builds that define ASSERTLAB_HAVE_TBB.
 */

namespace assertlab {

/// Current version
constexpr const char* VERSION = "0.1.0";

/// Common type aliases
namespace types {
using Value = core::Value;
using Tolerance = core::Tolerance;
using ConstraintPtr = constraints::ConstraintPtr;
using ExecutionContext = context::ExecutionContext;
} // namespace types

} // namespace assertlab
