#pragma once

/// @file chain_comparer.hpp
/// @brief Capability interface for one entry of the comparer chain

#include <optional>

#include <assertlab/comparers/comparison_state.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::comparers {

/// Definitive answer, or nullopt to defer to the next entry
using Decision = std::optional<bool>;

inline constexpr Decision abstain = std::nullopt;

/// One type-specific equality strategy
///
/// `tolerance` is the working copy for this branch of the comparison. An entry may
/// replace it (for example with a context default) but must hand copies to recursive
/// element comparisons so sibling branches never observe each other's changes.
class ChainComparer {
  public:
    virtual ~ChainComparer() = default;

    virtual Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                           ComparisonState state) = 0;

    virtual const char* name() const = 0;
};

} // namespace assertlab::comparers
