#pragma once

/** \file aliases.hpp
 *  \brief Short names for hand-built trees.
 *
 * ```cpp
 * using namespace sift::aliases;
 * Q q{AND{{Q{EQ{"Name", "bob"}}, Q{GT("Age", 30)}}}};
 * ```
 */

#include "sift/expression.hpp"

namespace sift::aliases {

using Q = query;
using Expr = expression;
using EQ = is_expr;
using NE = is_not_expr;
using GT = greater_than;
using GTE = greater_or_equal;
using LT = less_than;
using LTE = less_or_equal;
using CT = contains_expr;
using ICT = icontains_expr;
using AND = and_expr;
using OR = or_expr;
using NOT = not_expr;

} // namespace sift::aliases
