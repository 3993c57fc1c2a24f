#pragma once

#include <batchgrader/grading/test_case.hpp>

#include <string_view>
#include <vector>

namespace batchgrader {

/// Tolerance used when comparing point sums against a test file's total value
inline constexpr double POINT_EPSILON = 1e-9;

/// Resolves every case's point weight from the test file's ``total_value``.
///
/// Explicit points are kept as-is. Whatever is left of the budget is split evenly
/// between the cases that did not specify points.
///
/// \param test_file name of the owning test file; only used for error messages
///
/// \throws AllocationError (Overallocated) if the explicit points exceed ``total_value``
/// \throws AllocationError (UnallocatedRemainder) if budget remains but every case has explicit points
/// \throws AllocationError (InvalidValue) if ``total_value`` is not positive or a case has negative points
std::vector<TestCase> resolve_points(double total_value, std::vector<TestCase> cases,
                                     std::string_view test_file = "");

} // namespace batchgrader
