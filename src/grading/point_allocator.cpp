#include <batchgrader/grading/point_allocator.hpp>

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/test_case.hpp>
#include <batchgrader/logging.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

namespace {

bool is_unspecified(const TestCase& test_case) {
    return !test_case.points.has_value();
}

} // namespace

std::vector<TestCase> resolve_points(double total_value, std::vector<TestCase> cases, std::string_view test_file) {
    using Kind = AllocationError::Kind;

    if (!std::isfinite(total_value) || total_value <= 0) {
        throw AllocationError(Kind::InvalidValue, std::string{test_file},
                              fmt::format("Total value must be a positive number (got {})", total_value));
    }

    auto explicit_points = cases                                                 //
                           | ranges::views::filter(std::not_fn(is_unspecified)) //
                           | ranges::views::transform([](const TestCase& tc) { return *tc.points; });

    if (ranges::any_of(explicit_points, [](double pts) { return !std::isfinite(pts) || pts < 0; })) {
        throw AllocationError(Kind::InvalidValue, std::string{test_file},
                              "Individual test case point values must be non-negative numbers");
    }

    const double total_specified = ranges::accumulate(explicit_points, 0.0);
    const double tolerance = POINT_EPSILON * std::max(1.0, total_value);

    if (total_specified > total_value + tolerance) {
        throw AllocationError(Kind::Overallocated, std::string{test_file},
                              fmt::format("Individual test case point values ({}) exceed total question value ({})",
                                          total_specified, total_value));
    }

    const double pts_left = std::max(0.0, total_value - total_specified);
    const auto num_unspecified = ranges::count_if(cases, is_unspecified);

    if (num_unspecified == 0) {
        if (pts_left > tolerance) {
            throw AllocationError(Kind::UnallocatedRemainder, std::string{test_file},
                                  fmt::format("{} point(s) remain, but every test case already specifies its points",
                                              pts_left));
        }

        return cases;
    }

    const double pts_per_unspecified_case = pts_left / static_cast<double>(num_unspecified);

    LOG_TRACE("{:?}: {} point(s) over {} unspecified case(s) -> {} each", test_file, pts_left, num_unspecified,
              pts_per_unspecified_case);

    for (TestCase& test_case : cases) {
        if (is_unspecified(test_case)) {
            test_case.points = pts_per_unspecified_case;
        }
    }

    return cases;
}

} // namespace batchgrader
