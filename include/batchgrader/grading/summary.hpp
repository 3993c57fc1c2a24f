#pragma once

#include <batchgrader/grading/test_file.hpp>

#include <span>
#include <string>

namespace batchgrader {

/// Human-readable report of a test file that has run: its grade, then one line per case.
/// Hidden cases show only whether they passed, never their messages.
std::string format_summary(const TestFile& test_file);

/// Reports of every file followed by the overall total
std::string format_summary(std::span<const TestFile> test_files);

} // namespace batchgrader
