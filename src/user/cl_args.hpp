#pragma once

#include <batchgrader/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// Command line of one of the two executables, parsed with argparse into an options struct
///
/// \tparam OptionsT ``ProgramOptions`` for the host driver, ``RunnerOptions`` for the in-sandbox grader
template <typename OptionsT>
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// \returns the parsed and validated options, or a message saying what is wrong with the arguments
    Expected<OptionsT, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Declares one argument per field of OptionsT
    void setup_parser();

    /// Program name shown in usage messages
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    OptionsT opts_buffer_ = {};
};

/// Parses and validates ``args``; prints the error and help message and exits with ``exit_code`` on failure
template <typename OptionsT>
OptionsT parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

// Defined, and instantiated for both option types, in cl_args.cpp
template <>
void CommandLineArgs<ProgramOptions>::setup_parser();

template <>
void CommandLineArgs<RunnerOptions>::setup_parser();

} // namespace batchgrader
