#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace chunkyard::server::transform
{

    // Single-quotes value for /bin/sh.
    std::string shell_quote(std::string_view value);

    struct ProcessResult
    {
        int exit_code{-1};
        // Last lines of combined stdout/stderr, kept for diagnostics.
        std::string output_tail;
    };

    using LineHandler = std::function<void(std::string_view line)>;

    // Runs argv through the shell with stderr folded into stdout; on_line sees every line as it arrives.
    ProcessResult run_process(const std::vector<std::string> &argv, const LineHandler &on_line = {},
                              const std::string &working_directory = {});

    // As run_process, but throws std::runtime_error unless the exit code is one of accepted.
    ProcessResult run_checked(const std::vector<std::string> &argv, const LineHandler &on_line = {},
                              std::initializer_list<int> accepted = {0}, const std::string &working_directory = {});

} // namespace chunkyard::server::transform
