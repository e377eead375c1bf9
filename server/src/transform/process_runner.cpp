#include "chunkyard/server/transform/process_runner.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <deque>
#include <memory>
#include <stdexcept>

#include <sys/wait.h>

#include <spdlog/spdlog.h>

namespace chunkyard::server::transform
{

    namespace
    {
        constexpr std::size_t kTailLines = 20;

        std::string join_command(const std::vector<std::string> &argv)
        {
            std::string command;
            for (const auto &argument : argv)
            {
                if (!command.empty())
                {
                    command += ' ';
                }
                command += shell_quote(argument);
            }
            return command;
        }
    } // namespace

    std::string shell_quote(std::string_view value)
    {
        std::string quoted = "'";
        for (const char c : value)
        {
            if (c == '\'')
            {
                quoted += "'\\''";
            }
            else
            {
                quoted += c;
            }
        }
        quoted += '\'';
        return quoted;
    }

    ProcessResult run_process(const std::vector<std::string> &argv, const LineHandler &on_line,
                              const std::string &working_directory)
    {
        if (argv.empty())
        {
            throw std::invalid_argument("run_process needs a program");
        }
        std::string command = join_command(argv) + " 2>&1";
        if (!working_directory.empty())
        {
            command = "cd " + shell_quote(working_directory) + " && " + command;
        }
        spdlog::debug("Running: {}", command);

        std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
        if (!pipe)
        {
            throw std::runtime_error("popen() failed for " + argv.front());
        }

        std::array<char, 4096> buffer{};
        std::string line;
        std::deque<std::string> tail;
        const auto emit = [&]()
        {
            if (on_line)
            {
                on_line(line);
            }
            tail.push_back(std::move(line));
            if (tail.size() > kTailLines)
            {
                tail.pop_front();
            }
            line.clear();
        };

        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr)
        {
            line += buffer.data();
            if (!line.empty() && line.back() == '\n')
            {
                line.pop_back();
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                emit();
            }
        }
        if (!line.empty())
        {
            emit();
        }

        const int status = pclose(pipe.release());
        ProcessResult result;
        result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        for (const auto &entry : tail)
        {
            result.output_tail += entry + "\n";
        }
        return result;
    }

    ProcessResult run_checked(const std::vector<std::string> &argv, const LineHandler &on_line,
                              std::initializer_list<int> accepted, const std::string &working_directory)
    {
        auto result = run_process(argv, on_line, working_directory);
        if (std::find(accepted.begin(), accepted.end(), result.exit_code) == accepted.end())
        {
            auto diagnostic = result.output_tail;
            while (!diagnostic.empty() && diagnostic.back() == '\n')
            {
                diagnostic.pop_back();
            }
            throw std::runtime_error(argv.front() + " exited with status " + std::to_string(result.exit_code) +
                                     (diagnostic.empty() ? std::string() : ": " + diagnostic));
        }
        return result;
    }

} // namespace chunkyard::server::transform
