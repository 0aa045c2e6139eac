/// @file task_runner.hpp
/// @brief Running project tasks (the pre-publish build step).

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/project.hpp>

#include <functional>
#include <string_view>

namespace xmit_cpp {

/// Receives task output as it is produced (stdout and stderr interleaved).
using TaskOutputCallback = std::function<void(std::string_view)>;

/// Runs a project task to completion.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    /// Run task in project and return its exit code.
    ///
    /// @throws PublishError{build_failed} if the task cannot be started,
    ///         PublishError{cancelled} if token is set while it runs (the
    ///         process is terminated first).
    virtual auto run(const Project& project,
                     const Task& task,
                     const TaskOutputCallback& on_output,
                     const CancellationToken& token) -> int = 0;
};

/// Runs the task command through /bin/sh -c in the project directory, with
/// <project>/node_modules/.bin prepended to PATH.
class ShellTaskRunner : public TaskRunner {
public:
    auto run(const Project& project,
             const Task& task,
             const TaskOutputCallback& on_output,
             const CancellationToken& token) -> int override;
};

}  // namespace xmit_cpp
