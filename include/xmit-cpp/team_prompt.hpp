/// @file team_prompt.hpp
/// @brief TeamPrompt: line-based interactive team selection for terminal hosts.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/team.hpp>

#include <chrono>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace xmit_cpp {

/// A TeamResolver that lists the teams on output and reads the answer
/// from input_fd: a team number, "r" to refresh, "c" to create a team,
/// and an empty line or "q" to cancel.
///
/// Reads never block for longer than the poll interval, so setting token
/// makes a pending prompt answer TeamSelectionCancelled promptly. End of
/// input also cancels. When console is given it is held while writing
/// and released while waiting for input.
///
/// @code
/// auto prompt = xmit_cpp::TeamPrompt{STDIN_FILENO, stdout, handle.token(), &console};
/// publisher.publish(request, channel, handle.token(), prompt);
/// @endcode
class TeamPrompt {
public:
    TeamPrompt(int input_fd, std::FILE* output, CancellationToken token,
               std::mutex* console = nullptr,
               std::chrono::milliseconds poll_interval = std::chrono::milliseconds{100})
        : input_fd_{input_fd}, output_{output}, token_{std::move(token)},
          console_{console}, poll_interval_{poll_interval} {}

    auto operator()(const TeamList& list) -> TeamSelectionResult;

private:
    // Next line without its terminator, or nullopt on end of input or cancel.
    auto read_line() -> std::optional<std::string>;

    template <typename... Args>
    void print(const char* format, Args... args);

    int input_fd_;
    std::FILE* output_;
    CancellationToken token_;
    std::mutex* console_;
    std::chrono::milliseconds poll_interval_;
    std::string pending_;
};

}  // namespace xmit_cpp
