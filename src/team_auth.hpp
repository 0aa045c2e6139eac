#pragma once

// Team selection loop run while the suggest step is paused.
// Internal header — not installed.

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/client.hpp>
#include <xmit-cpp/launch_step.hpp>
#include <xmit-cpp/team.hpp>

#include <string>

namespace xmit_cpp::detail {

// Fetch teams and ask resolver until it selects one.
//
// Refresh and create answers loop back to a fresh fetch. Throws
// PublishError{team_auth} when resolver is empty, the user declines, or
// the team list cannot be fetched, and PublishError{cancelled} when token
// is set at any point of the loop.
auto resolve_team(ProtocolClient& client,
                  const TeamResolver& resolver,
                  StepTracker& tracker,
                  const CancellationToken& token) -> std::string;

}  // namespace xmit_cpp::detail
