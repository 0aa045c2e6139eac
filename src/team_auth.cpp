#include "team_auth.hpp"

#include <xmit-cpp/error.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <variant>

namespace xmit_cpp::detail {

namespace {

void check_cancelled(StepTracker& tracker, const CancellationToken& token) {
    if (token.is_cancelled()) {
        tracker.log("Team selection cancelled");
        token.throw_if_cancelled();
    }
}

}  // namespace

auto resolve_team(ProtocolClient& client,
                  const TeamResolver& resolver,
                  StepTracker& tracker,
                  const CancellationToken& token) -> std::string {
    if (!resolver) {
        tracker.log("Team ID required for this domain");
        tracker.log("Configure domain with team suffix (e.g., example.com@team-id)");
        tracker.log("Or provide a team resolver for interactive selection");
        throw PublishError{ErrorKind::team_auth,
            "This domain requires a team ID. Configure the domain with a team suffix "
            "or provide an interactive team resolver."};
    }

    while (true) {
        check_cancelled(tracker, token);

        tracker.log("Fetching available teams");
        auto teams = TeamList{};
        try {
            teams = client.list_teams(token);
        } catch (const PublishError& e) {
            if (e.kind() == ErrorKind::cancelled) throw;
            tracker.log(std::string{"Failed to fetch teams: "} + e.what());
            throw PublishError{ErrorKind::team_auth,
                std::string{"Failed to fetch teams: "} + e.what()};
        }
        check_cancelled(tracker, token);

        if (teams.teams.empty()) {
            tracker.log("No teams found for this account");
            tracker.log("Create a team at " + teams.manage_url);
        } else {
            tracker.log("Found " + std::to_string(teams.teams.size()) + " team(s)");
        }
        spdlog::debug("{} team(s) available, manage at {}", teams.teams.size(), teams.manage_url);

        auto result = resolver(teams);
        check_cancelled(tracker, token);

        auto selected = std::visit(overload{
            [&](const TeamSelected& s) -> std::optional<std::string> {
                if (s.team_id.empty()) {
                    throw PublishError{ErrorKind::team_auth,
                        "Team selection was cancelled. Launch cannot proceed without a team ID."};
                }
                return s.team_id;
            },
            [&](const RefreshTeamList&) -> std::optional<std::string> {
                tracker.log("Refreshing team list");
                return std::nullopt;
            },
            [&](const CreateNewTeam&) -> std::optional<std::string> {
                tracker.log("Please create a team at " + teams.manage_url);
                tracker.log("Then select \"Refresh\" to see the new team");
                return std::nullopt;
            },
            [&](const TeamSelectionCancelled&) -> std::optional<std::string> {
                if (teams.teams.empty()) {
                    throw PublishError{ErrorKind::team_auth,
                        "No teams are available for this account. Create a team at " +
                        teams.manage_url + " and try again."};
                }
                throw PublishError{ErrorKind::team_auth,
                    "Team selection was cancelled. Launch cannot proceed without a team ID."};
            },
        }, result);

        if (selected) return std::move(*selected);
    }
}

}  // namespace xmit_cpp::detail
