/// @file team.hpp
/// @brief Team scope types and the interactive team selection contract.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xmit_cpp {

/// Where users manage teams when the server does not say.
inline constexpr std::string_view default_team_manage_url = "https://xmit.co/admin";

/// A team the credential may publish under.
struct Team {
    std::string id;
    std::optional<std::string> name;

    auto operator==(const Team&) const -> bool = default;
};

/// Teams available to a credential plus the team management URL.
struct TeamList {
    std::vector<Team> teams;
    std::string manage_url{default_team_manage_url};

    auto operator==(const TeamList&) const -> bool = default;
};

/// The user picked a team.
struct TeamSelected {
    std::string team_id;
    auto operator==(const TeamSelected&) const -> bool = default;
};

/// The user asked to fetch the team list again.
struct RefreshTeamList {
    auto operator==(const RefreshTeamList&) const -> bool = default;
};

/// The user wants to create a team before choosing.
struct CreateNewTeam {
    auto operator==(const CreateNewTeam&) const -> bool = default;
};

/// The user declined to choose a team.
struct TeamSelectionCancelled {
    auto operator==(const TeamSelectionCancelled&) const -> bool = default;
};

/// Everything a team resolver can answer. Visit exhaustively with overload{}.
using TeamSelectionResult = std::variant<TeamSelected, RefreshTeamList,
                                         CreateNewTeam, TeamSelectionCancelled>;

/// Interactive resume channel, called on the publishing thread while the
/// suggest step is paused. An empty function means no interactive
/// selection is available.
using TeamResolver = std::function<TeamSelectionResult(const TeamList&)>;

}  // namespace xmit_cpp
