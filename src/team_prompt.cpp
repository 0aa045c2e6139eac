#include <xmit-cpp/team_prompt.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>

#include <poll.h>
#include <unistd.h>

namespace xmit_cpp {

template <typename... Args>
void TeamPrompt::print(const char* format, Args... args) {
    auto lock = console_ ? std::unique_lock{*console_} : std::unique_lock<std::mutex>{};
    if constexpr (sizeof...(Args) == 0) {
        std::fputs(format, output_);
    } else {
        std::fprintf(output_, format, args...);
    }
    std::fflush(output_);
}

auto TeamPrompt::read_line() -> std::optional<std::string> {
    auto buffer = std::array<char, 256>{};
    while (true) {
        if (auto newline = pending_.find('\n'); newline != std::string::npos) {
            auto line = pending_.substr(0, newline);
            pending_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        if (token_.is_cancelled()) return std::nullopt;

        auto pfd = pollfd{input_fd_, POLLIN, 0};
        auto ready = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("team prompt: poll failed, errno {}", errno);
            return std::nullopt;
        }
        if (ready == 0) continue;

        auto n = ::read(input_fd_, buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            // A last line without a newline still counts
            if (pending_.empty()) return std::nullopt;
            auto line = std::move(pending_);
            pending_.clear();
            return line;
        }
        pending_.append(buffer.data(), static_cast<std::size_t>(n));
    }
}

auto TeamPrompt::operator()(const TeamList& list) -> TeamSelectionResult {
    print("\nThis domain requires a team.\n");
    for (std::size_t i = 0; i < list.teams.size(); ++i) {
        const auto& team = list.teams[i];
        print("  %zu) %s%s%s\n", i + 1, team.name.value_or(team.id).c_str(),
              team.name ? "  " : "", team.name ? team.id.c_str() : "");
    }
    print("  r) refresh   c) create a team   q) cancel\n");

    while (true) {
        print("team> ");
        auto line = read_line();
        if (!line || line->empty() || *line == "q") return TeamSelectionCancelled{};
        if (*line == "r") return RefreshTeamList{};
        if (*line == "c") {
            print("Create a team at %s, then choose r.\n", list.manage_url.c_str());
            return CreateNewTeam{};
        }

        char* end = nullptr;
        auto index = std::strtoul(line->c_str(), &end, 10);
        if (end != line->c_str() && *end == '\0' && index >= 1 && index <= list.teams.size()) {
            return TeamSelected{list.teams[index - 1].id};
        }
        print("Enter a number between 1 and %zu, r, c or q.\n", list.teams.size());
    }
}

}  // namespace xmit_cpp
