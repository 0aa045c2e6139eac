/// @file project.hpp
/// @brief Project configuration loaded from package.json: Project, Task, Site.

#pragma once

#include <xmit-cpp/launch_step.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmit_cpp {

/// Hosting service used when a site does not name one.
inline constexpr std::string_view default_service = "xmit.co";

/// Status of a task or of a site's most recent launch.
enum class TaskStatus : std::uint8_t {
    idle,
    running,
    succeeded,
    failed,
};

/// Convert a TaskStatus to its string representation.
constexpr auto to_string_view(TaskStatus status) noexcept -> std::string_view {
    switch (status) {
        case TaskStatus::idle:      return "idle";
        case TaskStatus::running:   return "running";
        case TaskStatus::succeeded: return "succeeded";
        case TaskStatus::failed:    return "failed";
    }
    return "unknown";
}

/// Origin of a task.
enum class TaskType : std::uint8_t {
    script,   ///< From package.json "scripts".
    install,  ///< Synthesized when the project has dependencies.
};

/// A named shell command belonging to a project.
struct Task {
    std::string name;
    std::string command;
    TaskType type{TaskType::script};

    auto operator==(const Task&) const -> bool = default;
};

/// A publication destination: a domain served by a hosting service.
struct Site {
    std::string name;
    std::string domain;
    std::string service{default_service};
    TaskStatus status{TaskStatus::idle};
    std::vector<LaunchStep> steps;
};

/// A local project: a directory holding package.json.
struct Project {
    std::string name;
    std::filesystem::path path;                  ///< Normalized, no trailing separator.
    std::vector<Task> tasks;
    std::vector<Site> sites;
    std::optional<std::string> launch_directory; ///< Relative to path.

    /// Find a task by name, or nullptr.
    auto find_task(std::string_view task_name) const -> const Task*;

    /// Find a site by name, or nullptr.
    auto find_site(std::string_view site_name) const -> const Site*;
};

/// Build a Project from the text of a package.json.
///
/// @throws PublishError{configuration} if the text is not a JSON object.
auto parse_package_json(const std::filesystem::path& project_path,
                        std::string_view json_text) -> Project;

/// Read and parse <project_path>/package.json.
///
/// @throws PublishError{configuration} if the file is missing or invalid.
auto load_project(const std::filesystem::path& project_path) -> Project;

/// Strip a trailing separator and lexically normalize a project path.
auto normalize_project_path(const std::filesystem::path& path) -> std::filesystem::path;

/// Identity of a launch of site within project: "<project path>:<site name>".
auto launch_id(const Project& project, const Site& site) -> std::string;

/// Mirror a step snapshot into a site: replace the most recent step with the
/// same title, or append it.
void apply_step(Site& site, const LaunchStep& step);

/// Mark site as launching: status running, previous steps dropped.
void begin_launch(Site& site);

}  // namespace xmit_cpp
