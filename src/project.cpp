#include <xmit-cpp/project.hpp>

#include <xmit-cpp/error.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace xmit_cpp {

namespace {

auto strip_scheme(std::string service) -> std::string {
    for (auto prefix : {std::string_view{"https://"}, std::string_view{"http://"}}) {
        if (service.starts_with(prefix)) return service.substr(prefix.size());
    }
    return service;
}

auto string_or(const nlohmann::json& obj, const char* key, std::string fallback) -> std::string {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

auto non_empty_object(const nlohmann::json& obj, const char* key) -> bool {
    auto it = obj.find(key);
    return it != obj.end() && it->is_object() && !it->empty();
}

}  // namespace

auto Project::find_task(std::string_view task_name) const -> const Task* {
    auto it = std::ranges::find(tasks, task_name, &Task::name);
    return it == tasks.end() ? nullptr : &*it;
}

auto Project::find_site(std::string_view site_name) const -> const Site* {
    auto it = std::ranges::find(sites, site_name, &Site::name);
    return it == sites.end() ? nullptr : &*it;
}

auto normalize_project_path(const std::filesystem::path& path) -> std::filesystem::path {
    auto normalized = path.lexically_normal();
    // "a/b/" normalizes to "a/b/" with an empty filename; drop it
    if (!normalized.has_filename() && normalized.has_parent_path() &&
        normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

auto parse_package_json(const std::filesystem::path& project_path,
                        std::string_view json_text) -> Project {
    auto json = nlohmann::json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        throw PublishError{ErrorKind::configuration,
            "package.json in " + project_path.string() + " is not a JSON object"};
    }

    auto project = Project{};
    project.name = string_or(json, "name", "Unnamed Project");
    project.path = normalize_project_path(project_path);

    if (non_empty_object(json, "dependencies") || non_empty_object(json, "devDependencies")) {
        project.tasks.push_back(Task{"install", "bun install", TaskType::install});
    }

    if (auto it = json.find("scripts"); it != json.end() && it->is_object()) {
        for (const auto& [name, command] : it->items()) {
            if (!command.is_string()) continue;
            project.tasks.push_back(Task{name, command.get<std::string>(), TaskType::script});
        }
    }

    auto bob = json.find("bob");
    if (bob == json.end() || !bob->is_object()) return project;

    if (auto dir = bob->find("directory"); dir != bob->end() && dir->is_string()) {
        project.launch_directory = dir->get<std::string>();
    }

    if (auto sites = bob->find("sites"); sites != bob->end() && sites->is_object()) {
        for (const auto& [name, config] : sites->items()) {
            if (!config.is_object()) {
                spdlog::warn("ignoring site '{}': configuration is not an object", name);
                continue;
            }
            auto site = Site{};
            site.name = name;
            site.domain = string_or(config, "domain", "");
            site.service = strip_scheme(string_or(config, "service", std::string{default_service}));
            project.sites.push_back(std::move(site));
        }
    }

    return project;
}

auto load_project(const std::filesystem::path& project_path) -> Project {
    auto manifest = project_path / "package.json";
    auto in = std::ifstream{manifest, std::ios::binary};
    if (!in) {
        throw PublishError{ErrorKind::configuration,
            "package.json not found at " + project_path.string()};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return parse_package_json(project_path, buffer.str());
}

auto launch_id(const Project& project, const Site& site) -> std::string {
    return project.path.string() + ":" + site.name;
}

void apply_step(Site& site, const LaunchStep& step) {
    auto it = std::find_if(site.steps.rbegin(), site.steps.rend(),
        [&](const LaunchStep& s) { return s.title == step.title; });
    if (it != site.steps.rend()) {
        *it = step;
    } else {
        site.steps.push_back(step);
    }
}

void begin_launch(Site& site) {
    site.status = TaskStatus::running;
    site.steps.clear();
}

}  // namespace xmit_cpp
