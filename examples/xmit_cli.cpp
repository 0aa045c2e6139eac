// xmit: command-line host for xmit-cpp
//
//   xmit publish <project-dir> <site> [--key KEY] [--team ID] [--verbose]
//   xmit login <service> [--name APP]
//   xmit discover <service>
//
// publish reads the key from --key or XMIT_API_KEY. Ctrl-C cancels the
// running command. Exit codes: 0 success, 1 failure, 130 cancelled.
//
// Build: cmake --build build
// Run:   ./build/xmit publish ./my-site production

#include <xmit-cpp/xmit.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

#include <signal.h>
#include <unistd.h>

namespace xm = xmit_cpp;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_failed = 1;
constexpr int exit_cancelled = 130;

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_interrupt(int) { g_interrupted = 1; }

// The handler only sets a flag. The main thread polls it and cancels the
// launch token, which also ends a pending team prompt.
void install_interrupt_handler() {
    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
}

auto interrupted() -> bool { return g_interrupted != 0; }

std::mutex g_console;

// -- Step rendering -----------------------------------------------------------

// Snapshots repeat the whole step; print only what changed since the last one.
class StepPrinter {
public:
    void print(const xm::LaunchEvent& event) {
        auto lock = std::scoped_lock{g_console};
        std::visit(xm::overload{
            [&](const xm::StepEvent& e) { print_step(e.step); },
            [&](const xm::TaskOutputEvent& e) {
                std::fputs(e.text.c_str(), stdout);
                std::fflush(stdout);
            },
        }, event);
    }

private:
    struct Seen {
        xm::StepStatus status{xm::StepStatus::pending};
        std::size_t logs{0};
    };

    void print_step(const xm::LaunchStep& step) {
        auto& seen = seen_[step.title];
        if (step.logs.size() < seen.logs) seen = Seen{};  // restarted

        if (step.status != seen.status) {
            switch (step.status) {
                case xm::StepStatus::running:
                    if (seen.status != xm::StepStatus::paused) {
                        std::printf("==> %s\n", step.title.c_str());
                    }
                    break;
                case xm::StepStatus::paused:
                    std::printf("... %s: %s\n", step.title.c_str(),
                                step.message.value_or("paused").c_str());
                    break;
                case xm::StepStatus::completed:
                case xm::StepStatus::failed:
                    break;
                case xm::StepStatus::pending:
                    break;
            }
        }

        for (auto i = seen.logs; i < step.logs.size(); ++i) {
            std::printf("    %s\n", step.logs[i].c_str());
        }

        if (step.status != seen.status &&
            (step.status == xm::StepStatus::completed || step.status == xm::StepStatus::failed)) {
            auto mark = step.status == xm::StepStatus::completed ? "ok" : "FAILED";
            auto elapsed = static_cast<long long>(step.duration().count());
            if (step.message) {
                std::printf("[%s] %s: %s (%lld ms)\n", mark, step.title.c_str(),
                            step.message->c_str(), elapsed);
            } else {
                std::printf("[%s] %s (%lld ms)\n", mark, step.title.c_str(), elapsed);
            }
        }

        seen.status = step.status;
        seen.logs = step.logs.size();
        std::fflush(stdout);
    }

    std::unordered_map<std::string, Seen> seen_;
};

// -- Commands -----------------------------------------------------------------

struct PublishArgs {
    std::string project_dir;
    std::string site;
    std::string key;
    std::string team;
};

// A site argument that is not configured in package.json is taken as a
// domain on the default service.
auto select_site(const xm::Project& project, const std::string& name) -> xm::Site {
    if (const auto* site = project.find_site(name)) return *site;
    spdlog::debug("site {} not in package.json, using it as a domain", name);
    auto site = xm::Site{};
    site.name = name;
    site.domain = name;
    return site;
}

auto run_publish(const PublishArgs& args) -> int {
    auto key = args.key;
    if (key.empty()) {
        if (const auto* env = std::getenv("XMIT_API_KEY")) key = env;
    }

    auto request = xm::PublishRequest{};
    try {
        request.project = xm::load_project(args.project_dir);
    } catch (const xm::PublishError& e) {
        spdlog::error("{}", e.what());
        return exit_failed;
    }
    request.site = select_site(request.project, args.site);
    request.credential = key;
    request.team_id = args.team;

    auto transport = xm::HttpTransport{};
    auto publisher = xm::Publisher{transport};
    auto registry = xm::LaunchRegistry{};
    auto channel = xm::ProgressChannel{};
    const auto id = xm::launch_id(request.project, request.site);
    auto handle = registry.begin(id);

    auto prompt = xm::TeamPrompt{STDIN_FILENO, stdout, handle.token(), &g_console};
    auto result = xm::PublishResult{};
    auto worker = std::jthread{[&] {
        try {
            result = publisher.publish(request, channel, handle.token(), prompt);
        } catch (const std::exception& e) {
            result = xm::PublishResult{xm::PublishOutcome::failed, e.what(), std::nullopt};
        }
        channel.close();
    }};

    auto site = request.site;
    xm::begin_launch(site);

    auto printer = StepPrinter{};
    auto cancel_sent = false;
    while (true) {
        if (interrupted() && !cancel_sent) {
            spdlog::info("cancelling {}", id);
            registry.cancel(id);
            cancel_sent = true;
        }
        // Read closed before popping so the last event is never skipped.
        auto closed = channel.is_closed();
        if (auto event = channel.try_pop()) {
            if (const auto* step = std::get_if<xm::StepEvent>(&*event)) {
                xm::apply_step(site, step->step);
            }
            printer.print(*event);
        } else if (closed) {
            break;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
        }
    }
    worker.join();
    xm::apply_result(site, result);
    spdlog::debug("site {} {} after {} steps", site.name, xm::to_string_view(site.status),
                  site.steps.size());

    switch (result.outcome) {
        case xm::PublishOutcome::succeeded:
            std::printf("%s\n", result.message.c_str());
            return exit_ok;
        case xm::PublishOutcome::cancelled:
            std::printf("%s\n", result.message.c_str());
            return exit_cancelled;
        case xm::PublishOutcome::failed:
            std::fprintf(stderr, "error: %s\n", result.message.c_str());
            return exit_failed;
    }
    return exit_failed;
}

// Run work on a worker thread while this one watches for Ctrl-C.
auto run_cancellable(const std::function<void(const xm::CancellationToken&)>& work) -> int {
    auto token = xm::CancellationToken{};
    auto code = exit_ok;
    auto done = std::atomic<bool>{false};

    auto worker = std::jthread{[&] {
        try {
            work(token);
        } catch (const xm::PublishError& e) {
            if (e.kind() == xm::ErrorKind::cancelled) {
                code = exit_cancelled;
            } else {
                spdlog::error("{} error: {}", xm::to_string_view(e.kind()), e.what());
                code = exit_failed;
            }
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            code = exit_failed;
        }
        done = true;
    }};

    while (!done) {
        if (interrupted()) token.cancel();
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }
    worker.join();
    return code;
}

auto run_login(const std::string& service, const std::string& application) -> int {
    auto transport = xm::HttpTransport{};
    auto keys = xm::KeyRequestClient{transport};
    return run_cancellable([&](const xm::CancellationToken& token) {
        auto key = keys.request_and_await_key(service, application,
            [](std::string_view url, std::string_view request_id) {
                std::printf("Approve this key request in your browser:\n  %.*s\n",
                            static_cast<int>(url.size()), url.data());
                std::printf("Request id: %.*s\nWaiting for approval...\n",
                            static_cast<int>(request_id.size()), request_id.data());
                std::fflush(stdout);
            },
            token);
        std::printf("%s\n", key.c_str());
    });
}

auto run_discover(const std::string& service) -> int {
    auto transport = xm::HttpTransport{};
    auto cache = xm::DiscoveryCache{transport};
    return run_cancellable([&](const xm::CancellationToken& token) {
        auto info = cache.discover(service, token);
        auto protocols = std::string{};
        for (const auto& p : info.protocols) {
            if (!protocols.empty()) protocols += ", ";
            protocols += p;
        }
        std::printf("Service:   %s\n", xm::normalize_service_url(service).c_str());
        std::printf("Protocols: %s\n", protocols.c_str());
        std::printf("Base URL:  %s\n", info.url.c_str());
        std::printf("Keys:      %s\n", info.api_key_management_url.value_or("(not published)").c_str());
    });
}

}  // namespace

int main(int argc, char** argv) {
    auto cli = CLI::App{"Publish a local site to a web publication protocol host", "xmit"};
    cli.require_subcommand(1);

    auto verbose = false;
    cli.add_flag("-v,--verbose", verbose, "Log protocol detail");

    auto publish = PublishArgs{};
    auto* sub_publish = cli.add_subcommand("publish", "Build, bundle and launch a project to a site");
    sub_publish->add_option("project-dir", publish.project_dir, "Directory holding package.json")->required();
    sub_publish->add_option("site", publish.site, "Site name from package.json, or a domain")->required();
    sub_publish->add_option("--key", publish.key, "API key (default: $XMIT_API_KEY)");
    sub_publish->add_option("--team", publish.team, "Publish under this team id");
    sub_publish->add_flag("-v,--verbose", verbose, "Log protocol detail");

    auto login_service = std::string{};
    auto login_name = std::string{"xmit"};
    auto* sub_login = cli.add_subcommand("login", "Request an API key approved in the browser");
    sub_login->add_option("service", login_service, "Hosting service, e.g. xmit.co")->required();
    sub_login->add_option("--name", login_name, "Application name shown on the approval page");

    auto discover_service = std::string{};
    auto* sub_discover = cli.add_subcommand("discover", "Show what a hosting service advertises");
    sub_discover->add_option("service", discover_service, "Hosting service, e.g. xmit.co")->required();

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    spdlog::set_pattern("%H:%M:%S.%e %^%l%$ %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    install_interrupt_handler();

    if (sub_publish->parsed()) return run_publish(publish);
    if (sub_login->parsed()) return run_login(login_service, login_name);
    if (sub_discover->parsed()) return run_discover(discover_service);
    return exit_failed;
}
