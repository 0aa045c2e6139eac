/// @file publisher.hpp
/// @brief Publisher: the build, discover, bundle, suggest, deliver, finalize sequence.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/chunked_uploader.hpp>
#include <xmit-cpp/client.hpp>
#include <xmit-cpp/credential_store.hpp>
#include <xmit-cpp/discovery.hpp>
#include <xmit-cpp/error.hpp>
#include <xmit-cpp/launch_step.hpp>
#include <xmit-cpp/project.hpp>
#include <xmit-cpp/task_runner.hpp>
#include <xmit-cpp/team.hpp>
#include <xmit-cpp/transport.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xmit_cpp {

/// Tunables of a Publisher.
struct PublisherOptions {
    std::chrono::milliseconds request_timeout{default_request_timeout};
    std::size_t chunk_budget{default_chunk_budget};
    unsigned int hash_threads{0};                         ///< 0: hardware concurrency.
    std::string protocol{protocol_version};
    std::string api_prefix{default_api_prefix};
    std::string build_task{"build"};                      ///< Run first when the project has it.
};

/// One launch: which project, to which site, with which key.
struct PublishRequest {
    Project project;
    Site site;
    std::string credential;
    std::string team_id;   ///< Preset team scope; empty to let the server decide.
};

enum class PublishOutcome : std::uint8_t {
    succeeded,
    failed,
    cancelled,
};

/// Convert a PublishOutcome to its string representation.
constexpr auto to_string_view(PublishOutcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case PublishOutcome::succeeded: return "succeeded";
        case PublishOutcome::failed:    return "failed";
        case PublishOutcome::cancelled: return "cancelled";
    }
    return "unknown";
}

/// Final result of a launch. Cancellation is reported as its own outcome.
struct PublishResult {
    PublishOutcome outcome{PublishOutcome::failed};
    std::string message;
    std::optional<Error> error;   ///< Set unless the launch succeeded.

    auto succeeded() const -> bool { return outcome == PublishOutcome::succeeded; }
    auto cancelled() const -> bool { return outcome == PublishOutcome::cancelled; }
};

/// Record the end of a launch on site. Anything but success, cancellation
/// included, leaves the site failed.
void apply_result(Site& site, const PublishResult& result);

/// Drives a launch against one destination.
///
/// Steps run strictly in order and each is reported to the channel as a
/// LaunchStep. The first failure stops the sequence; nothing is finalized
/// after a failed step. A Publisher holds no per-launch state, so one
/// instance may run launches for different sites concurrently.
///
/// @code
/// auto transport = xmit_cpp::HttpTransport{};
/// auto publisher = xmit_cpp::Publisher{transport};
/// auto channel = xmit_cpp::ProgressChannel{};
/// auto result = publisher.publish(request, channel, token, resolver);
/// @endcode
class Publisher {
public:
    /// Build tasks run through a ShellTaskRunner.
    explicit Publisher(Transport& transport, PublisherOptions options = {});

    Publisher(Transport& transport, TaskRunner& task_runner, PublisherOptions options = {});

    auto options() const -> const PublisherOptions& { return options_; }

    /// Run a launch. Progress goes to channel, which is left open.
    ///
    /// Never throws PublishError: every failure, including cancellation, is
    /// returned in the PublishResult.
    auto publish(const PublishRequest& request,
                 ProgressChannel& channel,
                 const CancellationToken& token,
                 const TeamResolver& resolver = {}) -> PublishResult;

    /// Run a launch taking the key from credentials.
    auto publish(const Project& project,
                 const Site& site,
                 const CredentialStore& credentials,
                 ProgressChannel& channel,
                 const CancellationToken& token,
                 const TeamResolver& resolver = {}) -> PublishResult;

private:
    Transport& transport_;
    std::unique_ptr<TaskRunner> owned_runner_;
    TaskRunner& task_runner_;
    PublisherOptions options_;
};

}  // namespace xmit_cpp
