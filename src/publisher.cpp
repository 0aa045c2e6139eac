#include <xmit-cpp/publisher.hpp>

#include "step_log.hpp"
#include "team_auth.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>

namespace xmit_cpp {

namespace {

// State handed from one phase to the next. Owned by a single publish call.
struct LaunchContext {
    const PublishRequest& request;
    const PublisherOptions& options;
    StepTracker& tracker;
    const CancellationToken& token;
    const TeamResolver& resolver;
};

auto kilobytes(std::size_t bytes) -> std::string {
    auto buffer = std::array<char, 32>{};
    std::snprintf(buffer.data(), buffer.size(), "%.2f", static_cast<double>(bytes) / 1024.0);
    return buffer.data();
}

void run_build(LaunchContext& ctx, TaskRunner& runner) {
    const auto* task = ctx.request.project.find_task(ctx.options.build_task);
    if (!task) return;

    ctx.token.throw_if_cancelled();
    ctx.tracker.start("Running build task");
    auto code = runner.run(ctx.request.project, *task,
        [&](std::string_view text) { ctx.tracker.task_output(task->name, std::string{text}); },
        ctx.token);
    ctx.token.throw_if_cancelled();

    if (code != 0) {
        ctx.tracker.fail("Build task failed");
        throw PublishError{ErrorKind::build_failed,
            "Build task failed with exit code " + std::to_string(code)};
    }
    ctx.tracker.complete();
}

auto discover(LaunchContext& ctx, Transport& transport) -> ProtocolInfo {
    ctx.token.throw_if_cancelled();
    ctx.tracker.start("Discovering protocol");
    ctx.tracker.log("Discovering protocol from " + ctx.request.site.service);

    auto info = ProtocolInfo{};
    try {
        info = discover_protocol(transport, ctx.request.site.service,
                                 ctx.options.request_timeout, ctx.token, ctx.options.protocol);
    } catch (const PublishError& e) {
        if (e.kind() == ErrorKind::cancelled) throw;
        ctx.tracker.fail(e.what());
        throw PublishError{e.kind(), std::string{"Protocol discovery failed: "} + e.what()};
    }

    auto protocols = std::string{};
    for (const auto& p : info.protocols) {
        if (!protocols.empty()) protocols += ", ";
        protocols += p;
    }
    ctx.tracker.log("Protocols: " + protocols);
    ctx.tracker.log("Base URL: " + info.url);
    ctx.token.throw_if_cancelled();
    ctx.tracker.complete();
    return info;
}

auto assemble(LaunchContext& ctx) -> Bundle {
    ctx.tracker.start("Creating bundle");
    auto root = resolve_bundle_root(ctx.request.project);
    auto bundle = build_bundle(root, ctx.options.hash_threads, ctx.token);
    ctx.tracker.log("Bundled " + std::to_string(bundle.file_count) + " files (" +
                    std::to_string(bundle.contents.size()) + " unique, " +
                    kilobytes(bundle.contents.total_bytes()) + "KB)");
    ctx.token.throw_if_cancelled();
    ctx.tracker.complete();
    spdlog::info("bundle {} built from {}", bundle.hash.to_hex(), root.string());
    return bundle;
}

auto suggest(LaunchContext& ctx, ProtocolClient& client, const Bundle& bundle) -> SuggestResponse {
    const auto& domain = ctx.request.site.domain;
    ctx.tracker.start("Suggesting bundle");
    ctx.token.throw_if_cancelled();

    auto response = client.suggest(domain, bundle.hash, ctx.token);
    ctx.tracker.log("Server responded");
    detail::log_diagnostics(ctx.tracker, response.diagnostics);

    if (response.diagnostics.requires_team()) {
        ctx.tracker.log("Domain requires team ID authentication");
        ctx.tracker.pause("Waiting for team selection");

        auto team_id = std::string{};
        try {
            team_id = detail::resolve_team(client, ctx.resolver, ctx.tracker, ctx.token);
        } catch (const PublishError& e) {
            if (e.kind() == ErrorKind::cancelled) throw;
            ctx.tracker.fail("Team selection cancelled or unavailable");
            throw;
        }

        ctx.tracker.resume();
        ctx.tracker.log("Using team: " + team_id);
        ctx.tracker.log("Retrying bundle suggestion");
        client.set_team_id(team_id);

        // Exactly one retry; a second team error is final
        response = client.suggest(domain, bundle.hash, ctx.token);
        ctx.tracker.log("Server responded");
        detail::log_diagnostics(ctx.tracker, response.diagnostics);
        if (response.diagnostics.requires_team()) {
            ctx.tracker.fail("Team authentication failed");
            throw PublishError{ErrorKind::team_auth,
                "Team ID authentication failed. Please verify your team ID is correct."};
        }
        ctx.tracker.log("Team authentication successful");
    }

    ctx.token.throw_if_cancelled();

    auto count = std::to_string(response.missing.size());
    if (response.present) {
        ctx.tracker.complete(response.missing.empty()
            ? std::string{"Bundle already present on server"}
            : "Bundle present, " + count + " missing parts");
    } else if (!response.missing.empty()) {
        ctx.tracker.complete(count + " missing parts");
    } else {
        ctx.tracker.complete();
    }
    return response;
}

void deliver_missing(LaunchContext& ctx, ProtocolClient& client, const Bundle& bundle,
                     const std::vector<ContentHash>& missing) {
    if (missing.empty()) return;
    ctx.tracker.start("Uploading missing parts");
    ctx.tracker.set_message(std::to_string(missing.size()) + " parts");
    upload_missing_parts(client, ctx.request.site.domain, missing, bundle.contents,
                         ctx.tracker, ctx.token, ctx.options.chunk_budget);
    ctx.tracker.complete();
}

auto upload_bundle(LaunchContext& ctx, ProtocolClient& client, const Bundle& bundle)
    -> BundleUploadResponse {
    ctx.tracker.start("Uploading bundle");
    ctx.token.throw_if_cancelled();

    ctx.tracker.log("Uploading " + kilobytes(bundle.encoded.size()) + "KB bundle");
    auto response = client.upload_bundle(ctx.request.site.domain, bundle.encoded, ctx.token);
    ctx.tracker.log("Upload complete");
    detail::log_diagnostics(ctx.tracker, response.diagnostics);

    if (response.diagnostics.requires_team()) {
        ctx.tracker.fail("Team authentication required for upload");
        throw PublishError{ErrorKind::invariant_violation,
            "Team ID required for upload. This should not happen if suggestion "
            "succeeded. Please report this issue."};
    }
    ctx.token.throw_if_cancelled();
    if (!response.success) {
        ctx.tracker.fail("Failed");
        throw PublishError{ErrorKind::protocol, "Upload failed"};
    }
    ctx.tracker.complete();
    return response;
}

void finalize(LaunchContext& ctx, ProtocolClient& client, std::span<const std::byte> bundle_id) {
    ctx.tracker.start("Finalizing launch");
    ctx.token.throw_if_cancelled();
    ctx.tracker.log("Requesting finalization");

    auto response = client.finalize(ctx.request.site.domain, bundle_id, ctx.token);
    detail::log_diagnostics(ctx.tracker, response.diagnostics);

    if (response.diagnostics.requires_team()) {
        ctx.tracker.fail("Team authentication required for finalization");
        throw PublishError{ErrorKind::invariant_violation,
            "Team ID required for finalization. This should not happen if suggestion "
            "succeeded. Please report this issue."};
    }
    if (!response.success) {
        ctx.tracker.fail("Failed");
        throw PublishError{ErrorKind::protocol, "Finalization failed"};
    }
    ctx.tracker.log("Launch finalized");
    ctx.tracker.complete();
}

}  // namespace

void apply_result(Site& site, const PublishResult& result) {
    site.status = result.succeeded() ? TaskStatus::succeeded : TaskStatus::failed;
}

Publisher::Publisher(Transport& transport, PublisherOptions options)
    : transport_{transport},
      owned_runner_{std::make_unique<ShellTaskRunner>()},
      task_runner_{*owned_runner_},
      options_{std::move(options)} {}

Publisher::Publisher(Transport& transport, TaskRunner& task_runner, PublisherOptions options)
    : transport_{transport},
      task_runner_{task_runner},
      options_{std::move(options)} {}

auto Publisher::publish(const PublishRequest& request,
                        ProgressChannel& channel,
                        const CancellationToken& token,
                        const TeamResolver& resolver) -> PublishResult {
    auto tracker = StepTracker{channel};
    auto ctx = LaunchContext{request, options_, tracker, token, resolver};
    const auto& domain = request.site.domain;

    spdlog::info("launching {} to {} via {}", request.project.name, domain, request.site.service);
    try {
        token.throw_if_cancelled();
        if (request.credential.empty()) {
            throw PublishError{ErrorKind::configuration,
                "No API key configured for " + request.site.service};
        }
        if (domain.empty()) {
            throw PublishError{ErrorKind::configuration,
                "Site " + request.site.name + " has no domain configured"};
        }

        run_build(ctx, task_runner_);
        auto info = discover(ctx, transport_);
        auto bundle = assemble(ctx);

        auto client = ProtocolClient{transport_, info.url,
                                     Auth{request.credential, request.team_id},
                                     options_.request_timeout, options_.api_prefix};

        auto suggestion = suggest(ctx, client, bundle);
        deliver_missing(ctx, client, bundle, suggestion.missing);

        if (suggestion.present) {
            finalize(ctx, client, bundle.hash.bytes);
        } else {
            auto upload = upload_bundle(ctx, client, bundle);
            deliver_missing(ctx, client, bundle, upload.missing);
            finalize(ctx, client, upload.id);
        }

        spdlog::info("launched {} to {}", bundle.hash.to_hex(), domain);
        return PublishResult{PublishOutcome::succeeded, "Successfully launched to " + domain,
                             std::nullopt};
    } catch (const PublishError& e) {
        if (e.kind() == ErrorKind::cancelled) {
            tracker.fail("cancelled");
            spdlog::info("launch to {} cancelled", domain);
            return PublishResult{PublishOutcome::cancelled, "Launch cancelled", e.error()};
        }
        tracker.fail(e.what());
        spdlog::error("launch to {} failed ({}): {}", domain, to_string_view(e.kind()), e.what());
        return PublishResult{PublishOutcome::failed, e.what(), e.error()};
    } catch (const std::exception& e) {
        tracker.fail(e.what());
        throw;
    }
}

auto Publisher::publish(const Project& project,
                        const Site& site,
                        const CredentialStore& credentials,
                        ProgressChannel& channel,
                        const CancellationToken& token,
                        const TeamResolver& resolver) -> PublishResult {
    auto request = PublishRequest{project, site, credentials.get(site.service).value_or(""), {}};
    return publish(request, channel, token, resolver);
}

}  // namespace xmit_cpp
