/// @file xmit.hpp
/// @brief Umbrella header for the xmit-cpp library.
///
/// Include this single header for access to all public types:
/// Project, Bundle, ProtocolClient, Publisher, LaunchStep, ProgressChannel,
/// LaunchRegistry, KeyRequestClient, and Error.

#pragma once

#include <xmit-cpp/bundle.hpp>
#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/chunked_uploader.hpp>
#include <xmit-cpp/client.hpp>
#include <xmit-cpp/credential_store.hpp>
#include <xmit-cpp/discovery.hpp>
#include <xmit-cpp/error.hpp>
#include <xmit-cpp/key_request.hpp>
#include <xmit-cpp/launch_step.hpp>
#include <xmit-cpp/project.hpp>
#include <xmit-cpp/publisher.hpp>
#include <xmit-cpp/task_runner.hpp>
#include <xmit-cpp/team.hpp>
#include <xmit-cpp/team_prompt.hpp>
#include <xmit-cpp/transport.hpp>
#include <xmit-cpp/types.hpp>
#include <xmit-cpp/wire.hpp>
