#pragma once

/// @file gsa.hpp
/// @brief Aggregate header for the guest shutdown agent library.

#include "gsa/core/result.hpp"
#include "gsa/foundation/agent_error.hpp"
#include "gsa/foundation/agent_logger.hpp"
#include "gsa/foundation/agent_result.hpp"
#include "gsa/foundation/cancellation.hpp"
#include "gsa/foundation/config_manager.hpp"
#include "gsa/foundation/error_code.hpp"
#include "gsa/foundation/process_runner.hpp"
#include "gsa/metadata/curl_metadata_client.hpp"
#include "gsa/metadata/metadata_client.hpp"
#include "gsa/metadata/metadata_types.hpp"
#include "gsa/script/script_dispatcher.hpp"
#include "gsa/version.hpp"
#include "gsa/watcher/graceful_shutdown_watcher.hpp"
#include "gsa/watcher/watcher.hpp"
