/**
 * @file object_batch.h
 * @brief Main header for the object_batch library
 * @version 0.1.0
 *
 * Include this header to access batch planning, resumable execution and
 * the AWS CLI transport.
 *
 * @code
 * #include <kcenon/object_batch/object_batch.h>
 *
 * using namespace kcenon::object_batch;
 *
 * aws_cli_transport transport;
 * aws_cli_authenticator auth;
 * auto config = engine_config::builder().with_verification(true).build();
 * batch_engine engine(config.value(), transport, &auth, std::cerr);
 * @endcode
 */

#ifndef KCENON_OBJECT_BATCH_OBJECT_BATCH_H
#define KCENON_OBJECT_BATCH_OBJECT_BATCH_H

#include <string>

// Core types
#include "kcenon/object_batch/core/types.h"
#include "kcenon/object_batch/core/transfer_types.h"
#include "kcenon/object_batch/core/retry_policy.h"
#include "kcenon/object_batch/core/logging.h"

// Configuration
#include "kcenon/object_batch/config/engine_config.h"

// Planning
#include "kcenon/object_batch/planner/pattern_filter.h"
#include "kcenon/object_batch/planner/batch_planner.h"

// State and execution
#include "kcenon/object_batch/state/state_store.h"
#include "kcenon/object_batch/executor/transfer_executor.h"
#include "kcenon/object_batch/executor/verifier.h"

// Progress and reporting
#include "kcenon/object_batch/progress/progress_parser.h"
#include "kcenon/object_batch/progress/progress_reporter.h"
#include "kcenon/object_batch/report/summary_reporter.h"

// Transport
#include "kcenon/object_batch/transport/transport_interface.h"
#include "kcenon/object_batch/transport/aws_cli_transport.h"
#include "kcenon/object_batch/transport/ticket_destination.h"

// Facade
#include "kcenon/object_batch/engine/batch_engine.h"

namespace kcenon::object_batch {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_OBJECT_BATCH_H
