/**
 * @file ticket_destination.h
 * @brief Support-ticket locations in the log bucket
 *
 * Logs for a Zendesk ticket live under
 * s3://gt-logs/zendesk-tickets/ZD-<n>/; logs for a ticket escalated to Jira
 * live under s3://gt-logs/exa-to-gt/ZD-<n>-<RED|MOD>-<m>/.
 */

#ifndef KCENON_OBJECT_BATCH_TRANSPORT_TICKET_DESTINATION_H
#define KCENON_OBJECT_BATCH_TRANSPORT_TICKET_DESTINATION_H

#include <string>
#include <string_view>

#include "kcenon/object_batch/core/types.h"
#include "kcenon/object_batch/transport/s3_uri.h"

namespace kcenon::object_batch {

/**
 * @brief Ticket id validation and ticket-to-prefix mapping
 *
 * @code
 * auto prefix = ticket_destination::for_ticket("145980", "red172041");
 * // "s3://gt-logs/exa-to-gt/ZD-145980-RED-172041/"
 *
 * auto location = ticket_destination::resolve("ZD-145980");
 * // s3://gt-logs/zendesk-tickets/ZD-145980/
 * @endcode
 */
class ticket_destination {
public:
    static constexpr std::string_view bucket = "gt-logs";
    static constexpr std::string_view zendesk_root = "zendesk-tickets";
    static constexpr std::string_view escalation_root = "exa-to-gt";

    /**
     * @brief Normalize a Zendesk id ("145980", "zd-145980") to "ZD-145980"
     * @return The id, or invalid_ticket_id when the number is missing or
     *         not purely numeric
     */
    [[nodiscard]] static auto validate_zendesk_id(std::string_view id) -> result<std::string>;

    /**
     * @brief Normalize a Jira id ("red-172041", "MOD12345") to "RED-172041"
     * @return The id, or invalid_ticket_id unless it is RED or MOD followed
     *         by a number
     */
    [[nodiscard]] static auto validate_jira_id(std::string_view id) -> result<std::string>;

    /**
     * @brief Upload prefix of a ticket
     * @param zendesk_id Zendesk id, validated
     * @param jira_id Optional Jira id; empty for tickets without escalation
     */
    [[nodiscard]] static auto for_ticket(std::string_view zendesk_id,
                                         std::string_view jira_id = {})
        -> result<std::string>;

    /**
     * @brief Resolve a location given on the command line
     *
     * Accepts a full s3:// URI, a ticket shorthand ("ZD-145980",
     * "145980", "ZD-145980-RED-172041") or "bucket/key".
     */
    [[nodiscard]] static auto resolve(std::string_view reference) -> result<s3_uri>;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_TRANSPORT_TICKET_DESTINATION_H
