/**
 * @file ticket_destination.cpp
 * @brief Implementation of ticket_destination
 */

#include <kcenon/object_batch/transport/ticket_destination.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace kcenon::object_batch {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto to_upper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

auto all_digits(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

}  // namespace

auto ticket_destination::validate_zendesk_id(std::string_view id) -> result<std::string> {
    auto number = to_upper(trim(id));
    if (number.rfind("ZD-", 0) == 0) {
        number.erase(0, 3);
    }

    if (number.empty()) {
        return unexpected(error(error_code::invalid_ticket_id,
            "Invalid Zendesk ID: cannot be empty"));
    }
    if (!all_digits(number)) {
        return unexpected(error(error_code::invalid_ticket_id,
            "Invalid Zendesk ID: must be numerical only (e.g., 145980 or ZD-145980)"));
    }
    return "ZD-" + number;
}

auto ticket_destination::validate_jira_id(std::string_view id) -> result<std::string> {
    static const std::regex jira_pattern(R"(^(RED|MOD)-?(\d+)$)");

    auto text = to_upper(trim(id));
    if (all_digits(text)) {
        return unexpected(error(error_code::invalid_ticket_id,
            "Jira ID must include prefix (RED- or MOD-)"));
    }

    std::smatch match;
    if (!std::regex_match(text, match, jira_pattern)) {
        return unexpected(error(error_code::invalid_ticket_id,
            "Invalid Jira ID: must be in format RED-# or MOD-# with numerical suffix "
            "(e.g., RED-172041 or MOD-12345)"));
    }
    return match[1].str() + "-" + match[2].str();
}

auto ticket_destination::for_ticket(std::string_view zendesk_id, std::string_view jira_id)
    -> result<std::string> {
    auto zendesk = validate_zendesk_id(zendesk_id);
    if (!zendesk) {
        return unexpected(zendesk.error());
    }

    std::string uri(s3_uri::scheme);
    uri += bucket;
    uri += '/';
    if (trim(jira_id).empty()) {
        uri += zendesk_root;
        uri += '/' + zendesk.value() + '/';
        return uri;
    }

    auto jira = validate_jira_id(jira_id);
    if (!jira) {
        return unexpected(jira.error());
    }
    uri += escalation_root;
    uri += '/' + zendesk.value() + '-' + jira.value() + '/';
    return uri;
}

auto ticket_destination::resolve(std::string_view reference) -> result<s3_uri> {
    static const std::regex ticket_pattern(R"(^(?:ZD-)?(\d+)(?:-((?:RED|MOD)-?\d+))?$)");

    auto text = trim(reference);
    if (s3_uri::is_s3_uri(text)) {
        return s3_uri::parse(text);
    }

    auto upper = to_upper(text);
    std::smatch match;
    if (std::regex_match(upper, match, ticket_pattern)) {
        auto prefix = for_ticket(match[1].str(), match[2].matched ? match[2].str() : "");
        if (!prefix) {
            return unexpected(prefix.error());
        }
        return s3_uri::parse(prefix.value());
    }
    if (upper.rfind("ZD-", 0) == 0 && text.find('/') == std::string_view::npos) {
        auto zendesk = validate_zendesk_id(text);
        return unexpected(zendesk ? error(error_code::invalid_ticket_id,
                                          "Invalid ticket reference: '" + std::string(text) + "'")
                                  : zendesk.error());
    }

    if (!text.empty() && text.front() != '/' && text.find('/') != std::string_view::npos) {
        return s3_uri::parse(std::string(s3_uri::scheme) + std::string(text));
    }
    return unexpected(error(error_code::invalid_source,
        "not an S3 location: '" + std::string(text) + "'"));
}

}  // namespace kcenon::object_batch
