/**
 * @file batch_upload_example.cpp
 * @brief Resumable batch upload to S3 through the AWS CLI
 *
 * This example demonstrates:
 * - Planning a batch from explicit files or a directory tree
 * - Include/exclude filtering
 * - Resuming an interrupted batch (Ctrl+C, then run again)
 * - Size verification after each upload
 * - Printing the batch summary
 */

#include <kcenon/object_batch/object_batch.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::object_batch;

namespace {

cancellation_token g_cancel;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel.cancel();
    }
}

auto parse_count(const char* text, uint32_t& out) -> bool {
    char* end = nullptr;
    auto value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Object Batch" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <destination> [files...]" << std::endl;
    std::cout << "       " << program << " [options] --zendesk <id> [--jira <id>] [files...]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "The destination is an s3:// prefix or a ticket such as ZD-145980." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -z, --zendesk <id>        Upload to the ticket's log prefix" << std::endl;
    std::cout << "  -j, --jira <id>           Escalation (RED-# or MOD-#) for --zendesk" << std::endl;
    std::cout << "  -d, --dir <path>          Upload every file below a directory" << std::endl;
    std::cout << "  -i, --include <glob>      Keep only matching files (repeatable)" << std::endl;
    std::cout << "  -e, --exclude <glob>      Drop matching files (repeatable)" << std::endl;
    std::cout << "  --profile <name>          AWS profile (default: gt-logs)" << std::endl;
    std::cout << "  --region <region>         AWS region" << std::endl;
    std::cout << "  --verify                  Check remote sizes after upload" << std::endl;
    std::cout << "  --max-retries <n>         Retries per file (default: 3)" << std::endl;
    std::cout << "  --dry-run                 Show the plan without uploading" << std::endl;
    std::cout << "  --no-resume               Ignore saved progress" << std::endl;
    std::cout << "  --clean-state             Discard saved progress first" << std::endl;
    std::cout << "  --keep-state              Keep saved progress after success" << std::endl;
    std::cout << "  --list-resumable          Print batches with saved progress" << std::endl;
    std::cout << "  --quiet                   No progress line" << std::endl;
    std::cout << "  -v, --verbose             Debug logging" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " s3://gt-logs/zendesk-tickets/ZD-145980/ a.tar.gz b.tar.gz"
              << std::endl;
    std::cout << "  " << program << " -d ~/support -i '*.tar.gz' -e '*.debug.tar.gz' --verify "
              << "s3://gt-logs/zendesk-tickets/ZD-145980/" << std::endl;
    std::cout << "  " << program << " -z 145980 -j RED-172041 debuginfo.tar.gz" << std::endl;
}

int main(int argc, char* argv[]) {
    batch_request request;
    request.direction = transfer_direction::upload;

    aws_cli_config aws_config;
    bool quiet = false;
    bool list_resumable = false;
    std::string zendesk_id;
    std::string jira_id;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](const char* name) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-z" || arg == "--zendesk") {
            zendesk_id = next("--zendesk");
        } else if (arg == "-j" || arg == "--jira") {
            jira_id = next("--jira");
        } else if (arg == "-d" || arg == "--dir") {
            request.directory = next("--dir");
        } else if (arg == "-i" || arg == "--include") {
            request.includes.emplace_back(next("--include"));
        } else if (arg == "-e" || arg == "--exclude") {
            request.excludes.emplace_back(next("--exclude"));
        } else if (arg == "--profile") {
            aws_config.profile = next("--profile");
        } else if (arg == "--region") {
            aws_config.region = next("--region");
        } else if (arg == "--verify") {
            request.verify = true;
        } else if (arg == "--max-retries") {
            uint32_t retries = 0;
            if (!parse_count(next("--max-retries"), retries)) {
                std::cerr << "Error: --max-retries expects a non-negative number" << std::endl;
                return 1;
            }
            request.max_retries = retries;
        } else if (arg == "--dry-run") {
            request.dry_run = true;
        } else if (arg == "--no-resume") {
            request.no_resume = true;
        } else if (arg == "--clean-state") {
            request.clean_state = true;
        } else if (arg == "--keep-state") {
            request.keep_state = true;
        } else if (arg == "--list-resumable") {
            list_resumable = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    auto config = engine_config::builder()
        .with_quiet_progress(quiet)
        .build();
    if (!config.has_value()) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    aws_cli_transport transport(aws_config);
    aws_cli_authenticator auth(aws_config);
    batch_engine engine(config.value(), transport, &auth, std::cerr);

    if (list_resumable) {
        auto batches = engine.list_resumable();
        if (batches.empty()) {
            std::cout << "No batches with saved progress" << std::endl;
        }
        for (const auto& id : batches) {
            std::cout << id << std::endl;
        }
        return 0;
    }

    if (!zendesk_id.empty()) {
        auto prefix = ticket_destination::for_ticket(zendesk_id, jira_id);
        if (!prefix.has_value()) {
            std::cerr << "Error: " << prefix.error().message << std::endl;
            return 1;
        }
        request.destination = prefix.value();
        request.sources = positional;
    } else if (!jira_id.empty()) {
        std::cerr << "Error: --jira requires --zendesk" << std::endl;
        return 1;
    } else if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    } else {
        request.destination = positional.front();
        request.sources.assign(positional.begin() + 1, positional.end());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto summary = engine.run(request, g_cancel);
    if (!summary.has_value()) {
        std::cerr << "Error: " << summary.error().message << std::endl;
        return 1;
    }

    std::cout << std::endl;
    summary_reporter::render(summary.value(), std::cout);

    if (summary.value().interrupted) {
        return 130;
    }
    return summary.value().success() ? 0 : 2;
}
