/**
 * @file batch_download_example.cpp
 * @brief Resumable batch download from S3 through the AWS CLI
 *
 * This example demonstrates:
 * - Downloading explicit objects or everything below a prefix
 * - Filtering listed keys with include/exclude globs
 * - Resuming after an interruption
 */

#include <kcenon/object_batch/object_batch.h>

#include <csignal>
#include <iostream>
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

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Download Example - Object Batch" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <output-dir> [s3-uris...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -p, --prefix <location>   Download every object below a prefix or ticket"
              << std::endl;
    std::cout << "  -i, --include <glob>      Keep only matching keys (repeatable)" << std::endl;
    std::cout << "  -e, --exclude <glob>      Drop matching keys (repeatable)" << std::endl;
    std::cout << "  --profile <name>          AWS profile (default: gt-logs)" << std::endl;
    std::cout << "  --dry-run                 Show the plan without downloading" << std::endl;
    std::cout << "  --no-resume               Ignore saved progress" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " ./logs s3://gt-logs/zendesk-tickets/ZD-145980/a.tar.gz"
              << std::endl;
    std::cout << "  " << program << " -p s3://gt-logs/zendesk-tickets/ZD-145980/ -i '*.tar.gz' ./logs"
              << std::endl;
    std::cout << "  " << program << " -p ZD-145980-RED-172041 ./logs" << std::endl;
}

int main(int argc, char* argv[]) {
    batch_request request;
    request.direction = transfer_direction::download;

    aws_cli_config aws_config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-p" || arg == "--prefix" || arg == "-i" || arg == "--include" ||
                   arg == "-e" || arg == "--exclude" || arg == "--profile") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            if (arg == "-p" || arg == "--prefix") {
                request.remote_prefix = argv[i];
            } else if (arg == "-i" || arg == "--include") {
                request.includes.emplace_back(argv[i]);
            } else if (arg == "-e" || arg == "--exclude") {
                request.excludes.emplace_back(argv[i]);
            } else {
                aws_config.profile = argv[i];
            }
        } else if (arg == "--dry-run") {
            request.dry_run = true;
        } else if (arg == "--no-resume") {
            request.no_resume = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    request.destination = positional.front();
    request.sources.assign(positional.begin() + 1, positional.end());

    aws_cli_transport transport(aws_config);
    aws_cli_authenticator auth(aws_config);
    batch_engine engine(engine_config{}, transport, &auth, std::cerr);

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
