/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "benchmark_helpers.h"

#include <chrono>
#include <fstream>
#include <random>

namespace kcenon::object_batch::benchmark {

namespace {

auto make_engine(uint32_t seed) -> std::mt19937 {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937(rd());
    }
    return std::mt19937(seed);
}

}  // namespace

auto test_data_generator::generate_paths(std::size_t count, uint32_t seed)
    -> std::vector<std::string> {
    auto gen = make_engine(seed);
    std::uniform_int_distribution<int> kind(0, 29);
    std::uniform_int_distribution<int> depth(0, 3);

    std::vector<std::string> paths;
    paths.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::string path;
        for (int d = depth(gen); d > 0; --d) {
            path += "dir" + std::to_string(d) + "/";
        }
        path += "file_" + std::to_string(i);

        auto k = kind(gen);
        if (k == 0) {
            path += ".debug.tar.gz";
        } else if (k < 10) {
            path += ".tar.gz";
        } else if (k < 20) {
            path += ".log";
        } else {
            path += ".txt";
        }
        paths.push_back(std::move(path));
    }
    return paths;
}

auto test_data_generator::generate_batch(std::size_t count, uint32_t seed) -> transfer_batch {
    auto gen = make_engine(seed);
    std::uniform_int_distribution<int> status(0, 9);
    std::uniform_int_distribution<uint64_t> size(1, uint64_t{1} << 30);

    transfer_batch batch;
    batch.direction = transfer_direction::upload;
    batch.destination = "s3://bench-bucket/batch/";

    std::vector<std::string> sources;
    sources.reserve(count);
    for (const auto& path : generate_paths(count, seed)) {
        auto& item = batch.items.emplace_back(
            "/home/bench/support/" + path, batch.destination + path, size(gen));

        auto s = status(gen);
        if (s < 5) {
            item.status = item_status::completed;
            item.attempts = 1;
            item.bytes_transferred = item.size_bytes;
        } else if (s < 7) {
            item.status = item_status::failed_retryable;
            item.attempts = 2;
            item.last_error = "Could not connect to the endpoint URL";
        } else if (s == 7) {
            item.status = item_status::failed;
            item.attempts = 4;
            item.last_error = "aws s3 cp exited with code 1: \"quoted\" detail";
        }
        sources.push_back(item.source);
    }

    auto id = transfer_batch::compute_id(batch.direction, batch.destination, std::move(sources));
    batch.id = id ? id.value() : "benchmark";
    batch.created_at = std::chrono::system_clock::now();
    batch.updated_at = batch.created_at;
    return batch;
}

auto test_data_generator::generate_progress_lines(std::size_t count, uint64_t total)
    -> std::vector<std::string> {
    std::vector<std::string> lines;
    lines.reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
        auto done = total * i / count;
        lines.push_back("Completed " + std::to_string(done / 1024) + ".0 KiB/" +
                        std::to_string(total / (1024 * 1024)) +
                        ".0 MiB (12.3 MiB/s) with 1 file(s) remaining");
    }
    return lines;
}

auto make_temp_directory(const std::string& prefix) -> std::filesystem::path {
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(dir);
    return dir;
}

temp_tree::temp_tree(const std::vector<std::string>& paths, std::size_t file_size)
    : root_(make_temp_directory("object_batch_bench_tree")) {
    std::string content(file_size, 'x');
    for (const auto& relative : paths) {
        auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
    }
}

temp_tree::~temp_tree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

}  // namespace kcenon::object_batch::benchmark
