/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_OBJECT_BATCH_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_OBJECT_BATCH_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/object_batch/core/transfer_types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::object_batch::benchmark {

/**
 * @brief Generates synthetic batches and path lists
 */
class test_data_generator {
public:
    /**
     * @brief Relative paths spread over nested directories
     * @param count Number of paths
     * @param seed Random seed (0 for random)
     *
     * About a third of the names end in ".tar.gz" (one in ten of those in
     * ".debug.tar.gz"); the rest are ".log" and ".txt".
     */
    static auto generate_paths(std::size_t count, uint32_t seed = 0)
        -> std::vector<std::string>;

    /**
     * @brief Upload batch with @p count items in mixed states
     */
    static auto generate_batch(std::size_t count, uint32_t seed = 0) -> transfer_batch;

    /**
     * @brief AWS CLI progress lines for a transfer of @p total bytes
     */
    static auto generate_progress_lines(std::size_t count, uint64_t total)
        -> std::vector<std::string>;
};

/**
 * @brief Temporary directory tree, removed on destruction
 */
class temp_tree {
public:
    /**
     * @param paths Relative paths of the files to create
     * @param file_size Size of every file
     */
    temp_tree(const std::vector<std::string>& paths, std::size_t file_size);

    ~temp_tree();

    temp_tree(const temp_tree&) = delete;
    auto operator=(const temp_tree&) -> temp_tree& = delete;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

/**
 * @brief Fresh directory under the system temp directory
 */
auto make_temp_directory(const std::string& prefix) -> std::filesystem::path;

}  // namespace kcenon::object_batch::benchmark

#endif  // KCENON_OBJECT_BATCH_BENCHMARKS_BENCHMARK_HELPERS_H
