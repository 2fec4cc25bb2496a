/**
 * @file progress_parser.h
 * @brief Conversion of transport output lines into progress samples
 *
 * The executor never looks at transport output itself. It hands each line
 * to a progress_parser, so a transport with a different output format only
 * needs a different parser.
 */

#ifndef KCENON_OBJECT_BATCH_PROGRESS_PROGRESS_PARSER_H
#define KCENON_OBJECT_BATCH_PROGRESS_PROGRESS_PARSER_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace kcenon::object_batch {

/**
 * @brief One progress observation of an in-flight item
 */
struct progress_sample {
    uint64_t bytes_done = 0;
    uint64_t total_bytes = 0;
    std::chrono::steady_clock::time_point timestamp{};
};

/**
 * @brief Interface for transport output parsers
 */
class progress_parser {
public:
    virtual ~progress_parser() = default;

    /**
     * @brief Parse one output line
     * @return A sample stamped with the current time, or nullopt if the line
     *         carries no progress information
     */
    [[nodiscard]] virtual auto parse(std::string_view line) const
        -> std::optional<progress_sample> = 0;
};

/**
 * @brief Parser for `aws s3 cp` progress lines
 *
 * Recognizes "Completed 1.5 MiB/10.0 MiB (2.1 MiB/s) with 1 file(s)
 * remaining" with units Bytes, KiB, MiB, GiB and TiB.
 */
class aws_cli_progress_parser : public progress_parser {
public:
    [[nodiscard]] auto parse(std::string_view line) const
        -> std::optional<progress_sample> override;

    /**
     * @brief Convert "1.5" + "MiB" into bytes
     */
    [[nodiscard]] static auto to_bytes(std::string_view amount, std::string_view unit)
        -> std::optional<uint64_t>;
};

/**
 * @brief Parser for plain "<done>/<total>" byte counters
 */
class byte_count_progress_parser : public progress_parser {
public:
    [[nodiscard]] auto parse(std::string_view line) const
        -> std::optional<progress_sample> override;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_PROGRESS_PROGRESS_PARSER_H
