/**
 * @file test_aws_cli_transport.cpp
 * @brief Unit tests for the AWS CLI transport: command lines, output
 *        parsing and end-to-end runs against stand-in scripts
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace kcenon::object_batch::test {

namespace fs = std::filesystem;

// =============================================================================
// Command lines and parsing
// =============================================================================

class AwsCliCommandTest : public ::testing::Test {};

TEST_F(AwsCliCommandTest, CopyCommandCarriesProfileAndRegion) {
    aws_cli_config config;
    config.region = "eu-west-1";
    config.extra_copy_args = {"--only-show-errors"};
    aws_cli_transport transport(config);

    std::vector<std::string> expected{
        "aws", "s3", "cp", "/tmp/a.log", "s3://b/a.log",
        "--profile", "gt-logs", "--region", "eu-west-1", "--only-show-errors"};
    EXPECT_EQ(transport.copy_command("/tmp/a.log", "s3://b/a.log"), expected);
}

TEST_F(AwsCliCommandTest, StatAndListCommands) {
    aws_cli_config config;
    config.profile = "support";
    aws_cli_transport transport(config);

    std::vector<std::string> stat{
        "aws", "s3api", "head-object", "--bucket", "b", "--key", "dir/a.log",
        "--query", "ContentLength", "--output", "text", "--profile", "support"};
    EXPECT_EQ(transport.stat_command(s3_uri{"b", "dir/a.log"}), stat);

    std::vector<std::string> list{
        "aws", "s3", "ls", "s3://b/dir/", "--recursive", "--profile", "support"};
    EXPECT_EQ(transport.list_command(s3_uri{"b", "dir/"}), list);
}

TEST_F(AwsCliCommandTest, AuthenticatorCommands) {
    aws_cli_authenticator auth;
    std::vector<std::string> check{"aws", "sts", "get-caller-identity", "--profile", "gt-logs"};
    std::vector<std::string> login{"aws", "sso", "login", "--profile", "gt-logs"};
    EXPECT_EQ(auth.check_command(), check);
    EXPECT_EQ(auth.login_command(), login);
}

TEST_F(AwsCliCommandTest, ParseListing) {
    auto objects = aws_cli_transport::parse_listing(
        "2024-01-15 10:30:45   12345678 logs/a.tar.gz\n"
        "2024-01-15 10:31:00          0 logs/folder/\n"
        "2024-01-16 08:00:01        42 logs/name with spaces.txt\n"
        "garbage\n",
        "bucket");

    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects[0].key, "logs/a.tar.gz");
    EXPECT_EQ(objects[0].uri, "s3://bucket/logs/a.tar.gz");
    EXPECT_EQ(objects[0].size_bytes, 12345678u);
    EXPECT_EQ(objects[1].key, "logs/name with spaces.txt");
    EXPECT_EQ(objects[1].size_bytes, 42u);
}

TEST_F(AwsCliCommandTest, ParseContentLengthAndNotFound) {
    EXPECT_EQ(aws_cli_transport::parse_content_length("1048576\n"), 1048576u);
    EXPECT_FALSE(aws_cli_transport::parse_content_length("None").has_value());

    EXPECT_TRUE(aws_cli_transport::is_not_found(
        "An error occurred (404) when calling the HeadObject operation: Not Found"));
    EXPECT_FALSE(aws_cli_transport::is_not_found("An error occurred (403): Forbidden"));
}

TEST_F(AwsCliCommandTest, ClassifyFailure) {
    EXPECT_EQ(aws_cli_transport::classify_failure(
                  "Could not connect to the endpoint URL: \"https://b.s3.amazonaws.com/\""),
              error_code::network_error);
    EXPECT_EQ(aws_cli_transport::classify_failure("Read timeout on endpoint URL"),
              error_code::transport_timeout);
    EXPECT_EQ(aws_cli_transport::classify_failure("An error occurred (AccessDenied)"),
              error_code::transport_failed);
}

// =============================================================================
// End-to-end against stand-in executables
// =============================================================================

class AwsCliScriptTest : public TempDirectoryFixture {
protected:
    auto write_script(const std::string& body) -> aws_cli_transport {
        auto path = test_dir_ / "fake-aws";
        {
            std::ofstream script(path);
            script << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(path, fs::perms::owner_all);

        aws_cli_config config;
        config.executable = path.string();
        config.command_timeout = std::chrono::milliseconds{5000};
        return aws_cli_transport(config);
    }

    cancellation_token cancel_;
};

TEST_F(AwsCliScriptTest, CopyStreamsProgress) {
    auto transport = write_script(
        "printf 'Completed 5 Bytes/10 Bytes (5 Bytes/s) with 1 file(s) remaining\\r'\n"
        "printf 'Completed 10 Bytes/10 Bytes (5 Bytes/s) with 1 file(s) remaining\\r'\n"
        "echo \"upload: $3 to $4\"");

    std::vector<std::string> lines;
    auto copied = transport.copy("/tmp/a.log", "s3://b/a.log",
        [&lines](std::string_view line) { lines.emplace_back(line); }, cancel_);
    ASSERT_TRUE(copied) << copied.error().message;

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "upload: /tmp/a.log to s3://b/a.log");

    aws_cli_progress_parser parser;
    auto sample = parser.parse(lines[1]);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->bytes_done, 10u);
}

TEST_F(AwsCliScriptTest, CopyFailureCarriesStderr) {
    auto transport = write_script(
        "echo 'Could not connect to the endpoint URL' >&2\nexit 1");

    auto copied = transport.copy("/tmp/a.log", "s3://b/a.log", nullptr, cancel_);
    ASSERT_FALSE(copied);
    EXPECT_EQ(copied.error().code, error_code::network_error);
    EXPECT_NE(copied.error().message.find("exited with code 1"), std::string::npos);
    EXPECT_NE(copied.error().message.find("Could not connect"), std::string::npos);
}

TEST_F(AwsCliScriptTest, DownloadCreatesParentDirectory) {
    auto transport = write_script("exit 0");
    auto target = download_dir_ / "nested" / "a.log";

    ASSERT_TRUE(transport.copy("s3://b/a.log", target.string(), nullptr, cancel_));
    EXPECT_TRUE(fs::is_directory(target.parent_path()));
}

TEST_F(AwsCliScriptTest, StatReadsContentLength) {
    auto transport = write_script("echo 2048");

    auto size = transport.stat("s3://b/a.log");
    ASSERT_TRUE(size.has_value());
    ASSERT_TRUE(size.value().has_value());
    EXPECT_EQ(*size.value(), 2048u);
}

TEST_F(AwsCliScriptTest, StatNotFoundIsEmpty) {
    auto transport = write_script(
        "echo 'An error occurred (404) when calling the HeadObject operation: Not Found' >&2\n"
        "exit 254");

    auto size = transport.stat("s3://b/a.log");
    ASSERT_TRUE(size.has_value());
    EXPECT_FALSE(size.value().has_value());
}

TEST_F(AwsCliScriptTest, StatOtherFailure) {
    auto transport = write_script("echo 'ExpiredToken' >&2\nexit 255");

    auto size = transport.stat("s3://b/a.log");
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code, error_code::remote_stat_failed);
}

TEST_F(AwsCliScriptTest, ListParsesOutputAndEmptyPrefix) {
    auto listing = write_script("echo '2024-01-15 10:30:45        7 p/a.log'");
    auto objects = listing.list("s3://b/p/");
    ASSERT_TRUE(objects.has_value());
    ASSERT_EQ(objects.value().size(), 1u);
    EXPECT_EQ(objects.value()[0].uri, "s3://b/p/a.log");

    auto empty = write_script("exit 1");
    auto none = empty.list("s3://b/p/");
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none.value().empty());
}

}  // namespace kcenon::object_batch::test
