#include <gtest/gtest.h>

#include <filesystem>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using treecp::infra::Config;
using treecp::infra::ErrorCode;
using treecp::infra::config_from_cli;
using treecp::infra::load_config_from_file;
using treecp::infra::load_config_from_string;
using treecp::infra::parse_log_level;
using treecp::testing::TempDir;
using treecp::testing::write_file;

TEST(ConfigTest, DefaultsWhenEmpty)
{
    auto cfg = load_config_from_string("");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_FALSE(cfg->threads.has_value());
    EXPECT_TRUE(cfg->progress);
    EXPECT_FALSE(cfg->quiet);
    EXPECT_EQ(cfg->effective_buffer_size(), 32u * 1024u);
    EXPECT_EQ(cfg->submit_backoff(), 1000ms);
    EXPECT_EQ(cfg->progress_interval(), 100ms);
}

TEST(ConfigTest, ParsesAllKeys)
{
    auto cfg = load_config_from_string(R"(
threads: 8
pool_size: 4
queue_capacity: 16
submit_backoff_ms: 25
buffer_size: 65536
progress: false
quiet: true
progress_interval_ms: 250
log_level: debug
unknown_key: ignored
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->threads, 8u);
    EXPECT_EQ(cfg->effective_pool_size(), 4u);
    EXPECT_EQ(cfg->queue_capacity, 16u);
    EXPECT_EQ(cfg->submit_backoff(), 25ms);
    EXPECT_EQ(cfg->effective_buffer_size(), 65536u);
    EXPECT_FALSE(cfg->progress);
    EXPECT_TRUE(cfg->quiet);
    EXPECT_EQ(cfg->progress_interval(), 250ms);
    EXPECT_EQ(cfg->log_level, "debug");
}

TEST(ConfigTest, PoolSizeFollowsThreads)
{
    Config cfg;
    cfg.threads = 6;
    EXPECT_EQ(cfg.effective_pool_size(), 6u);
    cfg.pool_size = 2;
    EXPECT_EQ(cfg.effective_pool_size(), 2u);
}

TEST(ConfigTest, RejectsBadValues)
{
    for (const char* yaml : {"threads: abc", "threads: 0", "buffer_size: 0", "pool_size: 0",
                             "log_level: loud", "- just\n- a list", "threads: [1, 2"}) {
        auto cfg = load_config_from_string(yaml);
        ASSERT_FALSE(cfg.has_value()) << yaml;
        EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError) << yaml;
        EXPECT_TRUE(cfg.error().is_fatal());
    }
}

TEST(ConfigTest, CliOverridesFile)
{
    auto file_cfg = load_config_from_string("threads: 8\nbuffer_size: 4096\nlog_level: warn\n");
    ASSERT_TRUE(file_cfg.has_value());

    treecp::args_parser::CLIArgs args;
    args.source = "/src";
    args.target = "/dst";
    args.threads = 3;
    args.progress = false;

    Config cfg = *file_cfg;
    cfg.merge_with(config_from_cli(args));
    EXPECT_EQ(cfg.threads, 3u);
    EXPECT_EQ(cfg.effective_buffer_size(), 4096u); // не задано в CLI
    EXPECT_EQ(cfg.log_level, "warn");
    EXPECT_FALSE(cfg.progress);
    EXPECT_FALSE(cfg.quiet);
}

TEST(ConfigTest, ExplicitFile)
{
    TempDir tmp;
    write_file(tmp / "treecp.yaml", "threads: 5\nquiet: true\n");

    auto cfg = load_config_from_file(tmp / "treecp.yaml");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->threads, 5u);
    EXPECT_TRUE(cfg->quiet);

    auto missing = load_config_from_file(tmp / "absent.yaml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ConfigError);
}

TEST(ConfigTest, LogLevels)
{
    EXPECT_EQ(parse_log_level("debug").value(), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("off").value(), spdlog::level::off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}
