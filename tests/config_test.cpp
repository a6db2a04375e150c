#include "config.hpp"
#include "file.hpp"

#include "testutil.hpp"

#include <cstring>

namespace
{
void write_text(const std::string& path, const char* text)
{
    dlsync_save(path, text, strlen(text));
}
}

TEST_CASE("missing config file gives defaults")
{
    TempDir dir;
    const auto config = dlsync_load_config(dir.path("dlsync.cfg"));

    CHECK(config.chunk_size == 1024 * 1024);
    CHECK(config.header_timeout == std::chrono::seconds(30));
    CHECK(config.stall_timeout == std::chrono::seconds(60));
    CHECK(config.missing_timestamp == MissingTimestamp::AlwaysOutdated);
    CHECK(config.max_redirects == 5);
    CHECK(config.user_agent == "dlsync/1.0");
}

TEST_CASE("config values are parsed")
{
    TempDir dir;
    const auto path = dir.path("dlsync.cfg");
    write_text(
            path,
            "chunk_size 4096\r\n"
            "HEADER_TIMEOUT 250\n"
            "stall_timeout   1500\n"
            "missing_timestamp size\n"
            "unknown_key whatever\n"
            "max_redirects 2\n"
            "user_agent test-agent/2");

    const auto config = dlsync_load_config(path);
    CHECK(config.chunk_size == 4096);
    CHECK(config.header_timeout == std::chrono::milliseconds(250));
    CHECK(config.stall_timeout == std::chrono::milliseconds(1500));
    CHECK(config.missing_timestamp == MissingTimestamp::SizeOnly);
    CHECK(config.max_redirects == 2);
    CHECK(config.user_agent == "test-agent/2");
}

TEST_CASE("saved config loads back")
{
    TempDir dir;
    const auto path = dir.path("dlsync.cfg");

    Config config;
    config.chunk_size = 65536;
    config.missing_timestamp = MissingTimestamp::SizeOnly;
    config.header_timeout = std::chrono::milliseconds(1234);
    dlsync_save_config(path, config);

    const auto loaded = dlsync_load_config(path);
    CHECK(loaded.chunk_size == 65536);
    CHECK(loaded.missing_timestamp == MissingTimestamp::SizeOnly);
    CHECK(loaded.header_timeout == std::chrono::milliseconds(1234));
    CHECK(loaded.user_agent == config.user_agent);
}

TEST_CASE("invalid config values are rejected")
{
    TempDir dir;
    const auto path = dir.path("dlsync.cfg");

    SECTION("number")
    {
        write_text(path, "header_timeout soon\n");
        CHECK_THROWS_AS(dlsync_load_config(path), ConfigError);
    }
    SECTION("zero chunk size")
    {
        write_text(path, "chunk_size 0\n");
        CHECK_THROWS_AS(dlsync_load_config(path), ConfigError);
    }
    SECTION("missing timestamp mode")
    {
        write_text(path, "missing_timestamp sometimes\n");
        CHECK_THROWS_AS(dlsync_load_config(path), ConfigError);
    }
}

TEST_CASE("user agent keeps its spaces")
{
    TempDir dir;
    const auto path = dir.path("dlsync.cfg");

    write_text(path, "user_agent dlsync/1.0 (linux; x86_64)  \nmax_redirects 3\n");
    auto config = dlsync_load_config(path);
    CHECK(config.user_agent == "dlsync/1.0 (linux; x86_64)");
    CHECK(config.max_redirects == 3);

    config.user_agent = "dlsync/2.0 (test build)";
    dlsync_save_config(path, config);
    CHECK(dlsync_load_config(path).user_agent == "dlsync/2.0 (test build)");
}
