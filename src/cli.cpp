#include "config.hpp"
#include "httputil.hpp"
#include "log.hpp"
#include "resource.hpp"
#include "transfer.hpp"

#include <fmt/format.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>

static constexpr auto USAGE =
        "Usage: %s [probe <url>] [status <url> <path>] "
        "[fetch <url> <path> [config]]\n";

static std::atomic<bool> g_should_stop{false};

static void signal_handler(int)
{
    if (g_should_stop.load())
        std::_Exit(130);
    g_should_stop.store(true);
}

static std::string format_time(const std::optional<int64_t>& seconds)
{
    if (!seconds)
        return "unknown";
    return dlsync_format_http_date(*seconds);
}

int probe(int argc, char* argv[])
{
    if (argc != 3)
    {
        printf(USAGE, argv[0]);
        return 1;
    }

    const Config config{};
    const auto http = dlsync_make_http(argv[2], config);
    const auto remote = dlsync_resolve_remote(*http, argv[2]);

    fmt::print("url: {}\n", remote.url);
    fmt::print("size: {}\n", remote.size);
    fmt::print("last modified: {}\n", format_time(remote.last_modified));
    fmt::print("accept ranges: {}\n", remote.accept_ranges ? "yes" : "no");

    return 0;
}

int status(int argc, char* argv[])
{
    if (argc != 4)
    {
        printf(USAGE, argv[0]);
        return 1;
    }

    const CachedResource resource({argv[2], argv[3]});
    const auto local = resource.local();
    const auto decision = resource.plan();

    if (local.exists)
        fmt::print(
                "local: {} bytes, modified {}\n",
                local.size,
                format_time(local.last_modified));
    else
        fmt::print("local: missing\n");
    fmt::print(
            "remote: {} bytes, modified {}\n",
            resource.remote().size,
            format_time(resource.remote().last_modified));
    if (decision.action == TransferAction::Resume)
        fmt::print(
                "decision: {} from {} ({})\n",
                action_to_string(decision.action),
                decision.offset,
                reason_to_string(decision.reason));
    else
        fmt::print(
                "decision: {} ({})\n",
                action_to_string(decision.action),
                reason_to_string(decision.reason));

    return 0;
}

int fetch(int argc, char* argv[])
{
    if (argc != 4 && argc != 5)
    {
        printf(USAGE, argv[0]);
        return 1;
    }

    const auto config = argc == 5 ? dlsync_load_config(argv[4]) : Config{};

    CachedResource resource({argv[2], argv[3]}, config);

    uint64_t last_report = 0;
    const auto decision = resource.fetch(
            [&](uint64_t download_offset, uint64_t download_size) {
                if (download_offset != download_size &&
                    download_offset - last_report < 16 * config.chunk_size)
                    return;
                last_report = download_offset;
                fmt::print(
                        "{} / {} bytes ({:.1f}%)\n",
                        download_offset,
                        download_size,
                        download_size ? download_offset * 100.0 / download_size
                                      : 100.0);
            },
            [] { return g_should_stop.load(); });

    if (decision.action == TransferAction::Skip)
        fmt::print("{} is up to date\n", argv[3]);
    else
        fmt::print("{} ready at {}\n", argv[2], resource.local_uri());

    return 0;
}

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        printf(USAGE, argv[0]);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try
    {
        if (std::string(argv[1]) == "probe")
            return probe(argc, argv);
        if (std::string(argv[1]) == "status")
            return status(argc, argv);
        if (std::string(argv[1]) == "fetch")
            return fetch(argc, argv);
    }
    catch (const TransferCanceledError& e)
    {
        fmt::print(stderr, "{}\npartial download kept for resume\n", e.what());
        return 2;
    }
    catch (const std::exception& e)
    {
        fmt::print(stderr, "{}\n", e.what());
        return 2;
    }

    printf(USAGE, argv[0]);
    return 1;
}
