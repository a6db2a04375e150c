#include "policy.hpp"

#include <catch2/catch.hpp>

#include <vector>

namespace
{
RemoteMetadata remote(uint64_t size, std::optional<int64_t> last_modified)
{
    RemoteMetadata r;
    r.size = size;
    r.last_modified = last_modified;
    r.url = "http://example.com/model.bin";
    return r;
}

LocalCacheState missing()
{
    return {false, 0, 0};
}

LocalCacheState present(uint64_t size, int64_t last_modified)
{
    return {true, size, last_modified};
}
}

TEST_CASE("missing cache entry is fetched from the start")
{
    const auto d = dlsync_decide(remote(100, 1000), missing());
    CHECK(d.action == TransferAction::Restart);
    CHECK(d.offset == 0);
    CHECK(d.reason == DecisionReason::Missing);
}

TEST_CASE("complete and fresh cache entry is skipped")
{
    SECTION("remote older than local")
    {
        const auto d = dlsync_decide(remote(100, 1000), present(100, 2000));
        const TransferDecision skip{
                TransferAction::Skip, 0, DecisionReason::UpToDate};
        CHECK(d == skip);
    }
    SECTION("same timestamp")
    {
        const auto d = dlsync_decide(remote(100, 2000), present(100, 2000));
        CHECK(d.action == TransferAction::Skip);
    }
    SECTION("empty resource")
    {
        const auto d = dlsync_decide(remote(0, 1000), present(0, 2000));
        CHECK(d.action == TransferAction::Skip);
    }
}

TEST_CASE("newer remote restarts whatever the local size")
{
    for (uint64_t size : {0, 40, 100, 150})
    {
        const auto d = dlsync_decide(remote(100, 3000), present(size, 2000));
        CHECK(d.action == TransferAction::Restart);
        CHECK(d.offset == 0);
        CHECK(d.reason == DecisionReason::Outdated);
    }
}

TEST_CASE("partial fresh cache entry resumes at its size")
{
    const auto d = dlsync_decide(remote(100, 1000), present(37, 2000));
    CHECK(d.action == TransferAction::Resume);
    CHECK(d.offset == 37);
    CHECK(d.reason == DecisionReason::Partial);
}

TEST_CASE("oversized cache entry restarts")
{
    const auto d = dlsync_decide(remote(100, 1000), present(150, 2000));
    CHECK(d.action == TransferAction::Restart);
    CHECK(d.offset == 0);
    CHECK(d.reason == DecisionReason::Oversized);
}

TEST_CASE("remote without timestamp")
{
    SECTION("is always outdated by default")
    {
        const auto d = dlsync_decide(remote(100, {}), present(100, 2000));
        CHECK(d.action == TransferAction::Restart);
        CHECK(d.reason == DecisionReason::UnknownTimestamp);
        CHECK(dlsync_is_outdated(
                remote(100, {}),
                present(100, 2000),
                MissingTimestamp::AlwaysOutdated));
    }

    SECTION("compares sizes only in size mode")
    {
        const auto mode = MissingTimestamp::SizeOnly;
        CHECK(dlsync_decide(remote(100, {}), present(100, 2000), mode).action ==
              TransferAction::Skip);

        const auto partial =
                dlsync_decide(remote(100, {}), present(60, 2000), mode);
        CHECK(partial.action == TransferAction::Resume);
        CHECK(partial.offset == 60);

        CHECK(dlsync_decide(remote(100, {}), present(120, 2000), mode).reason ==
              DecisionReason::Oversized);
        CHECK(dlsync_decide(remote(100, {}), missing(), mode).reason ==
              DecisionReason::Missing);
    }
}

TEST_CASE("decisions do not depend on call history")
{
    const std::vector<std::pair<RemoteMetadata, LocalCacheState>> inputs = {
            {remote(100, 1000), missing()},
            {remote(100, 1000), present(100, 2000)},
            {remote(100, 3000), present(100, 2000)},
            {remote(100, 1000), present(10, 2000)},
            {remote(100, 1000), present(200, 2000)},
            {remote(100, {}), present(100, 2000)},
    };

    std::vector<TransferDecision> forward;
    for (const auto& input : inputs)
        forward.push_back(dlsync_decide(input.first, input.second));

    for (size_t i = inputs.size(); i-- > 0;)
    {
        CHECK(dlsync_decide(inputs[i].first, inputs[i].second) == forward[i]);
        CHECK(dlsync_decide(inputs[i].first, inputs[i].second) == forward[i]);
    }
}

TEST_CASE("decisions print")
{
    CHECK(action_to_string(TransferAction::Resume) == "resume");
    CHECK(reason_to_string(DecisionReason::Oversized) ==
          "cache is larger than remote");
}
