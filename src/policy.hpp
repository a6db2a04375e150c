#pragma once

#include "cacheentry.hpp"
#include "remotemetadata.hpp"

#include <string>

#include <cstdint>

// What to assume when the remote did not send a usable Last-Modified.
enum class MissingTimestamp
{
    // never trust the cache, every fetch transfers the resource again
    AlwaysOutdated,
    // judge the cache by its size alone
    SizeOnly,
};

enum class TransferAction
{
    Skip,
    Resume,
    Restart,
};

enum class DecisionReason
{
    UpToDate,
    Missing,
    Outdated,
    UnknownTimestamp,
    Oversized,
    Partial,
};

struct TransferDecision
{
    TransferAction action;
    // first byte to request, only non zero for Resume
    uint64_t offset;
    DecisionReason reason;

    bool operator==(const TransferDecision& other) const
    {
        return action == other.action && offset == other.offset &&
               reason == other.reason;
    }
    bool operator!=(const TransferDecision& other) const
    {
        return !(*this == other);
    }
};

bool dlsync_is_outdated(
        const RemoteMetadata& remote,
        const LocalCacheState& local,
        MissingTimestamp mode);

// Combines the remote snapshot and the local cache state into a decision.
// No I/O is performed.
TransferDecision dlsync_decide(
        const RemoteMetadata& remote,
        const LocalCacheState& local,
        MissingTimestamp mode = MissingTimestamp::AlwaysOutdated);

std::string action_to_string(TransferAction action);
std::string reason_to_string(DecisionReason reason);
