#include "policy.hpp"

bool dlsync_is_outdated(
        const RemoteMetadata& remote,
        const LocalCacheState& local,
        MissingTimestamp mode)
{
    if (!local.exists)
        return true;
    if (remote.last_modified)
        return *remote.last_modified > local.last_modified;
    return mode == MissingTimestamp::AlwaysOutdated;
}

TransferDecision dlsync_decide(
        const RemoteMetadata& remote,
        const LocalCacheState& local,
        MissingTimestamp mode)
{
    const bool outdated = dlsync_is_outdated(remote, local, mode);

    if (local.exists && local.size == remote.size && !outdated)
        return {TransferAction::Skip, 0, DecisionReason::UpToDate};

    if (!local.exists)
        return {TransferAction::Restart, 0, DecisionReason::Missing};

    if (outdated)
        return {TransferAction::Restart,
                0,
                remote.last_modified ? DecisionReason::Outdated
                                     : DecisionReason::UnknownTimestamp};

    if (local.size > remote.size)
        return {TransferAction::Restart, 0, DecisionReason::Oversized};

    return {TransferAction::Resume, local.size, DecisionReason::Partial};
}

std::string action_to_string(TransferAction action)
{
    switch (action)
    {
    case TransferAction::Skip:
        return "skip";
    case TransferAction::Resume:
        return "resume";
    case TransferAction::Restart:
        return "restart";
    }
    return "unknown";
}

std::string reason_to_string(DecisionReason reason)
{
    switch (reason)
    {
    case DecisionReason::UpToDate:
        return "cache is up to date";
    case DecisionReason::Missing:
        return "cache entry is missing";
    case DecisionReason::Outdated:
        return "remote is newer than cache";
    case DecisionReason::UnknownTimestamp:
        return "remote has no last-modified time";
    case DecisionReason::Oversized:
        return "cache is larger than remote";
    case DecisionReason::Partial:
        return "cache holds a partial download";
    }
    return "unknown";
}
