#include "pathlock.hpp"

#include "testutil.hpp"

TEST_CASE("a path is locked by one holder at a time")
{
    TempDir dir;
    const auto path = dir.path("model.bin");

    CHECK_FALSE(dlsync_is_path_locked(path));
    {
        PathLock lock(path);
        CHECK(dlsync_is_path_locked(path));
        CHECK_THROWS_AS(PathLock(path), TransferBusyError);
        CHECK_THROWS_AS(PathLock(dir.path("./sub/../model.bin")), TransferBusyError);

        PathLock other(dir.path("other.bin"));
        CHECK(dlsync_is_path_locked(dir.path("other.bin")));
    }
    CHECK_FALSE(dlsync_is_path_locked(path));
    CHECK_FALSE(dlsync_is_path_locked(dir.path("other.bin")));

    PathLock again(path);
    CHECK(again.key() == path);
}
