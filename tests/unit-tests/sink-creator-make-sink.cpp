#include "sink.creator.hh"
#include "backup.errors.hh"
#include "test.layers.hh"
#include "unit.test.macros.hh"

#include <filesystem>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;
    fs::path tmp_dir = fs::temp_directory_path() / TEST;

    try {
        CHECK(fs::create_directories(tmp_dir));

        backup::SinkCreator creator;

        // filesystem, with and without a file:// prefix
        {
            auto sink = creator.make_sink(
              backup::Destination::filesystem(tmp_dir.string()), "a.dat");
            CHECK(sink);
            CHECK(sink->kind() == backup::LayerKind::Sink);
            CHECK(sink->close());
            CHECK(fs::exists(tmp_dir / "a.dat"));

            sink = creator.make_sink(
              backup::Destination::filesystem("file://" + tmp_dir.string()),
              "b.dat");
            CHECK(sink->close());
            CHECK(fs::exists(tmp_dir / "b.dat"));
        }

        // the directory is not created on the caller's behalf
        EXPECT_THROWS(backup::ConstructionError,
                      creator.make_sink(backup::Destination::filesystem(
                                          (tmp_dir / "missing").string()),
                                        "c.dat"));
        CHECK(!fs::exists(tmp_dir / "missing"));

        // unknown destination kinds
        {
            auto store = std::make_shared<backup::test::MockObjectStore>();
            auto destination =
              backup::Destination::object_store("backups", store);
            destination.kind = static_cast<BackupDestinationKind>(42);

            EXPECT_THROWS(backup::ConfigurationError,
                          creator.make_sink(destination, "d.dat"));
            EXPECT_EQ(int, store->ncalls.load(), 0);
        }

        // object store with a missing bucket
        {
            auto store = std::make_shared<backup::test::MockObjectStore>();
            EXPECT_THROWS(backup::ConstructionError,
                          creator.make_sink(backup::Destination::object_store(
                                              "no-such-bucket", store),
                                            "e.dat"));
        }

        // object store without a client
        EXPECT_THROWS(backup::ConfigurationError,
                      creator.make_sink(
                        backup::Destination::object_store("backups", nullptr),
                        "f.dat"));

        // object store
        {
            auto store = std::make_shared<backup::test::MockObjectStore>();
            auto sink = creator.make_sink(
              backup::Destination::object_store("backups", store), "g.dat");
            CHECK(sink->name() == "s3");
            CHECK(sink->close());
            sink->await_completion();
            EXPECT_STR_EQ(store->object_key.c_str(), "g.dat");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(tmp_dir, ec);
    if (ec) {
        LOG_ERROR("Failed to remove directory: ", ec.message());
        retval = 1;
    }

    return retval;
}
