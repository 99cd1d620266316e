#include "backup.writer.hh"
#include "backup.errors.hh"
#include "test.layers.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;
    fs::path tmp_dir = fs::temp_directory_path() / TEST;

    try {
        CHECK(fs::create_directories(tmp_dir));

        auto store = std::make_shared<backup::test::MockObjectStore>();

        auto destination = backup::Destination::filesystem(tmp_dir.string());
        destination.bucket_name = "backups";
        destination.client = store;
        destination.kind = static_cast<BackupDestinationKind>(7);

        EXPECT_THROWS(backup::ConfigurationError,
                      BackupWriter_s("unknown.bak",
                                     destination,
                                     BackupCodec_Gzip,
                                     0,
                                     BackupCipher_None));

        // no file was created and the object store was never contacted
        CHECK(fs::is_empty(tmp_dir));
        EXPECT_EQ(int, store->ncalls.load(), 0);

        // the C settings are checked the same way
        BackupWriterSettings settings{};
        settings.object_name = "unknown.bak";
        settings.destination = static_cast<BackupDestinationKind>(7);
        settings.directory = "unused";
        EXPECT_THROWS(backup::ConfigurationError,
                      std::make_unique<BackupWriter_s>(&settings));

        EXPECT_THROWS(backup::ConfigurationError, BackupWriter_s(nullptr));

        // an object name of whitespace only
        EXPECT_THROWS(
          backup::ConfigurationError,
          BackupWriter_s(
            "  ", destination, BackupCodec_None, 0, BackupCipher_None));
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
