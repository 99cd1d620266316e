#include "backup.writer.hh"
#include "backup.errors.hh"
#include "unit.test.macros.hh"

#include <iostream>
#include <sstream>
#include <string>

namespace {
size_t
count_errors(const std::string& log)
{
    size_t count = 0;
    for (auto pos = log.find("[ERROR]"); pos != std::string::npos;
         pos = log.find("[ERROR]", pos + 1)) {
        ++count;
    }
    return count;
}

/// Open a writer, expecting ConfigurationError, and return what was logged.
std::string
rejected_open_log(const BackupWriterSettings& settings)
{
    std::ostringstream captured;
    auto* original = std::cerr.rdbuf(captured.rdbuf());

    bool rejected = false;
    try {
        BackupWriter_s writer(&settings);
    } catch (const backup::ConfigurationError&) {
        rejected = true;
    }
    std::cerr.rdbuf(original);

    CHECK(rejected);
    return captured.str();
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        BackupS3Settings s3_settings = {
            .endpoint = "  ",
            .bucket_name = "backups",
            .access_key_id = "key",
            .secret_access_key = "secret",
        };

        BackupWriterSettings settings{};
        settings.object_name = "blank.bak";
        settings.destination = BackupDestination_ObjectStore;
        settings.s3_settings = &s3_settings;
        settings.cipher = BackupCipher_None;

        // each blank field is reported once
        std::string log = rejected_open_log(settings);
        EXPECT_EQ(size_t, count_errors(log), 1);
        CHECK(log.find("endpoint is empty") != std::string::npos);

        s3_settings.endpoint = "http://localhost:9000";
        s3_settings.access_key_id = nullptr;
        log = rejected_open_log(settings);
        EXPECT_EQ(size_t, count_errors(log), 1);
        CHECK(log.find("access key ID is empty") != std::string::npos);

        s3_settings.access_key_id = "key";
        settings.object_name = "\t";
        log = rejected_open_log(settings);
        EXPECT_EQ(size_t, count_errors(log), 1);

        settings.object_name = "blank.bak";
        settings.destination = BackupDestination_Filesystem;
        settings.directory = " ";
        log = rejected_open_log(settings);
        EXPECT_EQ(size_t, count_errors(log), 1);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
