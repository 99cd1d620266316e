#include "backup.writer.h"
#include "test.macros.hh"

#include <zlib.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {
const std::string object_name = "collection.bak.gz";
const size_t documents_to_write = 10000;

std::string
make_document(size_t i)
{
    return "{\"_id\": " + std::to_string(i) + ", \"name\": \"document " +
           std::to_string(i) + "\"}\n";
}

BackupWriter*
setup(const fs::path& dir)
{
    BackupCompressionSettings compression_settings = {
        .codec = BackupCodec_Gzip,
        .level = 6,
    };

    const std::string directory = dir.string();
    BackupWriterSettings settings = {
        .object_name = object_name.c_str(),
        .destination = BackupDestination_Filesystem,
        .directory = directory.c_str(),
        .s3_settings = nullptr,
        .compression_settings = &compression_settings,
        .cipher = BackupCipher_None,
        .pipe_buffer_bytes = 0,
    };

    BackupWriter* writer = nullptr;
    CHECK_OK(BackupWriter_open(&settings, &writer));
    CHECK(writer != nullptr);

    return writer;
}

void
verify(const fs::path& path)
{
    CHECK(fs::is_regular_file(path));

    gzFile file = gzopen(path.string().c_str(), "rb");
    CHECK(file != nullptr);

    std::string contents;
    char buf[8192];
    int nread = 0;
    while ((nread = gzread(file, buf, sizeof(buf))) > 0) {
        contents.append(buf, nread);
    }
    const int err = nread < 0 ? Z_ERRNO : Z_OK;
    gzclose(file);
    EXPECT(err == Z_OK, "Failed to decompress ", path.string());

    std::string expected;
    for (size_t i = 0; i < documents_to_write; ++i) {
        expected += make_document(i);
    }
    EXPECT_EQ(size_t, contents.size(), expected.size());
    CHECK(contents == expected);
}
} // namespace

int
main()
{
    Backup_set_log_level(BackupLogLevel_Debug);

    const fs::path test_dir = fs::temp_directory_path() / TEST;
    int retval = 1;

    try {
        CHECK(fs::create_directories(test_dir));
        BackupWriter* writer = setup(test_dir);

        for (size_t i = 0; i < documents_to_write; ++i) {
            const std::string document = make_document(i);
            size_t bytes_out = 0;
            BackupStatusCode err = BackupWriter_write(
              writer, document.data(), document.size(), &bytes_out);
            EXPECT(err == BackupStatusCode_Success,
                   "Failed to write document ",
                   i,
                   ": ",
                   Backup_get_status_message(err));
            EXPECT_EQ(size_t, bytes_out, document.size());
        }

        CHECK_OK(BackupWriter_close(writer));
        CHECK_OK(BackupWriter_close(writer));

        size_t bytes_out = 1;
        CHECK_STATUS(BackupWriter_write(writer, "x", 1, &bytes_out),
                     BackupStatusCode_WriterClosed);
        EXPECT_EQ(size_t, bytes_out, 0);

        BackupWriter_destroy(writer);

        verify(test_dir / object_name);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(test_dir, ec);

    return retval;
}
