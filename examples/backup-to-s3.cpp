/// @file backup-to-s3.cpp
/// @brief Stream standard input to an object in S3, compressed with LZ4.
/// Usage: backup-to-s3 <object key>
///
/// Reads the following environment variables:
/// - BACKUP_S3_ENDPOINT ("http://...") - the URI of the S3 server
/// - BACKUP_S3_BUCKET_NAME - the name of the bucket
/// - BACKUP_S3_ACCESS_KEY_ID - the access key ID for the S3 server
/// - BACKUP_S3_SECRET_ACCESS_KEY - the secret access key for the S3 server

#include "backup.writer.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

int
main(int argc, char* argv[])
{
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <object key>" << std::endl;
        return 1;
    }

    BackupS3Settings s3_settings = {
        .endpoint = std::getenv("BACKUP_S3_ENDPOINT"),
        .bucket_name = std::getenv("BACKUP_S3_BUCKET_NAME"),
        .access_key_id = std::getenv("BACKUP_S3_ACCESS_KEY_ID"),
        .secret_access_key = std::getenv("BACKUP_S3_SECRET_ACCESS_KEY"),
    };

    BackupCompressionSettings compression_settings = {
        .codec = BackupCodec_Lz4,
        .level = 0,
    };

    BackupWriterSettings settings = {
        .object_name = argv[1],
        .destination = BackupDestination_ObjectStore,
        .directory = nullptr,
        .s3_settings = &s3_settings,
        .compression_settings = &compression_settings,
        .cipher = BackupCipher_None,
        .pipe_buffer_bytes = 0,
    };

    Backup_set_log_level(BackupLogLevel_Info);

    BackupWriter* writer = nullptr;
    BackupStatusCode status = BackupWriter_open(&settings, &writer);
    if (status != BackupStatusCode_Success) {
        std::cerr << "Failed to open backup: "
                  << Backup_get_status_message(status) << std::endl;
        return 1;
    }

    // writes block while the upload catches up
    std::vector<char> buf(1 << 16);
    while (status == BackupStatusCode_Success) {
        const size_t nread = fread(buf.data(), 1, buf.size(), stdin);
        if (nread == 0) {
            break;
        }

        size_t bytes_out = 0;
        status = BackupWriter_write(writer, buf.data(), nread, &bytes_out);
    }

    // the upload result is only known once every layer is closed
    if (status == BackupStatusCode_Success) {
        status = BackupWriter_close(writer);
    }
    BackupWriter_destroy(writer);

    if (status != BackupStatusCode_Success) {
        std::cerr << "Backup failed: " << Backup_get_status_message(status)
                  << std::endl;
        return 1;
    }

    return 0;
}
