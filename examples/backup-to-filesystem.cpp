/// @file backup-to-filesystem.cpp
/// @brief Compress standard input into a backup file.
/// Usage: backup-to-filesystem <directory> <name> [none|gzip|lz4|snappy]

#include "backup.writer.h"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <vector>

namespace {
bool
parse_codec(const char* name, BackupCodec* codec)
{
    const char* names[] = { "none", "gzip", "lz4", "snappy" };
    for (int i = 0; i < BackupCodecCount; ++i) {
        if (strcmp(name, names[i]) == 0) {
            *codec = static_cast<BackupCodec>(i);
            return true;
        }
    }
    return false;
}
} // namespace

int
main(int argc, char* argv[])
{
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0]
                  << " <directory> <name> [none|gzip|lz4|snappy]" << std::endl;
        return 1;
    }

    BackupCompressionSettings compression_settings = {
        .codec = BackupCodec_Gzip,
        .level = 0,
    };
    if (argc == 4 && !parse_codec(argv[3], &compression_settings.codec)) {
        std::cerr << "Unknown codec: " << argv[3] << std::endl;
        return 1;
    }

    BackupWriterSettings settings = {
        .object_name = argv[2],
        .destination = BackupDestination_Filesystem,
        .directory = argv[1],
        .s3_settings = nullptr,
        .compression_settings = &compression_settings,
        .cipher = BackupCipher_None,
        .pipe_buffer_bytes = 0,
    };

    BackupWriter* writer = nullptr;
    BackupStatusCode status = BackupWriter_open(&settings, &writer);
    if (status != BackupStatusCode_Success) {
        std::cerr << "Failed to open backup: "
                  << Backup_get_status_message(status) << std::endl;
        return 1;
    }

    std::vector<char> buf(1 << 16);
    size_t nbytes_total = 0;
    while (status == BackupStatusCode_Success) {
        const size_t nread = fread(buf.data(), 1, buf.size(), stdin);
        if (nread == 0) {
            break;
        }

        size_t bytes_out = 0;
        status = BackupWriter_write(writer, buf.data(), nread, &bytes_out);
        nbytes_total += bytes_out;
    }

    if (status == BackupStatusCode_Success) {
        status = BackupWriter_close(writer);
    }
    BackupWriter_destroy(writer);

    if (status != BackupStatusCode_Success) {
        std::cerr << "Backup failed: " << Backup_get_status_message(status)
                  << std::endl;
        return 1;
    }

    std::cout << "Backed up " << nbytes_total << " bytes" << std::endl;
    return 0;
}
