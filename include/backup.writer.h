#pragma once

#include "backup.writer.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

#define BACKUP_WRITER_API_VERSION "0.1.0"

    /**
     * @brief The settings for a backup writer.
     * @details The destination is selected by @p destination. For
     * BackupDestination_Filesystem, the backup is written to
     * "<directory>/<object_name>". For BackupDestination_ObjectStore,
     * @p s3_settings must be set and the backup is uploaded to the object
     * @p object_name in the configured bucket.
     * @note The directory must exist; it is not created.
     */
    typedef struct BackupWriterSettings_s
    {
        const char* object_name; /**< File name or object key of the backup. */
        BackupDestinationKind destination; /**< Where the backup is written. */
        const char* directory; /**< Directory for filesystem destinations. */
        BackupS3Settings* s3_settings; /**< S3 settings for object store destinations. */
        BackupCompressionSettings* compression_settings; /**< Optional compression settings. */
        BackupCipher cipher; /**< Cipher to apply. Only BackupCipher_None is supported. */
        size_t pipe_buffer_bytes; /**< Bytes buffered ahead of the upload. 0 selects the default. */
    } BackupWriterSettings;

    typedef struct BackupWriter_s BackupWriter;

    /**
     * @brief Get the version of the backup writer API.
     * @return The version string.
     */
    const char* Backup_get_api_version();

    /**
     * @brief Set the log level for the backup writer API.
     * @param level The log level.
     * @return BackupStatusCode_Success on success, or an error code on failure.
     */
    BackupStatusCode Backup_set_log_level(BackupLogLevel level);

    /**
     * @brief Get the log level for the backup writer API.
     * @return The log level.
     */
    BackupLogLevel Backup_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param code The status code.
     * @return A human-readable status message.
     */
    const char* Backup_get_status_message(BackupStatusCode code);

    /**
     * @brief Open a backup writer.
     * @param[in] settings The settings for the writer.
     * @param[out] writer The writer, on success. Untouched on failure.
     * @return BackupStatusCode_Success on success, or an error code on failure.
     */
    BackupStatusCode BackupWriter_open(const BackupWriterSettings* settings,
                                       BackupWriter** writer);

    /**
     * @brief Write data to the backup.
     * @details This function blocks while an object store upload is behind.
     * @param[in, out] writer The writer.
     * @param[in] data The data to write.
     * @param[in] bytes_in The number of bytes in @p data.
     * @param[out] bytes_out The number of bytes written.
     * @return BackupStatusCode_Success on success, or an error code on failure.
     */
    BackupStatusCode BackupWriter_write(BackupWriter* writer,
                                        const void* data,
                                        size_t bytes_in,
                                        size_t* bytes_out);

    /**
     * @brief Flush and close every layer of the writer and wait for any upload
     * to finish.
     * @details Calling this more than once returns the result of the first
     * call.
     * @param[in, out] writer The writer.
     * @return BackupStatusCode_Success if the complete backup reached its
     * destination, or the code of the first error encountered.
     */
    BackupStatusCode BackupWriter_close(BackupWriter* writer);

    /**
     * @brief Destroy a backup writer, closing it first if necessary.
     * @param writer The writer to destroy.
     */
    void BackupWriter_destroy(BackupWriter* writer);

#ifdef __cplusplus
}
#endif
