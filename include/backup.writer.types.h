#ifndef H_BACKUP_WRITER_TYPES_V0
#define H_BACKUP_WRITER_TYPES_V0

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        BackupStatusCode_Success = 0,
        BackupStatusCode_InvalidArgument,
        BackupStatusCode_InvalidSettings,
        BackupStatusCode_UnsupportedCodec,
        BackupStatusCode_CreateError,
        BackupStatusCode_IOError,
        BackupStatusCode_UploadError,
        BackupStatusCode_WriterClosed,
        BackupStatusCode_InternalError,
        BackupStatusCode_OutOfMemory,
        BackupStatusCodeCount,
    } BackupStatusCode;

    typedef enum
    {
        BackupLogLevel_Debug = 0,
        BackupLogLevel_Info,
        BackupLogLevel_Warning,
        BackupLogLevel_Error,
        BackupLogLevel_None,
        BackupLogLevelCount
    } BackupLogLevel;

    typedef enum
    {
        BackupDestination_Filesystem = 0,
        BackupDestination_ObjectStore,
        BackupDestinationCount
    } BackupDestinationKind;

    typedef enum
    {
        BackupCodec_None = 0,
        BackupCodec_Gzip,
        BackupCodec_Lz4,
        BackupCodec_Snappy,
        BackupCodecCount
    } BackupCodec;

    typedef enum
    {
        BackupCipher_None = 0,
        BackupCipherCount
    } BackupCipher;

    /**
     * @brief S3 settings for writing a backup to object storage.
     */
    typedef struct
    {
        const char* endpoint;
        const char* bucket_name;
        const char* access_key_id;
        const char* secret_access_key;
    } BackupS3Settings;

    /**
     * @brief Compression settings for the backup stream.
     */
    typedef struct
    {
        BackupCodec codec; /**< Codec to use */
        uint8_t level;     /**< Compression level. 0 selects the default. */
    } BackupCompressionSettings;

#ifdef __cplusplus
}
#endif

#endif // H_BACKUP_WRITER_TYPES_V0
