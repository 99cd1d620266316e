#include "backup.writer.h"
#include "backup.writer.hh"
#include "backup.errors.hh"
#include "macros.hh"

namespace {
BackupStatusCode
status_of(const std::exception& exc)
{
    if (const auto* err = dynamic_cast<const backup::BackupError*>(&exc)) {
        return err->status();
    }
    if (dynamic_cast<const std::bad_alloc*>(&exc)) {
        return BackupStatusCode_OutOfMemory;
    }
    return BackupStatusCode_InternalError;
}
} // namespace

extern "C"
{
    const char* Backup_get_api_version()
    {
        return BACKUP_WRITER_API_VERSION;
    }

    BackupStatusCode Backup_set_log_level(BackupLogLevel level_)
    {
        LogLevel level;
        switch (level_) {
            case BackupLogLevel_Debug:
                level = LogLevel_Debug;
                break;
            case BackupLogLevel_Info:
                level = LogLevel_Info;
                break;
            case BackupLogLevel_Warning:
                level = LogLevel_Warning;
                break;
            case BackupLogLevel_Error:
                level = LogLevel_Error;
                break;
            case BackupLogLevel_None:
                level = LogLevel_None;
                break;
            default:
                return BackupStatusCode_InvalidArgument;
        }

        Logger::set_log_level(level);
        return BackupStatusCode_Success;
    }

    BackupLogLevel Backup_get_log_level()
    {
        BackupLogLevel level;
        switch (Logger::get_log_level()) {
            case LogLevel_Debug:
                level = BackupLogLevel_Debug;
                break;
            case LogLevel_Info:
                level = BackupLogLevel_Info;
                break;
            case LogLevel_Warning:
                level = BackupLogLevel_Warning;
                break;
            case LogLevel_Error:
                level = BackupLogLevel_Error;
                break;
            default:
                level = BackupLogLevel_None;
                break;
        }
        return level;
    }

    const char* Backup_get_status_message(BackupStatusCode code)
    {
        switch (code) {
            case BackupStatusCode_Success:
                return "Success";
            case BackupStatusCode_InvalidArgument:
                return "Invalid argument";
            case BackupStatusCode_InvalidSettings:
                return "Invalid settings";
            case BackupStatusCode_UnsupportedCodec:
                return "Unsupported codec";
            case BackupStatusCode_CreateError:
                return "Cannot create destination";
            case BackupStatusCode_IOError:
                return "I/O error";
            case BackupStatusCode_UploadError:
                return "Upload error";
            case BackupStatusCode_WriterClosed:
                return "Writer is closed";
            case BackupStatusCode_InternalError:
                return "Internal error";
            case BackupStatusCode_OutOfMemory:
                return "Out of memory";
            default:
                return "Unknown error";
        }
    }

    BackupStatusCode BackupWriter_open(const BackupWriterSettings* settings,
                                       BackupWriter** writer)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");

        try {
            *writer = new BackupWriter_s(settings);
        } catch (const std::exception& e) {
            LOG_ERROR("Error opening backup writer: ", e.what());
            return status_of(e);
        }

        return BackupStatusCode_Success;
    }

    BackupStatusCode BackupWriter_write(BackupWriter* writer,
                                        const void* data,
                                        size_t bytes_in,
                                        size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");
        EXPECT_VALID_ARGUMENT(data || bytes_in == 0, "Null pointer: data");
        EXPECT_VALID_ARGUMENT(bytes_out, "Null pointer: bytes_out");

        *bytes_out = 0;
        try {
            *bytes_out = writer->write(data, bytes_in);
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing data: ", e.what());
            return status_of(e);
        }

        return BackupStatusCode_Success;
    }

    BackupStatusCode BackupWriter_close(BackupWriter* writer)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");

        try {
            writer->close();
        } catch (const std::exception& e) {
            LOG_ERROR("Error closing backup writer: ", e.what());
            return status_of(e);
        }

        return BackupStatusCode_Success;
    }

    void BackupWriter_destroy(BackupWriter* writer)
    {
        delete writer;
    }
}
