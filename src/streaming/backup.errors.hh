#pragma once

#include "backup.writer.types.h"

#include <cstddef> // size_t
#include <stdexcept>
#include <string>

namespace backup {
/**
 * @brief Base class of every error raised by the backup writer.
 * @details Carries the status code the C API reports for the error.
 */
class BackupError : public std::runtime_error
{
  public:
    BackupError(BackupStatusCode status, const std::string& what)
      : std::runtime_error(what)
      , status_{ status }
    {
    }

    BackupStatusCode status() const noexcept { return status_; }

  private:
    BackupStatusCode status_;
};

/// Unknown destination kind or invalid settings.
class ConfigurationError : public BackupError
{
  public:
    explicit ConfigurationError(const std::string& what)
      : BackupError(BackupStatusCode_InvalidSettings, what)
    {
    }
};

/// Unknown codec or cipher, or a compression level out of range.
class UnsupportedCodecError : public BackupError
{
  public:
    explicit UnsupportedCodecError(const std::string& what)
      : BackupError(BackupStatusCode_UnsupportedCodec, what)
    {
    }
};

/// A layer of the writer could not be created.
class ConstructionError : public BackupError
{
  public:
    explicit ConstructionError(const std::string& what)
      : BackupError(BackupStatusCode_CreateError, what)
    {
    }
};

/// A write, flush or close of the layer at `layer_index()` failed.
class IOError : public BackupError
{
  public:
    IOError(size_t layer_index, const std::string& what)
      : BackupError(BackupStatusCode_IOError, what)
      , layer_index_{ layer_index }
    {
    }

    size_t layer_index() const noexcept { return layer_index_; }

  private:
    size_t layer_index_;
};

/// The background upload to the object store failed.
class UploadError : public BackupError
{
  public:
    explicit UploadError(const std::string& what)
      : BackupError(BackupStatusCode_UploadError, what)
    {
    }
};

/// The upload was abandoned before it completed, and nothing was stored.
class UploadAbortedError : public UploadError
{
  public:
    explicit UploadAbortedError(const std::string& what)
      : UploadError(what)
    {
    }
};

/// The writer is no longer accepting writes.
class WriterClosedError : public BackupError
{
  public:
    explicit WriterClosedError(const std::string& what)
      : BackupError(BackupStatusCode_WriterClosed, what)
    {
    }
};
} // namespace backup
