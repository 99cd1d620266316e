#pragma once

#include "backup.writer.h"
#include "destination.hh"
#include "layer.stack.hh"

#include <cstddef> // size_t
#include <functional>
#include <memory> // unique_ptr
#include <span>
#include <string>
#include <vector>

namespace backup {
/// Creates a layer wrapping @p next. May return nullptr to add no layer.
using LayerFactory =
  std::function<std::unique_ptr<WriterLayer>(WriterLayer& next)>;
} // namespace backup

struct BackupWriter_s
{
  public:
    /**
     * @brief Open a writer from C API settings.
     * @throws ConfigurationError if the settings are invalid.
     * @see BackupWriter_s(std::string_view, const backup::Destination&,
     * BackupCodec, uint8_t, BackupCipher, size_t)
     */
    explicit BackupWriter_s(const struct BackupWriterSettings_s* settings);

    /**
     * @brief Open a writer for @p object_name at @p destination.
     * @details Builds the sink, then the codec layer on top of it. The cipher
     * layer would go on top of the codec; BackupCipher_None adds none.
     * @throws ConfigurationError if the destination kind is unknown.
     * @throws UnsupportedCodecError if the codec, level or cipher is not
     * supported.
     * @throws ConstructionError if a layer cannot be created. Layers opened
     * before the failure are abandoned first.
     */
    BackupWriter_s(std::string_view object_name,
                   const backup::Destination& destination,
                   BackupCodec codec,
                   uint8_t compression_level,
                   BackupCipher cipher,
                   size_t pipe_buffer_bytes = 0);

    /**
     * @brief Open a writer whose encoding layers come from @p layers, pushed
     * in order on top of the sink.
     * @throws ConfigurationError if the destination kind is unknown.
     * @throws ConstructionError if the sink or a layer cannot be created.
     * Layers opened before the failure, the sink included, are abandoned
     * first.
     */
    BackupWriter_s(std::string_view object_name,
                   const backup::Destination& destination,
                   const std::vector<backup::LayerFactory>& layers,
                   size_t pipe_buffer_bytes = 0);

    ~BackupWriter_s() = default;

    /**
     * @brief Write data to the backup.
     * @param data The data to write.
     * @param nbytes The number of bytes to write.
     * @return The number of bytes written.
     * @throws WriterClosedError if the writer has been closed.
     * @throws IOError if a layer fails.
     */
    size_t write(const void* data, size_t nbytes);
    size_t write(std::span<const std::byte> data);

    /**
     * @brief Close the writer and wait for the backup to land.
     * @details A second call replays the outcome of the first.
     * @throws IOError if a layer fails to flush or close.
     * @throws UploadError if the upload to the object store failed.
     */
    void close();

    /** @brief Number of layers between the caller and the destination. */
    size_t layer_count() const noexcept;

  private:
    std::string object_name_;
    std::unique_ptr<backup::LayerStack> layers_;

    void open_(std::string_view object_name,
               const backup::Destination& destination,
               const std::vector<backup::LayerFactory>& layers,
               size_t pipe_buffer_bytes);
};
