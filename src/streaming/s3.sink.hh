#pragma once

#include "writer.layer.hh"
#include "bounded.pipe.hh"
#include "object.store.client.hh"

#include <future>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace backup {
/**
 * @brief A sink that streams bytes to an object store.
 * @details Bytes written to the sink go through a bounded pipe to a background
 * thread, started on construction, which uploads them. Objects that fit in a
 * single part are uploaded with one request, larger objects with a multipart
 * upload. Writes block while the pipe is full.
 */
class S3Sink : public Sink
{
  public:
    /// S3's minimum size for every part but the last.
    static constexpr size_t default_part_size = 5 << 20;

    S3Sink(std::string_view bucket_name,
           std::string_view object_key,
           std::shared_ptr<ObjectStoreClient> client,
           size_t pipe_capacity = BoundedPipe::default_capacity,
           size_t part_size = default_part_size);
    ~S3Sink() noexcept override;

    std::string_view name() const noexcept override { return "s3"; }

    bool write(std::span<const std::byte> data) override;
    bool close() override;
    bool abort(std::string_view reason) override;

    /**
     * @brief Wait for the upload thread to finish.
     * @throws UploadAbortedError if the sink was aborted or destroyed first.
     * @throws UploadError if the upload failed.
     * @throws std::runtime_error if the sink has not been closed.
     */
    void await_completion() override;

  private:
    struct MultiPartUpload
    {
        std::string upload_id;
        std::list<UploadedPart> parts;
    };

    std::string bucket_name_;
    std::string object_key_;
    std::shared_ptr<ObjectStoreClient> client_;

    BoundedPipe pipe_;
    bool closed_;
    bool awaited_;

    // owned by the upload thread until it completes
    std::vector<std::byte> part_buffer_;
    size_t nbytes_buffered_;
    size_t nbytes_flushed_;
    std::optional<MultiPartUpload> multipart_upload_;

    std::promise<void> upload_promise_;
    std::future<void> upload_result_;
    std::thread upload_thread_;

    /// @brief Body of the upload thread. Signals completion exactly once.
    void upload_() noexcept;

    /// @brief Drain the pipe into the object store.
    void upload_stream_();

    /// @brief Upload the buffered bytes as the whole object.
    void put_object_();

    /// @brief Create a new multipart upload, if none is in progress.
    void create_multipart_upload_();

    /// @brief Upload the buffered bytes as the next part.
    void flush_part_();

    /// @brief Complete the multipart upload.
    void finalize_multipart_upload_();

    /// @brief Abort the multipart upload, if any. Failures are logged.
    void abort_multipart_upload_() noexcept;
};
} // namespace backup
