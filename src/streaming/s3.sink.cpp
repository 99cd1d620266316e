#include "macros.hh"
#include "s3.sink.hh"
#include "backup.errors.hh"

#include <algorithm>

backup::S3Sink::S3Sink(std::string_view bucket_name,
                       std::string_view object_key,
                       std::shared_ptr<ObjectStoreClient> client,
                       size_t pipe_capacity,
                       size_t part_size)
  : bucket_name_{ bucket_name }
  , object_key_{ object_key }
  , client_{ client }
  , pipe_{ pipe_capacity }
  , closed_{ false }
  , awaited_{ false }
  , nbytes_buffered_{ 0 }
  , nbytes_flushed_{ 0 }
{
    EXPECT(!bucket_name_.empty(), "Bucket name must not be empty");
    EXPECT(!object_key_.empty(), "Object key must not be empty");
    EXPECT(client_, "Null pointer: client");
    EXPECT(part_size > 0, "Part size must be positive");

    part_buffer_.resize(part_size);
    upload_result_ = upload_promise_.get_future();
    upload_thread_ = std::thread([this] { upload_(); });
}

backup::S3Sink::~S3Sink() noexcept
{
    if (!closed_) {
        LOG_WARNING("Object ", object_key_, " was not closed, abandoning it");
        pipe_.close_write("sink destroyed before close");
    }

    if (upload_thread_.joinable()) {
        upload_thread_.join();
    }
}

bool
backup::S3Sink::write(std::span<const std::byte> data)
{
    if (closed_) {
        LOG_ERROR("Cannot write to closed object ", object_key_);
        return false;
    }

    if (data.empty()) {
        return true;
    }

    if (!pipe_.write(data)) {
        LOG_ERROR("Upload of object ",
                  object_key_,
                  " stopped accepting data: ",
                  pipe_.error());
        return false;
    }

    return true;
}

bool
backup::S3Sink::close()
{
    if (!closed_) {
        closed_ = true;
        pipe_.close_write();
    }
    return true;
}

bool
backup::S3Sink::abort(std::string_view reason)
{
    closed_ = true;
    pipe_.close_write("upload aborted: " + std::string(reason));
    return true;
}

void
backup::S3Sink::await_completion()
{
    EXPECT(closed_,
           "Object ",
           object_key_,
           " must be closed before awaiting its upload");

    if (upload_thread_.joinable()) {
        upload_thread_.join();
    }

    if (!awaited_) {
        awaited_ = true;
        upload_result_.get(); // rethrows the upload error, if any
    }
}

void
backup::S3Sink::upload_() noexcept
{
    try {
        upload_stream_();
        LOG_DEBUG("Uploaded ",
                  nbytes_flushed_,
                  " bytes to object ",
                  object_key_,
                  " in bucket ",
                  bucket_name_);
        upload_promise_.set_value();
    } catch (const UploadAbortedError& exc) {
        LOG_DEBUG(exc.what());
        abort_multipart_upload_();
        upload_promise_.set_exception(std::current_exception());
    } catch (const std::exception& exc) {
        const std::string err = "Upload of object '" + object_key_ +
                                "' to bucket '" + bucket_name_ +
                                "' failed: " + exc.what();
        LOG_ERROR(err);

        abort_multipart_upload_();

        // unblock a writer waiting on a full pipe
        pipe_.close_read(exc.what());
        upload_promise_.set_exception(std::make_exception_ptr(UploadError(err)));
    }
}

void
backup::S3Sink::upload_stream_()
{
    while (true) {
        std::span<std::byte> free_space(part_buffer_.data() + nbytes_buffered_,
                                        part_buffer_.size() - nbytes_buffered_);
        const size_t nbytes_read = pipe_.read(free_space);
        if (nbytes_read == 0) {
            break;
        }

        nbytes_buffered_ += nbytes_read;
        if (nbytes_buffered_ == part_buffer_.size()) {
            flush_part_();
        }
    }

    // only the writer closes the pipe with an error while we still read
    if (const auto err = pipe_.error(); !err.empty()) {
        throw UploadAbortedError("Upload of object '" + object_key_ +
                                 "' to bucket '" + bucket_name_ +
                                 "' abandoned: " + err);
    }

    if (multipart_upload_.has_value()) {
        if (nbytes_buffered_ > 0) {
            flush_part_();
        }
        finalize_multipart_upload_();
    } else {
        put_object_();
    }
}

void
backup::S3Sink::put_object_()
{
    std::span<const std::byte> data(part_buffer_.data(), nbytes_buffered_);

    std::string etag = client_->put_object(bucket_name_, object_key_, data);
    EXPECT(!etag.empty(), "Failed to upload object: ", object_key_);

    nbytes_flushed_ += nbytes_buffered_;
    nbytes_buffered_ = 0;
}

void
backup::S3Sink::create_multipart_upload_()
{
    if (multipart_upload_.has_value()) {
        return;
    }

    std::string upload_id =
      client_->create_multipart_object(bucket_name_, object_key_);
    EXPECT(!upload_id.empty(),
           "Failed to create multipart upload of object ",
           object_key_);

    multipart_upload_ = MultiPartUpload{ .upload_id = upload_id, .parts = {} };
}

void
backup::S3Sink::flush_part_()
{
    create_multipart_upload_();

    auto& parts = multipart_upload_->parts;

    UploadedPart part;
    part.number = static_cast<unsigned int>(parts.size()) + 1;

    std::span<const std::byte> data(part_buffer_.data(), nbytes_buffered_);
    part.etag =
      client_->upload_multipart_object_part(bucket_name_,
                                            object_key_,
                                            multipart_upload_->upload_id,
                                            data,
                                            part.number);
    EXPECT(!part.etag.empty(),
           "Failed to upload part ",
           part.number,
           " of object ",
           object_key_);

    parts.push_back(part);

    nbytes_flushed_ += nbytes_buffered_;
    nbytes_buffered_ = 0;
}

void
backup::S3Sink::finalize_multipart_upload_()
{
    const bool completed =
      client_->complete_multipart_object(bucket_name_,
                                         object_key_,
                                         multipart_upload_->upload_id,
                                         multipart_upload_->parts);
    EXPECT(completed,
           "Failed to finalize multipart upload of object ",
           object_key_);
}

void
backup::S3Sink::abort_multipart_upload_() noexcept
{
    if (!multipart_upload_.has_value()) {
        return;
    }

    try {
        if (!client_->abort_multipart_object(
              bucket_name_, object_key_, multipart_upload_->upload_id)) {
            LOG_ERROR("Failed to abort multipart upload of object ",
                      object_key_);
        }
    } catch (const std::exception& exc) {
        LOG_ERROR("Error aborting multipart upload of object ",
                  object_key_,
                  ": ",
                  exc.what());
    }
    multipart_upload_.reset();
}
