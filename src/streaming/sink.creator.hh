#pragma once

#include "destination.hh"
#include "writer.layer.hh"
#include "bounded.pipe.hh"

#include <memory>
#include <string_view>

namespace backup {
class SinkCreator final
{
  public:
    explicit SinkCreator(size_t pipe_capacity = BoundedPipe::default_capacity);
    ~SinkCreator() noexcept = default;

    /**
     * @brief Create the sink for an object at a destination.
     * @param destination Where the object is written.
     * @param object_name The file name or object key.
     * @return The sink. Never null.
     * @throws ConfigurationError if the destination kind is unknown or the
     * destination is incomplete.
     * @throws ConstructionError if the file cannot be created or the bucket
     * does not exist.
     */
    std::unique_ptr<Sink> make_sink(const Destination& destination,
                                    std::string_view object_name);

  private:
    size_t pipe_capacity_;

    /**
     * @brief Create a sink from a directory and a file name.
     * @throws ConstructionError if the file cannot be created.
     */
    std::unique_ptr<Sink> make_file_sink_(std::string_view directory,
                                          std::string_view file_name);

    /**
     * @brief Create a sink from an S3 bucket name and object key.
     * @throws ConstructionError if the bucket does not exist or cannot be
     * checked.
     */
    std::unique_ptr<Sink> make_s3_sink_(
      std::string_view bucket_name,
      std::string_view object_key,
      std::shared_ptr<ObjectStoreClient> client);

    /// @brief Check whether an S3 bucket exists.
    /// @param[in] client The object store to ask.
    /// @param[in] bucket_name The name of the bucket to check.
    /// @return True iff the bucket exists.
    /// @throws ConstructionError if the check fails with an exception.
    bool bucket_exists_(ObjectStoreClient& client,
                        std::string_view bucket_name);
};
} // namespace backup
