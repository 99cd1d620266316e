#pragma once

#include <cstddef> // std::byte
#include <list>
#include <span>
#include <string>
#include <string_view>

namespace backup {
struct UploadedPart
{
    unsigned int number;
    std::string etag;
};

/**
 * @brief The operations the backup writer needs from an object store.
 * @details Failed operations return an empty etag or false and log the
 * reason. Implementations may also throw.
 */
class ObjectStoreClient
{
  public:
    virtual ~ObjectStoreClient() = default;

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     */
    virtual bool bucket_exists(std::string_view bucket_name) = 0;

    /**
     * @brief Put an object.
     * @param bucket_name The name of the bucket to put the object in.
     * @param object_name The name of the object.
     * @param data The data to put in the object. May be empty.
     * @returns The etag of the object. Nonempty if and only if the operation
     * succeeds.
     */
    [[nodiscard]] virtual std::string put_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::span<const std::byte> data) = 0;

    /// @brief Create a multipart object.
    /// @returns The upload id of the multipart object. Nonempty if and only if
    ///          the operation succeeds.
    [[nodiscard]] virtual std::string create_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name) = 0;

    /// @brief Upload a part of a multipart object.
    /// @returns The etag of the uploaded part. Nonempty if and only if the
    ///          operation is successful.
    [[nodiscard]] virtual std::string upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      std::span<const std::byte> data,
      unsigned int part_number) = 0;

    /// @brief Complete a multipart object.
    /// @returns True if the object was successfully completed, otherwise false.
    [[nodiscard]] virtual bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::list<UploadedPart>& parts) = 0;

    /// @brief Abort a multipart object, discarding the parts uploaded so far.
    /// @returns True if the upload was aborted, otherwise false.
    virtual bool abort_multipart_object(std::string_view bucket_name,
                                        std::string_view object_name,
                                        std::string_view upload_id) = 0;
};
} // namespace backup
