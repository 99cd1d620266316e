#pragma once

#include "object.store.client.hh"

#include <miniocpp/client.h>

#include <memory>
#include <string>

namespace backup {
/**
 * @brief An object store client backed by minio-cpp.
 */
class S3Connection final : public ObjectStoreClient
{
  public:
    S3Connection(const std::string& endpoint,
                 const std::string& access_key_id,
                 const std::string& secret_access_key);

    ~S3Connection() noexcept override = default;

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool check_connection();

    bool bucket_exists(std::string_view bucket_name) override;

    /**
     * @brief Check whether an object exists.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    [[nodiscard]] std::string put_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::span<const std::byte> data) override;

    /**
     * @brief Delete an object.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object was successfully deleted, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    [[nodiscard]] bool delete_object(std::string_view bucket_name,
                                     std::string_view object_name);

    [[nodiscard]] std::string create_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name) override;

    [[nodiscard]] std::string upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      std::span<const std::byte> data,
      unsigned int part_number) override;

    [[nodiscard]] bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::list<UploadedPart>& parts) override;

    bool abort_multipart_object(std::string_view bucket_name,
                                std::string_view object_name,
                                std::string_view upload_id) override;

  private:
    std::unique_ptr<minio::s3::Client> client_;
    std::unique_ptr<minio::creds::StaticProvider> provider_;
};
} // namespace backup
