#include "macros.hh"
#include "sink.creator.hh"
#include "backup.common.hh"
#include "backup.errors.hh"
#include "file.sink.hh"
#include "s3.sink.hh"

#include <filesystem>

namespace fs = std::filesystem;

backup::SinkCreator::SinkCreator(size_t pipe_capacity)
  : pipe_capacity_{ pipe_capacity }
{
    EXPECT(pipe_capacity_ > 0, "Pipe capacity must be positive.");
}

std::unique_ptr<backup::Sink>
backup::SinkCreator::make_sink(const Destination& destination,
                               std::string_view object_name)
{
    switch (destination.kind) {
        case BackupDestination_Filesystem:
            return make_file_sink_(destination.directory, object_name);
        case BackupDestination_ObjectStore:
            return make_s3_sink_(
              destination.bucket_name, object_name, destination.client);
        default: {
            const std::string err =
              LOG_ERROR("Don't know how to handle destination kind ",
                        static_cast<int>(destination.kind));
            throw ConfigurationError(err);
        }
    }
}

std::unique_ptr<backup::Sink>
backup::SinkCreator::make_file_sink_(std::string_view directory,
                                     std::string_view file_name)
{
    directory = strip_file_scheme(directory);
    if (directory.empty() || file_name.empty()) {
        const std::string err =
          LOG_ERROR("Directory and file name must not be empty.");
        throw ConfigurationError(err);
    }

    fs::path dir(directory);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        const std::string err = LOG_ERROR("Cannot create destination file '",
                                          file_name,
                                          "': '",
                                          directory,
                                          "' is not a directory");
        throw ConstructionError(err);
    }

    const fs::path file_path = dir / file_name;
    LOG_DEBUG("Creating destination file ", file_path);

    return std::make_unique<FileSink>(file_path.string());
}

std::unique_ptr<backup::Sink>
backup::SinkCreator::make_s3_sink_(std::string_view bucket_name,
                                   std::string_view object_key,
                                   std::shared_ptr<ObjectStoreClient> client)
{
    if (bucket_name.empty() || object_key.empty()) {
        const std::string err =
          LOG_ERROR("Bucket name and object key must not be empty.");
        throw ConfigurationError(err);
    }
    if (!client) {
        const std::string err = LOG_ERROR("Object store client not provided.");
        throw ConfigurationError(err);
    }

    if (!bucket_exists_(*client, bucket_name)) {
        const std::string err =
          LOG_ERROR("Bucket '", bucket_name, "' does not exist.");
        throw ConstructionError(err);
    }

    return std::make_unique<S3Sink>(
      bucket_name, object_key, client, pipe_capacity_);
}

bool
backup::SinkCreator::bucket_exists_(ObjectStoreClient& client,
                                    std::string_view bucket_name)
{
    try {
        return client.bucket_exists(bucket_name);
    } catch (const std::exception& exc) {
        const std::string err = LOG_ERROR(
          "Failed to check whether bucket '", bucket_name, "' exists: ",
          exc.what());
        throw ConstructionError(err);
    }
}
