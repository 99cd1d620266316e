#include "destination.hh"

backup::Destination
backup::Destination::filesystem(std::string_view directory)
{
    return { .kind = BackupDestination_Filesystem,
             .directory = std::string(directory),
             .bucket_name = {},
             .client = nullptr };
}

backup::Destination
backup::Destination::object_store(std::string_view bucket_name,
                                  std::shared_ptr<ObjectStoreClient> client)
{
    return { .kind = BackupDestination_ObjectStore,
             .directory = {},
             .bucket_name = std::string(bucket_name),
             .client = client };
}
