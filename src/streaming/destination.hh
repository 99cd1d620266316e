#pragma once

#include "object.store.client.hh"
#include "backup.writer.types.h"

#include <memory>
#include <string>

namespace backup {
/**
 * @brief Where a backup is written.
 * @details For BackupDestination_Filesystem, @p directory names an existing
 * directory. For BackupDestination_ObjectStore, @p bucket_name names the
 * bucket and @p client is a ready-to-use session with the object store.
 */
struct Destination
{
    BackupDestinationKind kind;
    std::string directory;
    std::string bucket_name;
    std::shared_ptr<ObjectStoreClient> client;

    static Destination filesystem(std::string_view directory);
    static Destination object_store(std::string_view bucket_name,
                                    std::shared_ptr<ObjectStoreClient> client);
};
} // namespace backup
