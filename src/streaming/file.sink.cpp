#include "file.sink.hh"
#include "backup.errors.hh"
#include "macros.hh"

#include <cerrno>
#include <cstring>

backup::FileSink::FileSink(std::string_view filename)
  : filename_{ filename }
  , file_(filename_, std::ios::binary | std::ios::trunc)
{
    if (!file_.is_open()) {
        const std::string err = LOG_ERROR("Cannot create destination file '",
                                          filename_,
                                          "': ",
                                          std::strerror(errno));
        throw ConstructionError(err);
    }
}

bool
backup::FileSink::write(std::span<const std::byte> data)
{
    if (!file_.is_open()) {
        LOG_ERROR("Cannot write to closed file ", filename_);
        return false;
    }

    if (data.empty()) {
        return true;
    }

    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    if (!file_) {
        LOG_ERROR("Failed to write ", data.size(), " bytes to ", filename_);
        return false;
    }

    return true;
}

bool
backup::FileSink::flush()
{
    if (!file_.is_open()) {
        return true;
    }

    file_.flush();
    if (!file_) {
        LOG_ERROR("Failed to flush ", filename_);
        return false;
    }

    return true;
}

bool
backup::FileSink::close()
{
    if (!file_.is_open()) {
        return true;
    }

    file_.close();
    if (file_.fail()) {
        LOG_ERROR("Failed to close ", filename_);
        return false;
    }

    return true;
}
