#include "macros.hh"
#include "backup.common.hh"

#include <algorithm>
#include <cctype>

std::string
backup::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

std::string_view
backup::strip_file_scheme(std::string_view path)
{
    if (path.starts_with("file://")) {
        path.remove_prefix(7);
    }
    return path;
}

const char*
backup::codec_name(BackupCodec codec)
{
    switch (codec) {
        case BackupCodec_None:
            return "none";
        case BackupCodec_Gzip:
            return "gzip";
        case BackupCodec_Lz4:
            return "lz4";
        case BackupCodec_Snappy:
            return "snappy";
        default:
            return "unknown";
    }
}
