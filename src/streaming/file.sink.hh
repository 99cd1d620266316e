#pragma once

#include "writer.layer.hh"

#include <fstream>
#include <string>
#include <string_view>

namespace backup {
class FileSink : public Sink
{
  public:
    /**
     * @brief Create or truncate the file at @p filename.
     * @throws ConstructionError if the file cannot be opened.
     */
    explicit FileSink(std::string_view filename);

    std::string_view name() const noexcept override { return "file"; }

    bool write(std::span<const std::byte> data) override;
    bool flush() override;
    bool close() override;

  private:
    std::string filename_;
    std::ofstream file_;
};
} // namespace backup
