#pragma once
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pdrop {
// bytes of one outgoing file, read chunk by chunk
class FileSource {
  public:
    virtual auto get_name() const -> std::string_view                                        = 0;
    virtual auto get_mime_type() const -> std::string_view                                   = 0;
    virtual auto get_size() const -> uint64_t                                                = 0;
    virtual auto read(uint64_t offset, size_t size) -> std::optional<std::vector<std::byte>> = 0;

    virtual ~FileSource() {}
};

class MemoryFile : public FileSource {
  private:
    std::string            name;
    std::string            mime_type;
    std::vector<std::byte> data;

  public:
    auto get_name() const -> std::string_view override;
    auto get_mime_type() const -> std::string_view override;
    auto get_size() const -> uint64_t override;
    auto read(uint64_t offset, size_t size) -> std::optional<std::vector<std::byte>> override;

    MemoryFile(std::string name, std::string mime_type, std::vector<std::byte> data);
};

class DiskFile : public FileSource {
  private:
    std::string   name;
    std::string   mime_type;
    uint64_t      size;
    std::ifstream file;

  public:
    auto get_name() const -> std::string_view override;
    auto get_mime_type() const -> std::string_view override;
    auto get_size() const -> uint64_t override;
    auto read(uint64_t offset, size_t size) -> std::optional<std::vector<std::byte>> override;

    static auto open(const char* path) -> std::unique_ptr<DiskFile>;
};

auto guess_mime_type(std::string_view name) -> std::string_view;
// keeps only the last path component, peers choose the names
auto sanitize_file_name(std::string_view name) -> std::string;
} // namespace pdrop
