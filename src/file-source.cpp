#include <array>
#include <bit>
#include <filesystem>

#include "file-source.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_file");
}

namespace pdrop {
auto MemoryFile::get_name() const -> std::string_view {
    return name;
}

auto MemoryFile::get_mime_type() const -> std::string_view {
    return mime_type;
}

auto MemoryFile::get_size() const -> uint64_t {
    return data.size();
}

auto MemoryFile::read(const uint64_t offset, const size_t size) -> std::optional<std::vector<std::byte>> {
    ensure(offset + size <= data.size(), "read out of range offset={} size={}", offset, size);
    const auto begin = data.begin() + offset;
    return std::vector<std::byte>(begin, begin + size);
}

MemoryFile::MemoryFile(std::string name, std::string mime_type, std::vector<std::byte> data)
    : name(std::move(name)),
      mime_type(std::move(mime_type)),
      data(std::move(data)) {}

auto DiskFile::get_name() const -> std::string_view {
    return name;
}

auto DiskFile::get_mime_type() const -> std::string_view {
    return mime_type;
}

auto DiskFile::get_size() const -> uint64_t {
    return size;
}

auto DiskFile::read(const uint64_t offset, const size_t len) -> std::optional<std::vector<std::byte>> {
    ensure(offset + len <= size, "read out of range offset={} size={}", offset, len);
    auto buffer = std::vector<std::byte>(len);
    file.clear();
    file.seekg(std::streamoff(offset));
    file.read(std::bit_cast<char*>(buffer.data()), std::streamsize(len));
    ensure(file.gcount() == std::streamsize(len), "short read from {} at {}", name, offset);
    return buffer;
}

auto DiskFile::open(const char* const path) -> std::unique_ptr<DiskFile> {
    auto ec   = std::error_code();
    auto size = std::filesystem::file_size(path, ec);
    ensure(!ec, "cannot stat {}: {}", path, ec.message());

    auto file = std::ifstream(path, std::ios::binary);
    ensure(file.is_open(), "cannot open {}", path);

    auto ret       = std::unique_ptr<DiskFile>(new DiskFile());
    ret->name      = std::filesystem::path(path).filename().string();
    ret->mime_type = std::string(guess_mime_type(ret->name));
    ret->size      = size;
    ret->file      = std::move(file);
    return ret;
}

namespace {
struct MimeEntry {
    std::string_view extension;
    std::string_view mime_type;
};

constexpr auto mime_table = std::array{
    MimeEntry{".txt", "text/plain"},
    MimeEntry{".html", "text/html"},
    MimeEntry{".css", "text/css"},
    MimeEntry{".csv", "text/csv"},
    MimeEntry{".js", "text/javascript"},
    MimeEntry{".json", "application/json"},
    MimeEntry{".pdf", "application/pdf"},
    MimeEntry{".zip", "application/zip"},
    MimeEntry{".gz", "application/gzip"},
    MimeEntry{".png", "image/png"},
    MimeEntry{".jpg", "image/jpeg"},
    MimeEntry{".jpeg", "image/jpeg"},
    MimeEntry{".gif", "image/gif"},
    MimeEntry{".webp", "image/webp"},
    MimeEntry{".svg", "image/svg+xml"},
    MimeEntry{".mp3", "audio/mpeg"},
    MimeEntry{".wav", "audio/wav"},
    MimeEntry{".mp4", "video/mp4"},
    MimeEntry{".webm", "video/webm"},
};
} // namespace

auto guess_mime_type(const std::string_view name) -> std::string_view {
    for(const auto& entry : mime_table) {
        if(name.ends_with(entry.extension)) {
            return entry.mime_type;
        }
    }
    return "application/octet-stream";
}

auto sanitize_file_name(const std::string_view name) -> std::string {
    auto result = std::string(name.substr(name.find_last_of("/\\") + 1));
    if(result.empty() || result == "." || result == "..") {
        return "unnamed";
    }
    return result;
}
} // namespace pdrop
