#include "chunk-arena.hpp"

#include <utility>

namespace pdrop {
auto ChunkArena::reserve(const size_t bytes) -> void {
    data.reserve(bytes);
}

auto ChunkArena::append(const std::span<const std::byte> chunk) -> void {
    data.insert(data.end(), chunk.begin(), chunk.end());
    ends.push_back(data.size());
}

auto ChunkArena::get_chunk(const size_t index) const -> std::span<const std::byte> {
    const auto begin = index == 0 ? 0 : ends[index - 1];
    return std::span(data).subspan(begin, ends[index] - begin);
}

auto ChunkArena::get_chunk_count() const -> size_t {
    return ends.size();
}

auto ChunkArena::get_size() const -> size_t {
    return data.size();
}

auto ChunkArena::release() -> std::vector<std::byte> {
    auto result = std::exchange(data, {});
    ends        = {};
    return result;
}

auto ChunkArena::clear() -> void {
    data = {};
    ends = {};
}
} // namespace pdrop
