#pragma once
#include <cstddef>
#include <span>
#include <vector>

namespace pdrop {
// append-only storage of the chunks of one incoming file
// chunks are kept contiguous in arrival order, boundaries are remembered separately
class ChunkArena {
  private:
    std::vector<std::byte> data;
    std::vector<size_t>    ends;

  public:
    auto reserve(size_t bytes) -> void;
    auto append(std::span<const std::byte> chunk) -> void;
    auto get_chunk(size_t index) const -> std::span<const std::byte>;
    auto get_chunk_count() const -> size_t;
    auto get_size() const -> size_t;
    // concatenation of every chunk, leaves the arena empty
    auto release() -> std::vector<std::byte>;
    // drops every chunk and gives the memory back
    auto clear() -> void;
};
} // namespace pdrop
