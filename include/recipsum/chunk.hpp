#pragma once

#include <algorithm>
#include <cstddef>

namespace recipsum {

// Half-open index range [begin, end).
struct IndexRange {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - begin; }
    bool empty() const { return begin == end; }
};

inline bool operator==(const IndexRange& a, const IndexRange& b) {
    return a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const IndexRange& a, const IndexRange& b) {
    return !(a == b);
}

// Integer ceil of n_elements / n_chunks. n_chunks must be >= 1.
inline std::size_t chunk_size(std::size_t n_chunks, std::size_t n_elements) {
    return n_elements / n_chunks + (n_elements % n_chunks != 0);
}

// The start can run past n_elements for trailing chunks when n_chunks does
// not divide n_elements; it is clamped so every chunk stays inside
// [0, n_elements) and trailing chunks come out empty.
inline std::size_t chunk_start(std::size_t chunk, std::size_t n_chunks,
                               std::size_t n_elements) {
    return std::min(chunk * chunk_size(n_chunks, n_elements), n_elements);
}

inline std::size_t chunk_end(std::size_t chunk, std::size_t n_chunks,
                             std::size_t n_elements) {
    return std::min((chunk + 1) * chunk_size(n_chunks, n_elements), n_elements);
}

inline IndexRange chunk_range(std::size_t chunk, std::size_t n_chunks,
                              std::size_t n_elements) {
    return {chunk_start(chunk, n_chunks, n_elements),
            chunk_end(chunk, n_chunks, n_elements)};
}

// Chunk of a sub-range: the same partition applied to parent.size() and
// shifted by parent.begin.
inline IndexRange chunk_range(std::size_t chunk, std::size_t n_chunks,
                              IndexRange parent) {
    IndexRange r = chunk_range(chunk, n_chunks, parent.size());
    return {parent.begin + r.begin, parent.begin + r.end};
}

}  // namespace recipsum
