#pragma once
#include <cstddef>
#include <vector>

namespace mazegen {

// Union-find over the integers [0, size), union by rank, find with path compression.
class DisjointSet {
public:
    explicit DisjointSet(std::size_t size);

    std::size_t find(std::size_t element);

    // Returns false when both elements were already in the same set.
    bool unite(std::size_t a, std::size_t b);

    std::size_t size() const { return parent_.size(); }
    std::size_t set_count() const { return sets_; }

private:
    std::vector<std::size_t> parent_;
    std::vector<unsigned> rank_;
    std::size_t sets_;
};

} // namespace mazegen
