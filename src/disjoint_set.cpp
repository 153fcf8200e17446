#include "disjoint_set.hpp"
#include <numeric>
#include <utility>

namespace mazegen {

DisjointSet::DisjointSet(std::size_t size)
    : parent_(size), rank_(size, 0), sets_(size) {
    std::iota(parent_.begin(), parent_.end(), std::size_t(0));
}

std::size_t DisjointSet::find(std::size_t element) {
    std::size_t root = element;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    while (parent_[element] != root) {
        std::size_t next = parent_[element];
        parent_[element] = root;
        element = next;
    }
    return root;
}

bool DisjointSet::unite(std::size_t a, std::size_t b) {
    std::size_t ra = find(a);
    std::size_t rb = find(b);
    if (ra == rb) return false;

    if (rank_[ra] < rank_[rb]) std::swap(ra, rb);
    parent_[rb] = ra;
    if (rank_[ra] == rank_[rb]) ++rank_[ra];
    --sets_;
    return true;
}

} // namespace mazegen
