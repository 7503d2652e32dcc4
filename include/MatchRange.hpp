#pragma once
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

// Result of one lookup: the matching pattern indices (computed by one scan)
// viewed as the values stored at those indices. Borrows the value list, so it
// must not outlive the map that produced it.
template <class V>
class MatchRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = V;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const V*;
        using reference         = const V&;

        iterator() = default;

        reference operator*() const { return (*values_)[*pos_]; }
        pointer operator->() const { return &(*values_)[*pos_]; }

        iterator& operator++() { ++pos_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++pos_; return tmp; }

        friend bool operator==(const iterator& a, const iterator& b) { return a.pos_ == b.pos_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return a.pos_ != b.pos_; }

    private:
        friend class MatchRange;
        iterator(std::vector<std::size_t>::const_iterator pos, const std::vector<V>* values)
            : pos_(pos), values_(values) {}

        std::vector<std::size_t>::const_iterator pos_{};
        const std::vector<V>* values_{nullptr};
    };
    using const_iterator = iterator;

    MatchRange(std::vector<std::size_t> indices, const std::vector<V>& values)
        : indices_(std::move(indices)), values_(&values) {}

    iterator begin() const { return iterator(indices_.cbegin(), values_); }
    iterator end() const { return iterator(indices_.cend(), values_); }

    bool empty() const noexcept { return indices_.empty(); }
    std::size_t size() const noexcept { return indices_.size(); }

    // Value of the lowest matching pattern, or nullptr when nothing matched.
    const V* first() const { return indices_.empty() ? nullptr : &(*values_)[indices_.front()]; }

    const std::vector<std::size_t>& indices() const noexcept { return indices_; }

private:
    std::vector<std::size_t> indices_;
    const std::vector<V>*    values_;
};
