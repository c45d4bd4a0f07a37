#pragma once

#include <cstdint>
#include <cstddef>
#include <iterator>
#include <vector>

namespace plotindex {

// Fixed-size set of row indices in [0, size), stored as a bitset.
// Iteration is always ascending.
class Indices {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::uint32_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::uint32_t*;
        using reference = std::uint32_t;

        const_iterator(const Indices* owner, std::uint32_t pos);

        std::uint32_t operator*() const { return pos_; }
        const_iterator& operator++();
        const_iterator operator++(int);
        bool operator==(const const_iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const const_iterator& other) const { return pos_ != other.pos_; }

    private:
        const Indices* owner_;
        std::uint32_t pos_;
    };

    explicit Indices(std::uint32_t size = 0, bool initial = false);

    std::uint32_t size() const noexcept { return size_; }
    std::uint32_t count() const;
    bool empty() const;

    bool get(std::uint32_t i) const;
    void set(std::uint32_t i, bool value = true);
    void unset(std::uint32_t i) { set(i, false); }
    void setWithoutBoundsCheck(std::uint32_t i) noexcept {
        words_[i >> 5] |= (1u << (i & 31u));
    }

    const_iterator begin() const { return const_iterator(this, nextSetBit(0)); }
    const_iterator end() const { return const_iterator(this, size_); }
    std::vector<std::uint32_t> toVector() const;

    // Set algebra. Operands of different sizes combine over the larger universe.
    void add(const Indices& other);
    void intersect(const Indices& other);
    void subtract(const Indices& other);
    void symmetricDifference(const Indices& other);
    void invert();
    void clear();

    bool operator==(const Indices& other) const;
    bool operator!=(const Indices& other) const { return !(*this == other); }

private:
    friend class const_iterator;

    std::uint32_t nextSetBit(std::uint32_t from) const;
    void growTo(std::uint32_t size);
    void maskTail();

    std::uint32_t size_;
    std::vector<std::uint32_t> words_;
};

} // namespace plotindex
