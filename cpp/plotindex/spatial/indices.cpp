#include "plotindex/spatial/indices.h"

#include <bitset>
#include <stdexcept>
#include <string>

namespace plotindex {

namespace {

std::size_t wordCount(std::uint32_t size) {
    return (static_cast<std::size_t>(size) + 31u) >> 5;
}

// Only called with v != 0. C++17 has no std::countr_zero.
std::uint32_t lowestBit(std::uint32_t v) {
    std::uint32_t n = 0;
    while ((v & 1u) == 0u) {
        v >>= 1;
        ++n;
    }
    return n;
}

} // namespace

Indices::const_iterator::const_iterator(const Indices* owner, std::uint32_t pos)
    : owner_(owner), pos_(pos) {}

Indices::const_iterator& Indices::const_iterator::operator++() {
    pos_ = owner_->nextSetBit(pos_ + 1);
    return *this;
}

Indices::const_iterator Indices::const_iterator::operator++(int) {
    const_iterator prev = *this;
    ++(*this);
    return prev;
}

Indices::Indices(std::uint32_t size, bool initial)
    : size_(size), words_(wordCount(size), initial ? 0xFFFFFFFFu : 0u) {
    maskTail();
}

std::uint32_t Indices::count() const {
    std::uint32_t total = 0;
    for (const std::uint32_t w : words_) total += static_cast<std::uint32_t>(std::bitset<32>(w).count());
    return total;
}

bool Indices::empty() const {
    for (const std::uint32_t w : words_) {
        if (w != 0u) return false;
    }
    return true;
}

bool Indices::get(std::uint32_t i) const {
    if (i >= size_) {
        throw std::out_of_range("Indices::get: index " + std::to_string(i) + " out of range " + std::to_string(size_));
    }
    return (words_[i >> 5] & (1u << (i & 31u))) != 0u;
}

void Indices::set(std::uint32_t i, bool value) {
    if (i >= size_) {
        throw std::out_of_range("Indices::set: index " + std::to_string(i) + " out of range " + std::to_string(size_));
    }
    const std::uint32_t bit = 1u << (i & 31u);
    if (value) {
        words_[i >> 5] |= bit;
    } else {
        words_[i >> 5] &= ~bit;
    }
}

std::vector<std::uint32_t> Indices::toVector() const {
    std::vector<std::uint32_t> out;
    out.reserve(count());
    for (const std::uint32_t i : *this) out.push_back(i);
    return out;
}

void Indices::add(const Indices& other) {
    growTo(other.size_);
    for (std::size_t w = 0; w < other.words_.size(); ++w) words_[w] |= other.words_[w];
}

void Indices::intersect(const Indices& other) {
    growTo(other.size_);
    for (std::size_t w = 0; w < words_.size(); ++w) {
        words_[w] &= (w < other.words_.size()) ? other.words_[w] : 0u;
    }
}

void Indices::subtract(const Indices& other) {
    growTo(other.size_);
    for (std::size_t w = 0; w < other.words_.size(); ++w) words_[w] &= ~other.words_[w];
}

void Indices::symmetricDifference(const Indices& other) {
    growTo(other.size_);
    for (std::size_t w = 0; w < other.words_.size(); ++w) words_[w] ^= other.words_[w];
}

void Indices::invert() {
    for (std::uint32_t& w : words_) w = ~w;
    maskTail();
}

void Indices::clear() {
    for (std::uint32_t& w : words_) w = 0u;
}

bool Indices::operator==(const Indices& other) const {
    return size_ == other.size_ && words_ == other.words_;
}

std::uint32_t Indices::nextSetBit(std::uint32_t from) const {
    if (from >= size_) return size_;
    std::size_t w = from >> 5;
    std::uint32_t word = words_[w] & (0xFFFFFFFFu << (from & 31u));
    while (word == 0u) {
        if (++w >= words_.size()) return size_;
        word = words_[w];
    }
    return static_cast<std::uint32_t>(w << 5) + lowestBit(word);
}

void Indices::growTo(std::uint32_t size) {
    if (size <= size_) return;
    size_ = size;
    words_.resize(wordCount(size), 0u);
}

void Indices::maskTail() {
    const std::uint32_t rem = size_ & 31u;
    if (rem != 0u && !words_.empty()) {
        words_.back() &= (1u << rem) - 1u;
    }
}

} // namespace plotindex
