/*
 * bitmask.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Growable bit mask stored as 64-bit words

**************************************************/

#ifndef ORDINAL_TYPE_BITMASK_HPP
#define ORDINAL_TYPE_BITMASK_HPP

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <span>
#include <vector>

namespace ordinal::type {

/**
 * @brief A dense, growable set of non-negative bit indices.
 *
 * Bits are stored in 64-bit words with little-endian bit order: bit `k` lives
 * in word `k / 64` at position `k % 64`. The word vector never carries
 * trailing zero words, so two masks with the same members compare equal and
 * `words()` is always the minimal export.
 */
class BitMask {
public:
    using word_type = std::uint64_t;
    using size_type = std::size_t;

    static constexpr size_type WORD_BITS =
        std::numeric_limits<word_type>::digits;
    static constexpr size_type npos = std::numeric_limits<size_type>::max();

    BitMask() = default;

    /**
     * @brief Builds a mask from raw words (bit `k` of the concatenation is
     * member `k`).
     */
    explicit BitMask(std::span<const word_type> words)
        : words_(words.begin(), words.end()) {
        trim();
    }

    [[nodiscard]] static auto fromWords(std::span<const word_type> words)
        -> BitMask {
        return BitMask(words);
    }

    [[nodiscard]] auto test(size_type bit) const noexcept -> bool {
        const auto word = bit / WORD_BITS;
        return word < words_.size() &&
               ((words_[word] >> (bit % WORD_BITS)) & word_type{1}) != 0;
    }

    void set(size_type bit) {
        const auto word = bit / WORD_BITS;
        if (word >= words_.size()) {
            words_.resize(word + 1, 0);
        }
        words_[word] |= word_type{1} << (bit % WORD_BITS);
    }

    void reset(size_type bit) noexcept {
        const auto word = bit / WORD_BITS;
        if (word < words_.size()) {
            words_[word] &= ~(word_type{1} << (bit % WORD_BITS));
            trim();
        }
    }

    [[nodiscard]] auto count() const noexcept -> size_type {
        size_type total = 0;
        for (auto word : words_) {
            total += static_cast<size_type>(std::popcount(word));
        }
        return total;
    }

    [[nodiscard]] auto none() const noexcept -> bool { return words_.empty(); }

    /**
     * @brief Index of the first set bit at or after `from`, or npos.
     */
    [[nodiscard]] auto nextSetBit(size_type from) const noexcept
        -> size_type {
        auto word = from / WORD_BITS;
        if (word >= words_.size()) {
            return npos;
        }
        auto bits = words_[word] & (~word_type{0} << (from % WORD_BITS));
        while (true) {
            if (bits != 0) {
                return word * WORD_BITS +
                       static_cast<size_type>(std::countr_zero(bits));
            }
            if (++word == words_.size()) {
                return npos;
            }
            bits = words_[word];
        }
    }

    /**
     * @brief Index of the highest set bit, or npos when empty.
     */
    [[nodiscard]] auto lastSetBit() const noexcept -> size_type {
        if (words_.empty()) {
            return npos;
        }
        const auto top = words_.back();
        return (words_.size() - 1) * WORD_BITS + WORD_BITS - 1 -
               static_cast<size_type>(std::countl_zero(top));
    }

    /**
     * @brief Keeps only the bits in [from, until).
     */
    [[nodiscard]] auto slice(size_type from, size_type until) const
        -> BitMask {
        BitMask result;
        if (from >= until || words_.empty()) {
            return result;
        }
        const auto limit = std::min(until, words_.size() * WORD_BITS);
        if (from >= limit) {
            return result;
        }
        result.words_.assign(words_.begin(),
                             words_.begin() +
                                 static_cast<std::ptrdiff_t>(
                                     (limit + WORD_BITS - 1) / WORD_BITS));
        const auto firstWord = from / WORD_BITS;
        std::fill(result.words_.begin(),
                  result.words_.begin() + static_cast<std::ptrdiff_t>(firstWord),
                  word_type{0});
        result.words_[firstWord] &= ~word_type{0} << (from % WORD_BITS);
        if (const auto tail = limit % WORD_BITS; tail != 0) {
            result.words_.back() &= ~word_type{0} >> (WORD_BITS - tail);
        }
        result.trim();
        return result;
    }

    /**
     * @brief Moves every member up by `shift` positions.
     */
    [[nodiscard]] auto shiftedUp(size_type shift) const -> BitMask {
        if (shift == 0 || words_.empty()) {
            return *this;
        }
        const auto wordShift = shift / WORD_BITS;
        const auto bitShift = shift % WORD_BITS;
        BitMask result;
        result.words_.assign(words_.size() + wordShift + 1, 0);
        for (size_type i = 0; i < words_.size(); ++i) {
            result.words_[i + wordShift] |= words_[i] << bitShift;
            if (bitShift != 0) {
                result.words_[i + wordShift + 1] |=
                    words_[i] >> (WORD_BITS - bitShift);
            }
        }
        result.trim();
        return result;
    }

    [[nodiscard]] auto words() const noexcept -> std::span<const word_type> {
        return words_;
    }

    auto operator|=(const BitMask& other) -> BitMask& {
        if (other.words_.size() > words_.size()) {
            words_.resize(other.words_.size(), 0);
        }
        for (size_type i = 0; i < other.words_.size(); ++i) {
            words_[i] |= other.words_[i];
        }
        return *this;
    }

    auto operator&=(const BitMask& other) -> BitMask& {
        words_.resize(std::min(words_.size(), other.words_.size()));
        for (size_type i = 0; i < words_.size(); ++i) {
            words_[i] &= other.words_[i];
        }
        trim();
        return *this;
    }

    /**
     * @brief Removes every member of `other` (and-not).
     */
    auto operator-=(const BitMask& other) -> BitMask& {
        const auto common = std::min(words_.size(), other.words_.size());
        for (size_type i = 0; i < common; ++i) {
            words_[i] &= ~other.words_[i];
        }
        trim();
        return *this;
    }

    friend auto operator|(BitMask lhs, const BitMask& rhs) -> BitMask {
        return lhs |= rhs;
    }
    friend auto operator&(BitMask lhs, const BitMask& rhs) -> BitMask {
        return lhs &= rhs;
    }
    friend auto operator-(BitMask lhs, const BitMask& rhs) -> BitMask {
        return lhs -= rhs;
    }

    /**
     * @brief True when every member of this mask is also in `other`.
     */
    [[nodiscard]] auto isSubsetOf(const BitMask& other) const noexcept
        -> bool {
        if (words_.size() > other.words_.size()) {
            return false;
        }
        for (size_type i = 0; i < words_.size(); ++i) {
            if ((words_[i] & ~other.words_[i]) != 0) {
                return false;
            }
        }
        return true;
    }

    friend auto operator==(const BitMask& lhs, const BitMask& rhs) noexcept
        -> bool = default;

    [[nodiscard]] auto hash() const noexcept -> std::size_t {
        std::size_t seed = words_.size();
        for (auto word : words_) {
            seed ^= std::hash<word_type>{}(word) + 0x9e3779b97f4a7c15ULL +
                    (seed << 6) + (seed >> 2);
        }
        return seed;
    }

private:
    void trim() noexcept {
        while (!words_.empty() && words_.back() == 0) {
            words_.pop_back();
        }
    }

    std::vector<word_type> words_;
};

}  // namespace ordinal::type

template <>
struct std::hash<ordinal::type::BitMask> {
    auto operator()(const ordinal::type::BitMask& mask) const noexcept
        -> std::size_t {
        return mask.hash();
    }
};

#endif  // ORDINAL_TYPE_BITMASK_HPP
