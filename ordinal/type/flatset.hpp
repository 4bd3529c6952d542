/*
 * flatset.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Sorted-vector set, the general result of mapping a value set
out of its enumeration

**************************************************/

#ifndef ORDINAL_TYPE_FLAT_SET_HPP
#define ORDINAL_TYPE_FLAT_SET_HPP

#include <algorithm>
#include <compare>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <utility>
#include <vector>

namespace ordinal::type {

/**
 * @brief A set kept as a sorted, duplicate-free vector.
 *
 * Iteration is in ascending `Compare` order. Lookups are binary searches, so
 * it suits the write-once, read-many results produced by
 * `ValueSet::map`/`flatMap` when the mapped type leaves the enumeration.
 *
 * @tparam T The type of elements.
 * @tparam Compare Strict weak ordering over T (default std::less<T>).
 */
template <typename T, typename Compare = std::less<T>>
    requires std::predicate<Compare, T, T>
class FlatSet {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using const_reference = const value_type&;
    using iterator = typename std::vector<T>::const_iterator;
    using const_iterator = typename std::vector<T>::const_iterator;
    using key_compare = Compare;

    FlatSet() = default;

    explicit FlatSet(const Compare& comp) : comp_(comp) {}

    /**
     * @brief Builds the set from an arbitrary range; duplicates collapse.
     */
    template <std::input_iterator InputIt>
    FlatSet(InputIt first, InputIt last, const Compare& comp = Compare())
        : data_(first, last), comp_(comp) {
        sortAndUnique();
    }

    FlatSet(std::initializer_list<T> init, const Compare& comp = Compare())
        : FlatSet(init.begin(), init.end(), comp) {}

    [[nodiscard]] auto begin() const noexcept -> const_iterator {
        return data_.begin();
    }
    [[nodiscard]] auto end() const noexcept -> const_iterator {
        return data_.end();
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }
    [[nodiscard]] auto size() const noexcept -> size_type {
        return data_.size();
    }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    /**
     * @brief Inserts a value, keeping the vector sorted.
     * @return Iterator to the element and whether it was newly inserted.
     */
    auto insert(T value) -> std::pair<iterator, bool> {
        auto pos = std::lower_bound(data_.begin(), data_.end(), value, comp_);
        if (pos != data_.end() && !comp_(value, *pos)) {
            return {pos, false};
        }
        return {data_.insert(pos, std::move(value)), true};
    }

    template <typename... Args>
    auto emplace(Args&&... args) -> std::pair<iterator, bool> {
        return insert(T(std::forward<Args>(args)...));
    }

    auto erase(const T& value) -> size_type {
        auto it = find(value);
        if (it == end()) {
            return 0;
        }
        data_.erase(it);
        return 1;
    }

    [[nodiscard]] auto find(const T& value) const -> const_iterator {
        auto pos = lower_bound(value);
        if (pos != end() && !comp_(value, *pos)) {
            return pos;
        }
        return end();
    }

    [[nodiscard]] auto contains(const T& value) const -> bool {
        return find(value) != end();
    }

    [[nodiscard]] auto lower_bound(const T& value) const -> const_iterator {
        return std::lower_bound(data_.begin(), data_.end(), value, comp_);
    }

    [[nodiscard]] auto upper_bound(const T& value) const -> const_iterator {
        return std::upper_bound(data_.begin(), data_.end(), value, comp_);
    }

    [[nodiscard]] auto key_comp() const -> key_compare { return comp_; }

    friend auto operator==(const FlatSet& lhs, const FlatSet& rhs) -> bool {
        return lhs.data_ == rhs.data_;
    }

private:
    void sortAndUnique() {
        std::sort(data_.begin(), data_.end(), comp_);
        auto last = std::unique(data_.begin(), data_.end(),
                                [this](const T& a, const T& b) {
                                    return !comp_(a, b) && !comp_(b, a);
                                });
        data_.erase(last, data_.end());
    }

    std::vector<T> data_;
    Compare comp_;
};

}  // namespace ordinal::type

#endif  // ORDINAL_TYPE_FLAT_SET_HPP
