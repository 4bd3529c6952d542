/*
 * value_set.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Immutable, bitmask-backed ordered set of enumeration values

**************************************************/

#ifndef ORDINAL_ENUMS_VALUE_SET_HPP
#define ORDINAL_ENUMS_VALUE_SET_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "ordinal/enums/error.hpp"
#include "ordinal/enums/registry.hpp"
#include "ordinal/enums/value.hpp"
#include "ordinal/type/bitmask.hpp"
#include "ordinal/type/flatset.hpp"

namespace ordinal::enums {

template <typename V>
class Enum;

namespace detail {

/**
 * @brief `R` is an lvalue reference to a value of the enumeration of `V`.
 */
template <typename R, typename V>
concept ValueReference =
    std::is_lvalue_reference_v<R> && std::derived_from<std::remove_cvref_t<R>, V>;

template <typename V>
struct NameIndex {
    std::once_flag once;
    std::unordered_map<std::string, const V*> byName;
};

}  // namespace detail

/**
 * @brief An immutable set of values of one enumeration.
 *
 * Membership is a bit mask where bit `id - offset` marks the value with that
 * id, so iteration runs in ascending id order. Every operation that changes
 * membership returns a new set and leaves the receiver untouched; sets are
 * therefore freely shareable across threads.
 *
 * A default-constructed set is empty and not yet bound to an enumeration; it
 * binds to the enumeration of the first value inserted and combines with any
 * set. Mixing values or sets of two different enumerations throws
 * CrossRegistryOperationError.
 *
 * @tparam V The value type of the enumeration.
 */
template <typename V>
    requires std::derived_from<V, Val>
class ValueSet {
public:
    using value_type = V;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using const_reference = const V&;
    using word_type = type::BitMask::word_type;

    /**
     * @brief Forward iterator over the members in ascending id order.
     */
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = V;
        using difference_type = std::ptrdiff_t;
        using pointer = const V*;
        using reference = const V&;

        const_iterator() = default;

        auto operator*() const -> reference { return set_->valueAtBit(bit_); }
        auto operator->() const -> pointer { return &**this; }

        auto operator++() -> const_iterator& {
            bit_ = set_->bits_.nextSetBit(bit_ + 1);
            return *this;
        }

        auto operator++(int) -> const_iterator {
            auto previous = *this;
            ++*this;
            return previous;
        }

        friend auto operator==(const const_iterator& lhs,
                               const const_iterator& rhs) noexcept -> bool {
            return lhs.bit_ == rhs.bit_;
        }

    private:
        friend class ValueSet;

        const_iterator(const ValueSet* set, size_type bit)
            : set_(set), bit_(bit) {}

        const ValueSet* set_ = nullptr;
        size_type bit_ = type::BitMask::npos;
    };

    using iterator = const_iterator;

    /**
     * @brief Accumulates values and produces a set.
     */
    class Builder {
    public:
        Builder() = default;
        explicit Builder(const RegistryBase& registry)
            : registry_(&registry), offset_(registry.minId()) {}

        auto add(const V& value) -> Builder& {
            const auto& owner = value.registry();
            if (registry_ == nullptr) {
                registry_ = &owner;
                offset_ = owner.minId();
            } else if (registry_ != &owner) {
                spdlog::error(
                    "Cannot add value of enumeration '{}' to a set of '{}'",
                    owner.name(), registry_->name());
                THROW_CROSS_REGISTRY(
                    "Cannot add value of enumeration '{}' to a set of '{}'",
                    owner.name(), registry_->name());
            }
            if (value.id() < offset_) {
                bits_ = bits_.shiftedUp(distance(offset_, value.id()));
                offset_ = value.id();
            }
            bits_.set(distance(value.id(), offset_));
            return *this;
        }

        template <std::ranges::input_range R>
        auto addAll(R&& range) -> Builder& {
            for (const V& value : range) {
                add(value);
            }
            return *this;
        }

        void clear() { bits_ = {}; }

        [[nodiscard]] auto result() const -> ValueSet {
            return ValueSet(registry_, bits_, offset_);
        }

    private:
        friend class ValueSet;

        Builder(const RegistryBase* registry, type::BitMask bits, int offset)
            : registry_(registry), bits_(std::move(bits)), offset_(offset) {}

        const RegistryBase* registry_ = nullptr;
        type::BitMask bits_;
        int offset_ = 0;
    };

    ValueSet() : index_(std::make_shared<detail::NameIndex<V>>()) {}

    ValueSet(std::initializer_list<std::reference_wrapper<const V>> values)
        : ValueSet() {
        Builder builder;
        for (const V& value : values) {
            builder.add(value);
        }
        *this = builder.result();
    }

    /**
     * @brief Set of the values whose ids correspond to the set bits of
     * `words`, where bit `k` stands for id `registry.minId() + k`.
     */
    [[nodiscard]] static auto fromBitMask(const RegistryBase& registry,
                                          std::span<const word_type> words)
        -> ValueSet {
        return ValueSet(&registry, type::BitMask(words), registry.minId());
    }

    /**
     * @brief The enumeration this set is bound to, or nullptr.
     */
    [[nodiscard]] auto registry() const noexcept -> const RegistryBase* {
        return registry_;
    }

    [[nodiscard]] auto size() const noexcept -> size_type {
        return bits_.count();
    }
    [[nodiscard]] auto empty() const noexcept -> bool { return bits_.none(); }

    [[nodiscard]] auto begin() const -> const_iterator {
        return const_iterator(this, bits_.nextSetBit(0));
    }
    [[nodiscard]] auto end() const -> const_iterator {
        return const_iterator(this, type::BitMask::npos);
    }

    /**
     * @brief Iterator to the first member whose id is not below `start`'s.
     */
    [[nodiscard]] auto iteratorFrom(const V& start) const -> const_iterator {
        if (start.id() <= offset_) {
            return begin();
        }
        return const_iterator(this,
                              bits_.nextSetBit(distance(start.id(), offset_)));
    }

    /**
     * @brief Member with the lowest id.
     * @throws error::OutOfRange if the set is empty.
     */
    [[nodiscard]] auto front() const -> const V& {
        if (empty()) {
            spdlog::error("front() called on an empty value set");
            THROW_OUT_OF_RANGE("front() called on an empty value set");
        }
        return *begin();
    }

    /**
     * @brief Member with the highest id.
     * @throws error::OutOfRange if the set is empty.
     */
    [[nodiscard]] auto back() const -> const V& {
        if (empty()) {
            spdlog::error("back() called on an empty value set");
            THROW_OUT_OF_RANGE("back() called on an empty value set");
        }
        return valueAtBit(bits_.lastSetBit());
    }

    /**
     * @brief Membership test; false for values of another enumeration.
     */
    [[nodiscard]] auto contains(const V& value) const noexcept -> bool {
        if (registry_ != &value.registry() || value.id() < offset_) {
            return false;
        }
        return bits_.test(distance(value.id(), offset_));
    }

    /**
     * @brief A new set that also contains `value`.
     */
    [[nodiscard]] auto insert(const V& value) const -> ValueSet {
        Builder builder = registry_ == nullptr
                              ? Builder(value.registry())
                              : Builder(registry_, bits_, offset_);
        builder.add(value);
        return builder.result();
    }

    /**
     * @brief A new set without `value`.
     */
    [[nodiscard]] auto remove(const V& value) const -> ValueSet {
        if (!contains(value)) {
            return *this;
        }
        auto bits = bits_;
        bits.reset(distance(value.id(), offset_));
        return ValueSet(registry_, std::move(bits), offset_);
    }

    [[nodiscard]] auto unite(const ValueSet& other) const -> ValueSet {
        return combineWith(other, [](type::BitMask lhs,
                                     const type::BitMask& rhs) {
            return lhs | rhs;
        });
    }

    [[nodiscard]] auto intersect(const ValueSet& other) const -> ValueSet {
        return combineWith(other, [](type::BitMask lhs,
                                     const type::BitMask& rhs) {
            return lhs & rhs;
        });
    }

    [[nodiscard]] auto difference(const ValueSet& other) const -> ValueSet {
        return combineWith(other, [](type::BitMask lhs,
                                     const type::BitMask& rhs) {
            return lhs - rhs;
        });
    }

    [[nodiscard]] auto isSubsetOf(const ValueSet& other) const -> bool {
        if (empty()) {
            return true;
        }
        if (registry_ != other.registry_) {
            return false;
        }
        const int offset = std::min(offset_, other.offset_);
        return bitsAt(offset).isSubsetOf(other.bitsAt(offset));
    }

    friend auto operator|(const ValueSet& lhs, const ValueSet& rhs)
        -> ValueSet {
        return lhs.unite(rhs);
    }
    friend auto operator&(const ValueSet& lhs, const ValueSet& rhs)
        -> ValueSet {
        return lhs.intersect(rhs);
    }
    friend auto operator-(const ValueSet& lhs, const ValueSet& rhs)
        -> ValueSet {
        return lhs.difference(rhs);
    }
    friend auto operator+(const ValueSet& set, const V& value) -> ValueSet {
        return set.insert(value);
    }
    friend auto operator-(const ValueSet& set, const V& value) -> ValueSet {
        return set.remove(value);
    }

    /**
     * @brief Members with `fromId <= id < untilId`; a missing bound is open.
     * @throws error::InvalidArgument if `fromId > untilId`.
     */
    [[nodiscard]] auto range(std::optional<int> fromId,
                             std::optional<int> untilId) const -> ValueSet {
        if (fromId && untilId && *fromId > *untilId) {
            spdlog::error("Invalid id range: {} > {}", *fromId, *untilId);
            THROW_INVALID_ARGUMENT("Invalid id range: {} > {}", *fromId,
                                   *untilId);
        }
        const size_type lower =
            fromId && *fromId > offset_ ? distance(*fromId, offset_) : 0;
        size_type upper = type::BitMask::npos;
        if (untilId) {
            upper = *untilId > offset_ ? distance(*untilId, offset_) : 0;
        }
        return ValueSet(registry_, bits_.slice(lower, upper), offset_);
    }

    [[nodiscard]] auto range(const V& from, const V& until) const
        -> ValueSet {
        return range(from.id(), until.id());
    }
    [[nodiscard]] auto rangeFrom(const V& from) const -> ValueSet {
        return range(from.id(), std::nullopt);
    }
    [[nodiscard]] auto rangeUntil(const V& until) const -> ValueSet {
        return range(std::nullopt, until.id());
    }

    /**
     * @brief Members satisfying `pred`; always a set of this enumeration.
     */
    template <std::predicate<const V&> Pred>
    [[nodiscard]] auto filter(Pred pred) const -> ValueSet {
        auto bits = bits_;
        for (auto bit = bits_.nextSetBit(0); bit != type::BitMask::npos;
             bit = bits_.nextSetBit(bit + 1)) {
            if (!std::invoke(pred, valueAtBit(bit))) {
                bits.reset(bit);
            }
        }
        return ValueSet(registry_, std::move(bits), offset_);
    }

    template <std::predicate<const V&> Pred>
    [[nodiscard]] auto filterNot(Pred pred) const -> ValueSet {
        return filter([&pred](const V& value) {
            return !std::invoke(pred, value);
        });
    }

    /**
     * @brief Splits into (members satisfying `pred`, the rest).
     */
    template <std::predicate<const V&> Pred>
    [[nodiscard]] auto partition(Pred pred) const
        -> std::pair<ValueSet, ValueSet> {
        auto accepted = filter(pred);
        auto rejected = difference(accepted);
        return {std::move(accepted), std::move(rejected)};
    }

    /**
     * @brief Applies `f` to every member.
     *
     * When `f` returns a value of this enumeration (`const V&` or a subclass
     * reference) the result is again a `ValueSet<V>`; a value of another
     * enumeration `W` gives a `ValueSet<W>`. When it returns another totally
     * ordered type `B` the result is a sorted `type::FlatSet<B>`.
     * Any other result type is rejected at compile time; use `mapToVector`.
     */
    template <typename F>
        requires std::invocable<F&, const V&>
    [[nodiscard]] auto map(F f) const {
        using Result = std::invoke_result_t<F&, const V&>;
        if constexpr (detail::ValueReference<Result, V>) {
            Builder builder = emptyBuilder();
            for (const V& value : *this) {
                builder.add(std::invoke(f, value));
            }
            return builder.result();
        } else if constexpr (detail::ValueReference<Result, Val>) {
            typename ValueSet<std::remove_cvref_t<Result>>::Builder builder;
            for (const V& value : *this) {
                builder.add(std::invoke(f, value));
            }
            return builder.result();
        } else {
            using Mapped = std::remove_cvref_t<Result>;
            static_assert(std::totally_ordered<Mapped>,
                          "ValueSet::map needs a totally ordered result type; "
                          "use mapToVector for unordered results");
            type::FlatSet<Mapped> mapped;
            mapped.reserve(size());
            for (const V& value : *this) {
                mapped.insert(std::invoke(f, value));
            }
            return mapped;
        }
    }

    /**
     * @brief Applies `f`, which returns a range, and joins the results.
     *
     * Specialized like `map`: ranges of values of this enumeration join into
     * a `ValueSet<V>`, ranges of another totally ordered type into a
     * `type::FlatSet`.
     */
    template <typename F>
        requires std::invocable<F&, const V&> &&
                 std::ranges::input_range<std::invoke_result_t<F&, const V&>>
    [[nodiscard]] auto flatMap(F f) const {
        using Element = std::ranges::range_reference_t<
            std::invoke_result_t<F&, const V&>>;
        if constexpr (detail::ValueReference<Element, V>) {
            Builder builder = emptyBuilder();
            for (const V& value : *this) {
                builder.addAll(std::invoke(f, value));
            }
            return builder.result();
        } else if constexpr (detail::ValueReference<Element, Val>) {
            typename ValueSet<std::remove_cvref_t<Element>>::Builder builder;
            for (const V& value : *this) {
                builder.addAll(std::invoke(f, value));
            }
            return builder.result();
        } else {
            using Mapped = std::remove_cvref_t<Element>;
            static_assert(std::totally_ordered<Mapped>,
                          "ValueSet::flatMap needs a totally ordered element "
                          "type");
            type::FlatSet<Mapped> mapped;
            for (const V& value : *this) {
                for (auto&& element : std::invoke(f, value)) {
                    mapped.insert(std::forward<decltype(element)>(element));
                }
            }
            return mapped;
        }
    }

    /**
     * @brief Applies `f` to every member and keeps the results in iteration
     * order, without any ordering or uniqueness requirement.
     */
    template <typename F>
        requires std::invocable<F&, const V&>
    [[nodiscard]] auto mapToVector(F f) const {
        using Result = std::invoke_result_t<F&, const V&>;
        using Element =
            std::conditional_t<std::is_lvalue_reference_v<Result>,
                               std::reference_wrapper<
                                   std::remove_reference_t<Result>>,
                               Result>;
        std::vector<Element> mapped;
        mapped.reserve(size());
        for (const V& value : *this) {
            mapped.push_back(std::invoke(f, value));
        }
        return mapped;
    }

    /**
     * @brief Member whose display name is `name`.
     * @throws UnknownNameError if there is none.
     */
    [[nodiscard]] auto withName(std::string_view name) const -> const V& {
        if (const auto* value = findByName(name)) {
            return *value;
        }
        spdlog::error("No value found for '{}'", name);
        THROW_UNKNOWN_NAME("No value found for '{}'", name);
    }

    /**
     * @brief Member whose display name is `name`, or nullptr.
     *
     * The name index is built on first use and shared by copies of this set.
     */
    [[nodiscard]] auto findByName(std::string_view name) const -> const V* {
        if (!index_) {
            for (const V& value : *this) {
                if (value.toString() == name) {
                    return &value;
                }
            }
            return nullptr;
        }
        std::call_once(index_->once, [this] {
            for (const V& value : *this) {
                index_->byName.try_emplace(value.toString(), &value);
            }
        });
        auto it = index_->byName.find(std::string(name));
        return it == index_->byName.end() ? nullptr : it->second;
    }

    /**
     * @brief Membership as 64-bit words: bit `k` stands for id
     * `registry()->minId() + k`. Uses the fewest words needed.
     */
    [[nodiscard]] auto toBitMask() const -> std::vector<word_type> {
        if (registry_ == nullptr) {
            return {};
        }
        const auto words = bitsAt(registry_->minId()).words();
        return {words.begin(), words.end()};
    }

    /**
     * @brief `Day.ValueSet(Monday, Tuesday)`.
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            registry_ == nullptr ? std::string() : registry_->name() + ".";
        result += "ValueSet(";
        bool first = true;
        for (const V& value : *this) {
            if (!first) {
                result += ", ";
            }
            result += value.toString();
            first = false;
        }
        result += ')';
        return result;
    }

    /**
     * @brief Same members. Two empty sets are equal whatever their
     * enumeration.
     */
    friend auto operator==(const ValueSet& lhs, const ValueSet& rhs) -> bool {
        if (lhs.empty() || rhs.empty()) {
            return lhs.empty() && rhs.empty();
        }
        if (lhs.registry_ != rhs.registry_) {
            return false;
        }
        const int offset = std::min(lhs.offset_, rhs.offset_);
        return lhs.bitsAt(offset) == rhs.bitsAt(offset);
    }

    friend auto operator<<(std::ostream& os, const ValueSet& set)
        -> std::ostream& {
        return os << set.toString();
    }

private:
    friend class Enum<V>;

    ValueSet(const RegistryBase* registry, type::BitMask bits, int offset)
        : registry_(registry),
          bits_(std::move(bits)),
          offset_(offset),
          index_(std::make_shared<detail::NameIndex<V>>()) {}

    static auto distance(int id, int offset) -> size_type {
        return static_cast<size_type>(static_cast<std::int64_t>(id) - offset);
    }

    auto valueAtBit(size_type bit) const -> const V& {
        const auto id = static_cast<int>(offset_ + static_cast<std::int64_t>(bit));
        return static_cast<const V&>(registry_->valueAt(id));
    }

    /**
     * @brief Membership re-expressed relative to `offset` (<= offset_).
     */
    auto bitsAt(int offset) const -> type::BitMask {
        if (offset >= offset_) {
            return bits_;
        }
        return bits_.shiftedUp(distance(offset_, offset));
    }

    auto emptyBuilder() const -> Builder {
        return registry_ == nullptr ? Builder() : Builder(*registry_);
    }

    template <typename Op>
    auto combineWith(const ValueSet& other, Op op) const -> ValueSet {
        if (registry_ != nullptr && other.registry_ != nullptr &&
            registry_ != other.registry_) {
            spdlog::error("Cannot combine value sets of '{}' and '{}'",
                          registry_->name(), other.registry_->name());
            THROW_CROSS_REGISTRY("Cannot combine value sets of '{}' and '{}'",
                                 registry_->name(), other.registry_->name());
        }
        if (registry_ == nullptr) {
            return other.registry_ == nullptr
                       ? ValueSet()
                       : ValueSet(other.registry_, op(type::BitMask(),
                                                      other.bits_),
                                  other.offset_);
        }
        if (other.registry_ == nullptr) {
            return ValueSet(registry_, op(bits_, type::BitMask()), offset_);
        }
        const int offset = std::min(offset_, other.offset_);
        return ValueSet(registry_, op(bitsAt(offset), other.bitsAt(offset)),
                        offset);
    }

    const RegistryBase* registry_ = nullptr;
    type::BitMask bits_;
    int offset_ = 0;
    std::shared_ptr<detail::NameIndex<V>> index_;
};

/**
 * @brief Set holding `lhs` and `rhs` (one member when they are equal).
 */
template <typename V>
    requires std::derived_from<V, Val>
[[nodiscard]] auto combine(const V& lhs, const V& rhs) -> ValueSet<V> {
    typename ValueSet<V>::Builder builder;
    builder.add(lhs).add(rhs);
    return builder.result();
}

template <typename V>
    requires std::derived_from<V, Val>
[[nodiscard]] auto operator+(const V& lhs, const V& rhs) -> ValueSet<V> {
    return combine(lhs, rhs);
}

}  // namespace ordinal::enums

#endif  // ORDINAL_ENUMS_VALUE_SET_HPP
