/*
 * enum.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Typed enumeration: value factories, lookups and the cached set
of all values

**************************************************/

#ifndef ORDINAL_ENUMS_ENUM_HPP
#define ORDINAL_ENUMS_ENUM_HPP

#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "spdlog/spdlog.h"

#include "ordinal/enums/config.hpp"
#include "ordinal/enums/registry.hpp"
#include "ordinal/enums/value.hpp"
#include "ordinal/enums/value_set.hpp"

namespace ordinal::enums {

/**
 * @brief An enumeration whose values are of type `V`.
 *
 * Declare the values as members of a subclass, in order:
 *
 * @code
 * class Day : public ordinal::enums::Val {
 *     friend class ordinal::enums::Enum<Day>;
 *     explicit Day(bool weekend) : weekend_(weekend) {}
 *     bool weekend_;
 * public:
 *     bool isWorkingDay() const { return !weekend_; }
 * };
 *
 * class DayEnum : public ordinal::enums::Enum<Day> {
 * public:
 *     DayEnum() : Enum({.name = "Day"}) {}
 *     const Day& Monday = declare("Monday", false);
 *     ...
 *     const Day& Sunday = declare("Sunday", true);
 * };
 * @endcode
 *
 * `declare` assigns the next id and records the name for lazy resolution;
 * `create` takes an optional explicit id and an explicit display name.
 *
 * @tparam V Value type; `declare<T>`/`create<T>` may construct subclasses.
 */
template <typename V>
class Enum : public RegistryBase {
    static_assert(std::derived_from<V, Val>,
                  "Enumeration values must derive from ordinal::enums::Val");

public:
    using Value = V;
    using ValueSet = ::ordinal::enums::ValueSet<V>;

    explicit Enum(RegistryOptions options = {})
        : RegistryBase(std::move(options)) {}

    /**
     * @brief Registers a new value constructed from `args`.
     *
     * @param spec Explicit id and/or display name; both optional.
     * @throws DuplicateIdentifierError if the id is taken; the enumeration is
     * left unchanged.
     */
    template <typename T = V, typename... Args>
        requires std::derived_from<T, V>
    auto create(ValueSpec spec, Args&&... args) -> const T& {
        std::unique_ptr<Val> value(new T(std::forward<Args>(args)...));
        return static_cast<const T&>(adopt(std::move(value), std::move(spec)));
    }

    /**
     * @brief Registers a new value under the next id and records `name` as
     * its declared name.
     */
    template <typename T = V, typename... Args>
        requires std::derived_from<T, V>
    auto declare(std::string name, Args&&... args) -> const T& {
        return declareValue<T>(ValueSpec{}, std::move(name),
                               std::forward<Args>(args)...);
    }

    /**
     * @brief Like `declare`, with an explicit id.
     * @throws DuplicateIdentifierError if the id is taken.
     */
    template <typename T = V, typename... Args>
        requires std::derived_from<T, V>
    auto declareAt(int id, std::string name, Args&&... args) -> const T& {
        return declareValue<T>(ValueSpec{.id = id}, std::move(name),
                               std::forward<Args>(args)...);
    }

    /**
     * @brief The value with `id`.
     * @throws UnknownIdentifierError if there is none.
     */
    [[nodiscard]] auto value(int id) const -> const V& {
        return static_cast<const V&>(valueAt(id));
    }

    [[nodiscard]] auto operator()(int id) const -> const V& {
        return value(id);
    }

    /**
     * @brief The value with `id`, or nullptr.
     */
    [[nodiscard]] auto findValue(int id) const -> const V* {
        return static_cast<const V*>(findValueAt(id));
    }

    /**
     * @brief The value whose display name is `name`.
     * @throws UnknownNameError if there is none.
     */
    [[nodiscard]] auto withName(std::string_view name) const -> const V& {
        return snapshot()->withName(name);
    }

    [[nodiscard]] auto findByName(std::string_view name) const -> const V* {
        return snapshot()->findByName(name);
    }

    /**
     * @brief All values of the enumeration.
     *
     * Served from a cached set that is rebuilt after new registrations. A
     * caller racing with a registration may receive the set as it was just
     * before it.
     */
    [[nodiscard]] auto values() const -> ValueSet { return *snapshot(); }

    [[nodiscard]] auto emptySet() const -> ValueSet {
        return ValueSet(this, type::BitMask(), minId());
    }

    /**
     * @brief Set from words exported by `ValueSet::toBitMask`.
     */
    [[nodiscard]] auto fromBitMask(
        std::span<const typename ValueSet::word_type> words) const
        -> ValueSet {
        return ValueSet::fromBitMask(*this, words);
    }

private:
    template <typename T, typename... Args>
    auto declareValue(ValueSpec spec, std::string name, Args&&... args)
        -> const T& {
        std::unique_ptr<Val> value(new T(std::forward<Args>(args)...));
        return static_cast<const T&>(
            adopt(std::move(value), std::move(spec), std::move(name)));
    }

    auto snapshot() const -> std::shared_ptr<const ValueSet> {
        const auto current = generation();
        {
            std::shared_lock lock(snapshotMutex_);
            if (snapshot_ && snapshotGeneration_ == current) {
                return snapshot_;
            }
        }

        auto collected = members();
        auto rebuilt = std::make_shared<const ValueSet>(
            ValueSet(this, std::move(collected.bits), collected.offset));
        spdlog::debug("Rebuilt value set of '{}' with {} values", name(),
                      rebuilt->size());

        std::unique_lock lock(snapshotMutex_);
        if (!snapshot_ || snapshotGeneration_ < collected.generation) {
            snapshot_ = std::move(rebuilt);
            snapshotGeneration_ = collected.generation;
        }
        return snapshot_;
    }

    mutable std::shared_mutex snapshotMutex_;
    mutable std::shared_ptr<const ValueSet> snapshot_;
    mutable std::uint64_t snapshotGeneration_ = 0;
};

}  // namespace ordinal::enums

#endif  // ORDINAL_ENUMS_ENUM_HPP
