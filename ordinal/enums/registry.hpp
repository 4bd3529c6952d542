/*
 * registry.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Enumeration Registry, the owner of id assignment, value lookup
and lazy name resolution

**************************************************/

#ifndef ORDINAL_ENUMS_REGISTRY_HPP
#define ORDINAL_ENUMS_REGISTRY_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ordinal/enums/config.hpp"
#include "ordinal/enums/error.hpp"
#include "ordinal/enums/name_source.hpp"
#include "ordinal/enums/value.hpp"
#include "ordinal/type/bitmask.hpp"

namespace ordinal::enums {

/**
 * @brief Optional id and explicit name of a value being registered.
 */
struct ValueSpec {
    std::optional<int> id;
    std::optional<std::string> name;
};

/**
 * @brief Type-independent core of an enumeration.
 *
 * Owns every value of one enumeration, assigns ids, tracks the id bounds and
 * resolves names on demand. `Enum<V>` layers the typed factories and the
 * cached `values()` set on top.
 *
 * Registration is serialized by an exclusive lock; lookups share it. Names
 * are resolved lazily: the first lookup that misses the name cache
 * repopulates it from the declaration records and the optional external
 * name source.
 */
class RegistryBase {
public:
    /**
     * @brief Id bitmap of the registered values at one point in time.
     */
    struct Members {
        type::BitMask bits;
        int offset = 0;
        std::uint64_t generation = 0;
    };

    explicit RegistryBase(RegistryOptions options = {});
    virtual ~RegistryBase();

    RegistryBase(const RegistryBase&) = delete;
    auto operator=(const RegistryBase&) -> RegistryBase& = delete;

    /**
     * @brief Display name of the enumeration.
     */
    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    /**
     * @brief One past the highest id ever assigned.
     *
     * With default sequential ids starting at 0 this is the number of values.
     */
    [[nodiscard]] auto maxId() const -> int;

    /**
     * @brief Lowest id ever assigned, but never above 0. Bit `k` of a
     * value set's exported mask stands for id `minId() + k`.
     */
    [[nodiscard]] auto minId() const -> int;

    /**
     * @brief Number of registered values.
     */
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto contains(int id) const -> bool;

    /**
     * @brief The value registered under `id`.
     * @throws UnknownIdentifierError if there is none.
     */
    [[nodiscard]] auto valueAt(int id) const -> const Val&;

    /**
     * @brief The value registered under `id`, or nullptr.
     */
    [[nodiscard]] auto findValueAt(int id) const -> const Val*;

    /**
     * @brief Declared name of the value with `id`.
     *
     * Served from the name cache; on a miss the cache is repopulated from the
     * name sources first. Values of other registries reported by a source are
     * skipped.
     *
     * @return The name, or std::nullopt if no source declares one.
     */
    [[nodiscard]] auto nameOf(int id) const -> std::optional<std::string>;

    /**
     * @brief Installs an external name source, consulted after the
     * registry's own declaration records.
     *
     * Clears the name cache and bumps the generation, so cached value sets
     * rebuild their name index against the new source.
     */
    void setNameSource(std::shared_ptr<const NameSource> source);

    /**
     * @brief Current generation, bumped by every registration and every
     * change of name source.
     */
    [[nodiscard]] auto generation() const noexcept -> std::uint64_t {
        return generation_.load(std::memory_order_acquire);
    }

    /**
     * @brief Collects the id bitmap of all registered values.
     */
    [[nodiscard]] auto members() const -> Members;

protected:
    /**
     * @brief Takes ownership of a freshly constructed value and registers it.
     *
     * Uses `spec.id` or the next sequential id, and `spec.name` as the
     * explicit name. Without a `declaredName` the next queued name, if any,
     * becomes the explicit name; with one, it is recorded as the declared
     * name before the value becomes visible to other threads.
     * Nothing is modified when the id is already taken.
     *
     * @throws DuplicateIdentifierError if the id is in use.
     */
    auto adopt(std::unique_ptr<Val> value, ValueSpec spec,
               std::optional<std::string> declaredName = std::nullopt)
        -> Val&;

private:
    [[nodiscard]] auto collectNames(
        const std::shared_ptr<const NameSource>& source) const
        -> std::vector<NameEntry>;
    void mergeNames(std::vector<NameEntry> entries) const;

    const std::string name_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<int, std::unique_ptr<Val>> values_;
    std::deque<std::string> queuedNames_;
    int nextId_;
    int topId_;
    int bottomId_;
    std::atomic<std::uint64_t> generation_{0};

    mutable std::mutex nameMutex_;
    mutable std::unordered_map<int, std::string> names_;
    DeclarationNameSource declarations_;
    std::shared_ptr<const NameSource> nameSource_;
    std::uint64_t sourceEpoch_ = 0;
};

}  // namespace ordinal::enums

#endif  // ORDINAL_ENUMS_REGISTRY_HPP
