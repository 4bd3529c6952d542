/*
 * name_source.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Sources of declared value names for lazy name resolution

**************************************************/

#ifndef ORDINAL_ENUMS_NAME_SOURCE_HPP
#define ORDINAL_ENUMS_NAME_SOURCE_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace ordinal::enums {

class Val;

/**
 * @brief A value together with the name it was declared under.
 */
struct NameEntry {
    const Val* value;
    std::string name;
};

/**
 * @brief Supplies the declared names of values.
 *
 * A registry consults its name sources only when a name lookup misses its
 * cache. Entries whose value belongs to a different registry are ignored by
 * the registry, so a source may safely report more than one enumeration.
 */
class NameSource {
public:
    virtual ~NameSource() = default;

    /**
     * @brief Every (value, name) pair known to this source.
     *
     * Called without any registry lock held, so it may display values.
     * Exceptions propagate to the caller of the name lookup.
     */
    [[nodiscard]] virtual auto declaredNames() const
        -> std::vector<NameEntry> = 0;
};

/**
 * @brief Name source fed by explicit declarations, in declaration order.
 *
 * Each registry owns one; `Enum<V>::declare` records into it.
 */
class DeclarationNameSource final : public NameSource {
public:
    /**
     * @brief Records that `value` was declared as `name`.
     */
    void record(const Val& value, std::string name);

    [[nodiscard]] auto declaredNames() const
        -> std::vector<NameEntry> override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::vector<NameEntry> entries_;
};

}  // namespace ordinal::enums

#endif  // ORDINAL_ENUMS_NAME_SOURCE_HPP
