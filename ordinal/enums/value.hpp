/*
 * value.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Base class of enumerated values

**************************************************/

#ifndef ORDINAL_ENUMS_VALUE_HPP
#define ORDINAL_ENUMS_VALUE_HPP

#include <compare>
#include <optional>
#include <ostream>
#include <string>

namespace ordinal::enums {

class RegistryBase;

/**
 * @brief Base class of every enumerated value.
 *
 * A value is created by its registry (see `Enum<V>::declare` and
 * `Enum<V>::create`), which owns it for the registry's lifetime and hands out
 * references. Subclasses add the enumeration's own state and behaviour:
 *
 * @code
 * class Day : public ordinal::enums::Val {
 * public:
 *     explicit Day(bool weekend) : weekend_(weekend) {}
 *     bool isWorkingDay() const { return !weekend_; }
 * private:
 *     bool weekend_;
 * };
 * @endcode
 *
 * Id, name and owner are assigned when the registry adopts the value, so a
 * subclass constructor must not rely on them.
 */
class Val {
public:
    Val(const Val&) = delete;
    Val(Val&&) = delete;
    auto operator=(const Val&) -> Val& = delete;
    auto operator=(Val&&) -> Val& = delete;
    virtual ~Val() = default;

    /**
     * @brief The id, which is also the value's position in set bit masks.
     */
    [[nodiscard]] auto id() const noexcept -> int { return id_; }

    /**
     * @brief The registry this value belongs to.
     */
    [[nodiscard]] auto registry() const noexcept -> const RegistryBase& {
        return *owner_;
    }

    /**
     * @brief True when a name was supplied at registration time instead of
     * being resolved through the registry's name sources.
     */
    [[nodiscard]] auto hasExplicitName() const noexcept -> bool {
        return name_.has_value();
    }

    /**
     * @brief Display name.
     *
     * The explicit name if one was given, else the declared name resolved by
     * the registry. Never throws for a missing name: an unresolved value
     * renders as `<Invalid enum: no field for #id>`.
     *
     * @throws Whatever an installed external NameSource throws while the
     * name is resolved; the name cache is left as it was.
     */
    [[nodiscard]] auto toString() const -> std::string;

    /**
     * @brief Three-way comparison by id: negative, zero or positive.
     */
    [[nodiscard]] auto compare(const Val& other) const noexcept -> int {
        return id_ < other.id_ ? -1 : (id_ == other.id_ ? 0 : 1);
    }

    /**
     * @brief Equal iff owned by the same registry and carrying the same id.
     */
    friend auto operator==(const Val& lhs, const Val& rhs) noexcept -> bool {
        return lhs.owner_ == rhs.owner_ && lhs.id_ == rhs.id_;
    }

    /**
     * @brief Orders by id only; values of different registries with the same
     * id are equivalent but not equal.
     */
    friend auto operator<=>(const Val& lhs, const Val& rhs) noexcept
        -> std::weak_ordering {
        return lhs.id_ <=> rhs.id_;
    }

    friend auto operator<<(std::ostream& os, const Val& value)
        -> std::ostream& {
        return os << value.toString();
    }

protected:
    Val() = default;

private:
    friend class RegistryBase;

    int id_ = 0;
    std::optional<std::string> name_;
    const RegistryBase* owner_ = nullptr;
};

}  // namespace ordinal::enums

#endif  // ORDINAL_ENUMS_VALUE_HPP
