/*
 * registry.cpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Enumeration Registry implementation

**************************************************/

#include "registry.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

namespace ordinal::enums {

namespace {

/**
 * @brief Marks the registries whose external name source is being consulted
 * on the current thread.
 *
 * A source that displays an unnamed value of the same registry would
 * otherwise recurse into itself; the nested lookup sees only declarations.
 */
class ExternalLookup {
public:
    explicit ExternalLookup(const RegistryBase* registry) {
        active_.push_back(registry);
    }
    ~ExternalLookup() { active_.pop_back(); }

    ExternalLookup(const ExternalLookup&) = delete;
    auto operator=(const ExternalLookup&) -> ExternalLookup& = delete;

    static auto active(const RegistryBase* registry) -> bool {
        return std::find(active_.begin(), active_.end(), registry) !=
               active_.end();
    }

private:
    static thread_local std::vector<const RegistryBase*> active_;
};

thread_local std::vector<const RegistryBase*> ExternalLookup::active_;

}  // namespace

RegistryBase::RegistryBase(RegistryOptions options)
    : name_(std::move(options.name)),
      queuedNames_(std::make_move_iterator(options.names.begin()),
                   std::make_move_iterator(options.names.end())),
      nextId_(options.initialId),
      topId_(options.initialId),
      bottomId_(std::min(options.initialId, 0)) {
    spdlog::debug("Created enumeration '{}' starting at id {}", name_,
                  nextId_);
}

RegistryBase::~RegistryBase() = default;

auto RegistryBase::maxId() const -> int {
    std::shared_lock lock(mutex_);
    return topId_;
}

auto RegistryBase::minId() const -> int {
    std::shared_lock lock(mutex_);
    return bottomId_;
}

auto RegistryBase::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return values_.size();
}

auto RegistryBase::contains(int id) const -> bool {
    std::shared_lock lock(mutex_);
    return values_.contains(id);
}

auto RegistryBase::valueAt(int id) const -> const Val& {
    if (const auto* value = findValueAt(id)) {
        return *value;
    }
    spdlog::error("No value with id {} in enumeration '{}'", id, name_);
    THROW_UNKNOWN_IDENTIFIER("No value with id {} in enumeration '{}'", id,
                             name_);
}

auto RegistryBase::findValueAt(int id) const -> const Val* {
    std::shared_lock lock(mutex_);
    auto it = values_.find(id);
    return it == values_.end() ? nullptr : it->second.get();
}

auto RegistryBase::nameOf(int id) const -> std::optional<std::string> {
    for (;;) {
        std::shared_ptr<const NameSource> source;
        std::uint64_t epoch = 0;
        {
            std::scoped_lock lock(nameMutex_);
            if (auto it = names_.find(id); it != names_.end()) {
                return it->second;
            }
            source = nameSource_;
            epoch = sourceEpoch_;
        }

        // Sources are consulted unlocked, they may display values of this
        // registry themselves.
        auto entries = collectNames(source);

        std::scoped_lock lock(nameMutex_);
        if (epoch != sourceEpoch_) {
            continue;
        }
        mergeNames(std::move(entries));
        if (auto it = names_.find(id); it != names_.end()) {
            return it->second;
        }
        return std::nullopt;
    }
}

void RegistryBase::setNameSource(std::shared_ptr<const NameSource> source) {
    std::scoped_lock lock(nameMutex_);
    nameSource_ = std::move(source);
    ++sourceEpoch_;
    names_.clear();
    // Cached value sets index values by name; force them to rebuild.
    generation_.fetch_add(1, std::memory_order_release);
}

auto RegistryBase::members() const -> Members {
    std::shared_lock lock(mutex_);
    Members result;
    result.offset = bottomId_;
    result.generation = generation_.load(std::memory_order_relaxed);
    for (const auto& [id, value] : values_) {
        result.bits.set(static_cast<std::size_t>(
            static_cast<std::int64_t>(id) - bottomId_));
    }
    return result;
}

auto RegistryBase::adopt(std::unique_ptr<Val> value, ValueSpec spec,
                         std::optional<std::string> declaredName) -> Val& {
    std::unique_lock lock(mutex_);
    const int id = spec.id.value_or(nextId_);
    if (values_.contains(id)) {
        spdlog::error("Duplicate id {} in enumeration '{}'", id, name_);
        THROW_DUPLICATE_IDENTIFIER("Duplicate id: {}", id);
    }
    if (id == std::numeric_limits<int>::max()) {
        spdlog::error("Id {} leaves no successor in enumeration '{}'", id,
                      name_);
        THROW_INVALID_ARGUMENT("Id {} leaves no successor id", id);
    }

    auto& adopted = *value;
    values_.emplace(id, std::move(value));

    adopted.id_ = id;
    adopted.owner_ = this;
    if (spec.name) {
        adopted.name_ = std::move(spec.name);
    } else if (!declaredName && !queuedNames_.empty()) {
        adopted.name_ = std::move(queuedNames_.front());
        queuedNames_.pop_front();
    }
    if (declaredName) {
        declarations_.record(adopted, std::move(*declaredName));
    }

    nextId_ = id + 1;
    topId_ = std::max(topId_, nextId_);
    bottomId_ = std::min(bottomId_, id);
    generation_.fetch_add(1, std::memory_order_release);

#if ORDINAL_ENUM_LOG_REGISTRATION
    spdlog::debug("Registered value #{} in enumeration '{}'", id, name_);
#endif
    return adopted;
}

auto RegistryBase::collectNames(
    const std::shared_ptr<const NameSource>& source) const
    -> std::vector<NameEntry> {
    auto entries = declarations_.declaredNames();
    if (!source || ExternalLookup::active(this)) {
        return entries;
    }

    ExternalLookup guard(this);
    auto external = source->declaredNames();
    entries.insert(entries.end(), std::make_move_iterator(external.begin()),
                   std::make_move_iterator(external.end()));
    return entries;
}

void RegistryBase::mergeNames(std::vector<NameEntry> entries) const {
    std::size_t foreign = 0;
    for (auto& entry : entries) {
        if (entry.value == nullptr || entry.value->owner_ != this) {
            ++foreign;
            continue;
        }
        names_.try_emplace(entry.value->id_, std::move(entry.name));
    }

    if (foreign > 0) {
        spdlog::warn("Skipped {} name entries not owned by enumeration '{}'",
                     foreign, name_);
    }
    spdlog::debug("Populated {} names for enumeration '{}'", names_.size(),
                  name_);
}

}  // namespace ordinal::enums
