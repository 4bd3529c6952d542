/*
 * name_source.cpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Sources of declared value names for lazy name resolution

**************************************************/

#include "name_source.hpp"

#include <utility>

namespace ordinal::enums {

void DeclarationNameSource::record(const Val& value, std::string name) {
    std::scoped_lock lock(mutex_);
    entries_.push_back({&value, std::move(name)});
}

auto DeclarationNameSource::declaredNames() const -> std::vector<NameEntry> {
    std::scoped_lock lock(mutex_);
    return entries_;
}

auto DeclarationNameSource::size() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

}  // namespace ordinal::enums
