/*
 * value.cpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Base class of enumerated values

**************************************************/

#include "value.hpp"

#include <fmt/format.h>

#include "ordinal/enums/config.hpp"
#include "ordinal/enums/registry.hpp"

namespace ordinal::enums {

auto Val::toString() const -> std::string {
    if (name_) {
        return *name_;
    }
    if (owner_ != nullptr) {
        if (auto declared = owner_->nameOf(id_)) {
            return *std::move(declared);
        }
    }
    return fmt::format("{}{}>", ORDINAL_ENUM_INVALID_NAME_PREFIX, id_);
}

}  // namespace ordinal::enums
