/*
 * config.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Enumeration Registry Configuration

**************************************************/

#ifndef ORDINAL_ENUMS_CONFIG_HPP
#define ORDINAL_ENUMS_CONFIG_HPP

#include <string>
#include <vector>

// Name reported by an enumeration constructed without one
#ifndef ORDINAL_ENUM_DEFAULT_NAME
#define ORDINAL_ENUM_DEFAULT_NAME "Enum"
#endif

// First id handed out when no explicit initial id is configured
#ifndef ORDINAL_ENUM_DEFAULT_INITIAL_ID
#define ORDINAL_ENUM_DEFAULT_INITIAL_ID 0
#endif

// Display text for a value whose name cannot be resolved, followed by the id
#ifndef ORDINAL_ENUM_INVALID_NAME_PREFIX
#define ORDINAL_ENUM_INVALID_NAME_PREFIX "<Invalid enum: no field for #"
#endif

// Emit a debug log line for every registered value
#ifndef ORDINAL_ENUM_LOG_REGISTRATION
#define ORDINAL_ENUM_LOG_REGISTRATION 1
#endif

namespace ordinal::enums {

/**
 * @brief Construction options of an enumeration registry.
 */
struct RegistryOptions {
    /// Display name of the enumeration, e.g. "Day"
    std::string name = ORDINAL_ENUM_DEFAULT_NAME;
    /// Id given to the first value registered without an explicit id
    int initialId = ORDINAL_ENUM_DEFAULT_INITIAL_ID;
    /// Explicit names handed, in order, to values registered without a name
    std::vector<std::string> names;
};

}  // namespace ordinal::enums

#endif  // ORDINAL_ENUMS_CONFIG_HPP
