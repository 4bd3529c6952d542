/*
 * error.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Errors raised by enumeration registries and value sets

**************************************************/

#ifndef ORDINAL_ENUMS_ERROR_HPP
#define ORDINAL_ENUMS_ERROR_HPP

#include "ordinal/error/exception.hpp"

namespace ordinal::enums {

/**
 * @brief Common base of all enumeration errors.
 */
class EnumError : public error::Exception {
public:
    using error::Exception::Exception;
};

/**
 * @brief A value was registered with an id that is already taken.
 */
class DuplicateIdentifierError final : public EnumError {
public:
    using EnumError::EnumError;
};

/**
 * @brief No value is registered under the requested id.
 */
class UnknownIdentifierError final : public EnumError {
public:
    using EnumError::EnumError;
};

/**
 * @brief No value carries the requested name.
 */
class UnknownNameError final : public EnumError {
public:
    using EnumError::EnumError;
};

/**
 * @brief Values or value sets of two different enumerations were mixed.
 */
class CrossRegistryOperationError final : public EnumError {
public:
    using EnumError::EnumError;
};

}  // namespace ordinal::enums

#define THROW_DUPLICATE_IDENTIFIER(...)                               \
    throw ordinal::enums::DuplicateIdentifierError(                   \
        ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, ORDINAL_FUNC_NAME, __VA_ARGS__)

#define THROW_UNKNOWN_IDENTIFIER(...)                                 \
    throw ordinal::enums::UnknownIdentifierError(                     \
        ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, ORDINAL_FUNC_NAME, __VA_ARGS__)

#define THROW_UNKNOWN_NAME(...)                                       \
    throw ordinal::enums::UnknownNameError(                           \
        ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, ORDINAL_FUNC_NAME, __VA_ARGS__)

#define THROW_CROSS_REGISTRY(...)                                     \
    throw ordinal::enums::CrossRegistryOperationError(                \
        ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, ORDINAL_FUNC_NAME, __VA_ARGS__)

#endif  // ORDINAL_ENUMS_ERROR_HPP
