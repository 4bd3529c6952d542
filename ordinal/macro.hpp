/*
 * macro.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Source location helpers shared by all modules

**************************************************/

#ifndef ORDINAL_MACRO_HPP
#define ORDINAL_MACRO_HPP

#define ORDINAL_FILE_NAME __FILE__
#define ORDINAL_FILE_LINE __LINE__

#if defined(__clang__) || defined(__GNUC__)
#define ORDINAL_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define ORDINAL_FUNC_NAME __FUNCSIG__
#else
#define ORDINAL_FUNC_NAME __func__
#endif

#endif  // ORDINAL_MACRO_HPP
