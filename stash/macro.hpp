/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Source location helpers used by the stash error macros

**************************************************/

#ifndef STASH_MACRO_HPP
#define STASH_MACRO_HPP

#define STASH_FILE_NAME __FILE__
#define STASH_FILE_LINE __LINE__
#define STASH_FUNC_NAME __func__

#if defined(__GNUC__) || defined(__clang__)
#define STASH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define STASH_UNLIKELY(x) (x)
#endif

#endif  // STASH_MACRO_HPP
