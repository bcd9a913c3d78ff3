/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#if defined(_WIN32) && defined(SSW_SHARED)
#ifdef SSW_CORE_EXPORTS
#define SSW_CORE_API __declspec(dllexport)
#else
#define SSW_CORE_API __declspec(dllimport)
#endif
#elif defined(SSW_SHARED)
#define SSW_CORE_API __attribute__((visibility("default")))
#else
#define SSW_CORE_API
#endif

#define SSW_LOGGER_API SSW_CORE_API
