/*
 * Copyright (c) 2016-present Samsung Electronics Co., Ltd
 *
 *  This library is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public
 *  License as published by the Free Software Foundation; either
 *  version 2.1 of the License, or (at your option) any later version.
 *
 *  This library is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *  Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public
 *  License along with this library; if not, write to the Free Software
 *  Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301
 *  USA
 */

#ifndef __Conch__
#define __Conch__

#include <algorithm>
#include <cassert>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#if !defined(__GNUC__) && !defined(__clang__)
#error "Conch builds with GCC or Clang only"
#endif

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)
#define NO_RETURN __attribute__((__noreturn__))
#define UNUSED_PARAMETER(variable) (void)(variable)

#ifdef ENABLE_CUSTOM_LOGGING
// messages go to the PlatformRef given to Globals::initialize
#include <stdarg.h>
namespace Conch {
void customConchInfoLogger(const char* format, ...);
void customConchErrorLogger(const char* format, ...);
} // namespace Conch
#define CONCH_LOG_INFO(...) ::Conch::customConchInfoLogger(__VA_ARGS__);
#define CONCH_LOG_ERROR(...) ::Conch::customConchErrorLogger(__VA_ARGS__);
#else
#define CONCH_LOG_INFO(...) fprintf(stdout, __VA_ARGS__);
#define CONCH_LOG_ERROR(...) fprintf(stderr, __VA_ARGS__);
#endif

#if defined(NDEBUG)
#define ASSERT(assertion) ((void)0)
#define ASSERT_NOT_REACHED() ((void)0)
#else
#define ASSERT(assertion) assert(assertion);
#define ASSERT_NOT_REACHED() assert(false && "not reached")
#endif

#define COMPILE_ASSERT(exp, name) static_assert((exp), #name)

// kept in release builds, reports the location before aborting
#define RELEASE_ASSERT(assertion)                                                   \
    do {                                                                            \
        if (UNLIKELY(!(assertion))) {                                               \
            CONCH_LOG_ERROR("RELEASE_ASSERT %s at %s:%d\n", #assertion, __FILE__, __LINE__); \
            abort();                                                                \
        }                                                                           \
    } while (0)
#define RELEASE_ASSERT_NOT_REACHED()                                            \
    do {                                                                        \
        CONCH_LOG_ERROR("unreachable code at %s:%d\n", __FILE__, __LINE__);    \
        abort();                                                                \
    } while (0)

#define MAKE_STACK_ALLOCATED()                    \
    static void* operator new(size_t) = delete;   \
    static void* operator new[](size_t) = delete; \
    static void operator delete(void*) = delete;  \
    static void operator delete[](void*) = delete;

// structures with at least this many properties get a name to index map
#ifndef CONCH_OBJECT_STRUCTURE_ACCESS_CACHE_BUILD_MIN_SIZE
#define CONCH_OBJECT_STRUCTURE_ACCESS_CACHE_BUILD_MIN_SIZE 16
#endif

#ifndef CONCH_CALL_DEPTH_LIMIT
#define CONCH_CALL_DEPTH_LIMIT 1024
#endif

// most objects one prototype chain may hold, counting the object it starts from
#ifndef CONCH_PROTOTYPE_CHAIN_LIMIT
#define CONCH_PROTOTYPE_CHAIN_LIMIT (1024 * 64)
#endif

#ifndef CONCH_STRING_NUMBER_BUFFER_SIZE
#define CONCH_STRING_NUMBER_BUFFER_SIZE 32
#endif

#include <tsl/robin_map.h>
template <class Key, class T, class Hash = std::hash<Key>,
          class KeyEqual = std::equal_to<Key>,
          class Allocator = std::allocator<std::pair<Key, T>>,
          bool StoreHash = false,
          class GrowthPolicy = tsl::rh::power_of_two_growth_policy<2>>
using HashMap = tsl::robin_map<Key, T, Hash, KeyEqual, Allocator, StoreHash, GrowthPolicy>;

#include "ConchInfo.h"
#include "heap/Heap.h"
#include "util/Optional.h"

#endif
