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

#ifndef __ConchStaticStrings__
#define __ConchStaticStrings__

#include "runtime/String.h"

namespace Conch {

#define FOR_EACH_STATIC_STRING(F) \
    F(constructor)                \
    F(length)                     \
    F(message)                    \
    F(name)                       \
    F(undefined)

#define FOR_EACH_STATIC_ERROR_NAME_STRING(F) \
    F(TypeError)                             \
    F(RangeError)                            \
    F(CycleError)                            \
    F(NotConfigurableError)                  \
    F(ReadOnlyError)

class StaticStrings {
public:
    StaticStrings()
        : emptyString(nullptr)
#define INIT_NULL(name) , name(nullptr)
              FOR_EACH_STATIC_STRING(INIT_NULL)
                  FOR_EACH_STATIC_ERROR_NAME_STRING(INIT_NULL)
#undef INIT_NULL
    {
    }

    void initStaticStrings();

    String* emptyString;
#define DECLARE_STATIC_STRING(name) String* name;
    FOR_EACH_STATIC_STRING(DECLARE_STATIC_STRING)
    FOR_EACH_STATIC_ERROR_NAME_STRING(DECLARE_STATIC_STRING)
#undef DECLARE_STATIC_STRING
};
} // namespace Conch

#endif
