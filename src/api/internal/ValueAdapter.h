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

#ifndef __ConchValueAdapter__
#define __ConchValueAdapter__

namespace Conch {

class ValueRef;

inline ValueRef* toRef(const Value& v)
{
    ASSERT(!v.isEmpty());
    return reinterpret_cast<ValueRef*>(v.payload());
}

inline Value toImpl(const ValueRef* v)
{
    ASSERT(v);
    return Value(Value::FromPayload, reinterpret_cast<intptr_t>(v));
}

inline OptionalRef<ValueRef> toOptionalValue(const Value& v)
{
    if (v.isEmpty()) {
        return nullptr;
    }
    return toRef(v);
}

#define DEFINE_REF_CAST(Name)                   \
    class Name;                                 \
    inline Name* toImpl(Name##Ref* v)           \
    {                                           \
        return reinterpret_cast<Name*>(v);      \
    }                                           \
    inline Name##Ref* toRef(Name* v)            \
    {                                           \
        return reinterpret_cast<Name##Ref*>(v); \
    }

CONCH_REF_LIST(DEFINE_REF_CAST);
#undef DEFINE_REF_CAST

inline ValueVector* toImpl(ValueVectorRef* v)
{
    return reinterpret_cast<ValueVector*>(v);
}

inline ValueVectorRef* toRef(ValueVector* v)
{
    return reinterpret_cast<ValueVectorRef*>(v);
}

} // namespace Conch

#endif
