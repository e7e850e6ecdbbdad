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

#ifndef __ConchObjectPropertyName__
#define __ConchObjectPropertyName__

#include "runtime/Value.h"
#include "runtime/String.h"

namespace Conch {

class ObjectPropertyName {
public:
    explicit ObjectPropertyName(String* name)
        : m_name(name)
    {
        ASSERT(name);
    }

    ObjectPropertyName(ExecutionState& state, const Value& v)
        : m_name(v.toPropertyKey(state))
    {
    }

    String* string() const
    {
        return m_name;
    }

    Value toValue() const
    {
        return Value(m_name);
    }

    size_t hashValue() const
    {
        return m_name->hashValue();
    }

    bool operator==(const ObjectPropertyName& other) const
    {
        return m_name->equals(other.m_name);
    }

    bool operator!=(const ObjectPropertyName& other) const
    {
        return !operator==(other);
    }

private:
    String* m_name;
};
} // namespace Conch

namespace std {
template <>
struct hash<Conch::ObjectPropertyName> {
    size_t operator()(Conch::ObjectPropertyName const& x) const
    {
        return x.hashValue();
    }
};

template <>
struct equal_to<Conch::ObjectPropertyName> {
    bool operator()(Conch::ObjectPropertyName const& a, Conch::ObjectPropertyName const& b) const
    {
        return a == b;
    }
};
} // namespace std

#endif
