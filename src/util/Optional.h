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

#ifndef __ConchOptional__
#define __ConchOptional__

namespace Conch {

template <typename T>
class Optional;

// nullable pointer, nullptr means the value is absent
template <typename T>
class Optional<T*> {
public:
    Optional(T* value = nullptr)
        : m_value(value)
    {
    }

    Optional(std::nullptr_t)
        : m_value(nullptr)
    {
    }

    bool hasValue() const
    {
        return m_value != nullptr;
    }

    operator bool() const
    {
        return hasValue();
    }

    T* value() const
    {
        ASSERT(hasValue());
        return m_value;
    }

    T* operator->() const
    {
        return value();
    }

    bool operator==(const Optional<T*>& other) const
    {
        return m_value == other.m_value;
    }

    bool operator!=(const Optional<T*>& other) const
    {
        return m_value != other.m_value;
    }

private:
    T* m_value;
};
} // namespace Conch

#endif
