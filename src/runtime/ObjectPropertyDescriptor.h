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

#ifndef __ConchObjectPropertyDescriptor__
#define __ConchObjectPropertyDescriptor__

#include "runtime/Value.h"

namespace Conch {

class JSGetterSetter : public PointerValue {
public:
    JSGetterSetter(Optional<FunctionObject*> getter, Optional<FunctionObject*> setter)
        : m_getter(getter)
        , m_setter(setter)
    {
    }

    virtual bool isJSGetterSetter() const override
    {
        return true;
    }

    bool hasGetter() const
    {
        return m_getter.hasValue();
    }

    bool hasSetter() const
    {
        return m_setter.hasValue();
    }

    Optional<FunctionObject*> getter() const
    {
        return m_getter;
    }

    Optional<FunctionObject*> setter() const
    {
        return m_setter;
    }

    bool operator==(const JSGetterSetter& other) const
    {
        return m_getter == other.m_getter && m_setter == other.m_setter;
    }

    bool operator!=(const JSGetterSetter& other) const
    {
        return !operator==(other);
    }

private:
    Optional<FunctionObject*> m_getter;
    Optional<FunctionObject*> m_setter;
};

// complete property descriptor, either a data descriptor or an accessor descriptor
class ObjectPropertyDescriptor {
public:
    enum PresentAttribute {
        NotPresent = 0,
        WritablePresent = 1 << 1, // property can be written by set
        EnumerablePresent = 1 << 2, // property appears in enumeration
        ConfigurablePresent = 1 << 3, // property can be deleted or redefined
        AllPresent = WritablePresent | EnumerablePresent | ConfigurablePresent,
        AccessorDefault = EnumerablePresent | ConfigurablePresent,
    };

    explicit ObjectPropertyDescriptor(const Value& value, PresentAttribute attribute = AllPresent)
        : m_isDataDescriptor(true)
        , m_attribute(attribute)
        , m_value(value)
        , m_getterSetter(nullptr, nullptr)
    {
        ASSERT(!value.isEmpty());
    }

    // WritablePresent has no meaning for accessors and is dropped
    explicit ObjectPropertyDescriptor(const JSGetterSetter& getterSetter, PresentAttribute attribute = AccessorDefault)
        : m_isDataDescriptor(false)
        , m_attribute((PresentAttribute)(attribute & ~WritablePresent))
        , m_value()
        , m_getterSetter(getterSetter)
    {
    }

    bool isDataDescriptor() const
    {
        return m_isDataDescriptor;
    }

    bool isAccessorDescriptor() const
    {
        return !m_isDataDescriptor;
    }

    const Value& value() const
    {
        ASSERT(isDataDescriptor());
        return m_value;
    }

    const JSGetterSetter& getterSetter() const
    {
        ASSERT(isAccessorDescriptor());
        return m_getterSetter;
    }

    PresentAttribute attribute() const
    {
        return m_attribute;
    }

    bool isWritable() const
    {
        return m_attribute & WritablePresent;
    }

    bool isEnumerable() const
    {
        return m_attribute & EnumerablePresent;
    }

    bool isConfigurable() const
    {
        return m_attribute & ConfigurablePresent;
    }

private:
    bool m_isDataDescriptor;
    PresentAttribute m_attribute;
    Value m_value;
    JSGetterSetter m_getterSetter;
};
} // namespace Conch

#endif
