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

#ifndef __ConchPointerValue__
#define __ConchPointerValue__

namespace Conch {

class Value;
class PointerValue;
class String;
class Object;
class FunctionObject;
class NativeFunctionObject;
class ConstructorObject;
class ErrorObject;
class DoubleInValue;
class JSGetterSetter;

class PointerValue : public gc {
public:
    virtual ~PointerValue() {}

    virtual bool isObject() const
    {
        return false;
    }

    virtual bool isString() const
    {
        return false;
    }

    virtual bool isFunctionObject() const
    {
        return false;
    }

    virtual bool isConstructorObject() const
    {
        return false;
    }

    virtual bool isErrorObject() const
    {
        return false;
    }

    virtual bool isDoubleInValue() const
    {
        return false;
    }

    virtual bool isJSGetterSetter() const
    {
        return false;
    }

    String* asString()
    {
        ASSERT(isString());
        return (String*)this;
    }

    Object* asObject()
    {
        ASSERT(isObject());
        return (Object*)this;
    }

    FunctionObject* asFunctionObject()
    {
        ASSERT(isFunctionObject());
        return (FunctionObject*)this;
    }

    ConstructorObject* asConstructorObject()
    {
        ASSERT(isConstructorObject());
        return (ConstructorObject*)this;
    }

    ErrorObject* asErrorObject()
    {
        ASSERT(isErrorObject());
        return (ErrorObject*)this;
    }

    DoubleInValue* asDoubleInValue()
    {
        ASSERT(isDoubleInValue());
        return (DoubleInValue*)this;
    }

    JSGetterSetter* asJSGetterSetter()
    {
        ASSERT(isJSGetterSetter());
        return (JSGetterSetter*)this;
    }
};

// boxed number which cannot be stored inline in a Value
class DoubleInValue : public PointerValue {
public:
    explicit DoubleInValue(double v)
        : m_value(v)
    {
    }

    virtual bool isDoubleInValue() const override
    {
        return true;
    }

    double value() const
    {
        return m_value;
    }

    void* operator new(size_t size)
    {
        return GC_MALLOC_ATOMIC(size);
    }
    void* operator new[](size_t size) = delete;

private:
    double m_value;
};
} // namespace Conch

#endif
