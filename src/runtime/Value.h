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

#ifndef __ConchValue__
#define __ConchValue__

#include "runtime/PointerValue.h"

namespace Conch {

class ExecutionState;

// Value layout (one machine word)
//   Pointer  { 0:00 } aligned PointerValue*, never zero
//   Int      { 1 } signed integer shifted left by one
//   Other    { 10 } immediates below
#define TagBitInt 0x1
#define TagBitTypeOther 0x2
#define TagBitMask 0x3
#define ValueEmpty 0x0
#define ValueFalse (TagBitTypeOther | (0 << 2))
#define ValueTrue (TagBitTypeOther | (1 << 2))
#define ValueNull (TagBitTypeOther | (2 << 2))
#define ValueUndefined (TagBitTypeOther | (3 << 2))

class Value {
public:
    enum NullInitTag { Null };
    enum UndefinedInitTag { Undefined };
    enum EmptyValueInitTag { EmptyValue };
    enum TrueInitTag { True };
    enum FalseInitTag { False };
    enum FromPayloadTag { FromPayload };

    Value()
        : m_data(ValueUndefined)
    {
    }

    explicit Value(NullInitTag)
        : m_data(ValueNull)
    {
    }

    explicit Value(UndefinedInitTag)
        : m_data(ValueUndefined)
    {
    }

    explicit Value(EmptyValueInitTag)
        : m_data(ValueEmpty)
    {
    }

    explicit Value(TrueInitTag)
        : m_data(ValueTrue)
    {
    }

    explicit Value(FalseInitTag)
        : m_data(ValueFalse)
    {
    }

    explicit Value(FromPayloadTag, intptr_t payload)
        : m_data(payload)
    {
    }

    Value(PointerValue* ptr)
        : m_data(reinterpret_cast<intptr_t>(ptr))
    {
        ASSERT(ptr);
    }

    Value(const PointerValue* ptr)
        : m_data(reinterpret_cast<intptr_t>(ptr))
    {
        ASSERT(ptr);
    }

    explicit Value(bool value)
        : m_data(value ? ValueTrue : ValueFalse)
    {
    }

    explicit Value(int32_t value);
    explicit Value(uint32_t value);
    explicit Value(double value);

    bool operator==(const Value& other) const
    {
        return m_data == other.m_data;
    }

    bool operator!=(const Value& other) const
    {
        return m_data != other.m_data;
    }

    bool isEmpty() const
    {
        return m_data == ValueEmpty;
    }

    bool isUndefined() const
    {
        return m_data == ValueUndefined;
    }

    bool isNull() const
    {
        return m_data == ValueNull;
    }

    bool isUndefinedOrNull() const
    {
        return isUndefined() || isNull();
    }

    bool isBoolean() const
    {
        return m_data == ValueTrue || m_data == ValueFalse;
    }

    bool isTrue() const
    {
        return m_data == ValueTrue;
    }

    bool isFalse() const
    {
        return m_data == ValueFalse;
    }

    bool asBoolean() const
    {
        ASSERT(isBoolean());
        return m_data == ValueTrue;
    }

    bool isInt32() const
    {
        return m_data & TagBitInt;
    }

    int32_t asInt32() const
    {
        ASSERT(isInt32());
        return static_cast<int32_t>(m_data >> 1);
    }

    bool isPointerValue() const
    {
        return !(m_data & TagBitMask) && m_data != ValueEmpty;
    }

    PointerValue* asPointerValue() const
    {
        ASSERT(isPointerValue());
        return reinterpret_cast<PointerValue*>(m_data);
    }

    bool isNumber() const
    {
        return isInt32() || (isPointerValue() && asPointerValue()->isDoubleInValue());
    }

    double asNumber() const
    {
        ASSERT(isNumber());
        if (isInt32()) {
            return asInt32();
        }
        return asPointerValue()->asDoubleInValue()->value();
    }

    bool isString() const
    {
        return isPointerValue() && asPointerValue()->isString();
    }

    String* asString() const
    {
        return asPointerValue()->asString();
    }

    bool isObject() const
    {
        return isPointerValue() && asPointerValue()->isObject();
    }

    Object* asObject() const
    {
        return asPointerValue()->asObject();
    }

    bool isFunction() const
    {
        return isPointerValue() && asPointerValue()->isFunctionObject();
    }

    FunctionObject* asFunction() const
    {
        return asPointerValue()->asFunctionObject();
    }

    bool isConstructor() const
    {
        return isPointerValue() && asPointerValue()->isConstructorObject();
    }

    ConstructorObject* asConstructor() const
    {
        return asPointerValue()->asConstructorObject();
    }

    intptr_t payload() const
    {
        return m_data;
    }

    String* toPropertyKey(ExecutionState& state) const;
    String* toStringForDescription() const;
    bool equalsToByTheSameValueAlgorithm(const Value& other) const;

private:
    intptr_t m_data;
};

COMPILE_ASSERT(sizeof(Value) == sizeof(void*), "");
} // namespace Conch

#endif
