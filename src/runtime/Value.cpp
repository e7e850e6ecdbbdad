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

#include "Conch.h"
#include "Value.h"
#include "runtime/String.h"
#include "runtime/Context.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"

namespace Conch {

static const intptr_t s_smiMin = std::max<intptr_t>(std::numeric_limits<int32_t>::min(), std::numeric_limits<intptr_t>::min() >> 1);
static const intptr_t s_smiMax = std::min<intptr_t>(std::numeric_limits<int32_t>::max(), std::numeric_limits<intptr_t>::max() >> 1);

static inline intptr_t encodeSmi(intptr_t v)
{
    return static_cast<intptr_t>(static_cast<uintptr_t>(v) << 1) | TagBitInt;
}

Value::Value(int32_t value)
{
    if (LIKELY(value >= s_smiMin && value <= s_smiMax)) {
        m_data = encodeSmi(value);
    } else {
        m_data = reinterpret_cast<intptr_t>(new DoubleInValue(value));
    }
}

Value::Value(uint32_t value)
{
    if (LIKELY(static_cast<intptr_t>(value) <= s_smiMax)) {
        m_data = encodeSmi(value);
    } else {
        m_data = reinterpret_cast<intptr_t>(new DoubleInValue(value));
    }
}

Value::Value(double value)
{
    // -0 must stay a double so SameValue can tell it from +0
    if (value >= s_smiMin && value <= s_smiMax) {
        int32_t asInt = static_cast<int32_t>(value);
        if (asInt == value && !(value == 0 && std::signbit(value))) {
            m_data = encodeSmi(asInt);
            return;
        }
    }
    m_data = reinterpret_cast<intptr_t>(new DoubleInValue(value));
}

String* Value::toPropertyKey(ExecutionState& state) const
{
    if (LIKELY(isString())) {
        return asString();
    }
    if (isObject()) {
        ErrorObject::throwBuiltinError(state, ErrorCode::TypeError, ErrorObject::Messages::Object_ToPropertyKey);
    }
    return toStringForDescription();
}

String* Value::toStringForDescription() const
{
    if (isString()) {
        return asString();
    }
    if (isInt32()) {
        return String::fromInt32(asInt32());
    }
    if (isNumber()) {
        return String::fromDouble(asNumber());
    }
    if (isUndefined()) {
        return String::fromASCII("undefined");
    }
    if (isNull()) {
        return String::fromASCII("null");
    }
    if (isBoolean()) {
        return asBoolean() ? String::fromASCII("true") : String::fromASCII("false");
    }
    if (isFunction()) {
        return String::fromASCII("[object Function]");
    }
    if (isObject()) {
        return String::fromASCII("[object Object]");
    }
    ASSERT(isEmpty());
    return String::fromASCII("");
}

bool Value::equalsToByTheSameValueAlgorithm(const Value& other) const
{
    if (isNumber() && other.isNumber()) {
        double a = asNumber();
        double b = other.asNumber();
        if (std::isnan(a) && std::isnan(b)) {
            return true;
        }
        if (a == 0 && b == 0) {
            return std::signbit(a) == std::signbit(b);
        }
        return a == b;
    }
    if (isString() && other.isString()) {
        return asString()->equals(other.asString());
    }
    return m_data == other.m_data;
}
} // namespace Conch
