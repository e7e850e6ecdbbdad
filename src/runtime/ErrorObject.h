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

#ifndef __ConchErrorObject__
#define __ConchErrorObject__

#include "runtime/Object.h"

namespace Conch {

enum class ErrorCode : uint8_t {
    None,
    TypeError,
    RangeError,
    CycleError,
    NotConfigurableError,
    ReadOnlyError,
};

#define CONCH_ERROR_CODE_COUNT 6

class ErrorObject : public Object {
public:
    class Messages {
    public:
        static constexpr const char* NotImplemented = "Not implemented";
        static constexpr const char* Object_ToPropertyKey = "Cannot convert object to a property key";
        static constexpr const char* SetPrototype_Cycle = "Cyclic prototype value: the new prototype chain reaches the object itself";
        static constexpr const char* PrototypeChain_TooLong = "Maximum prototype chain length exceeded";
        static constexpr const char* DefineProperty_RedefineNotConfigurable = "Cannot redefine non-configurable property '%s'";
        static constexpr const char* SetProperty_ReadOnly = "Cannot assign to read only property '%s'";
        static constexpr const char* NOT_Callable = "Callee is not a function object";
        static constexpr const char* Not_Constructor = "Callee is not a constructor";
        static constexpr const char* No_Static_Link = "%s has no static link to initialize from";
        static constexpr const char* MaximumCallStackSizeExceeded = "Maximum call stack size exceeded";
    };

    static void throwBuiltinError(ExecutionState& state, ErrorCode code, const char* templateString)
    {
        throwBuiltinError(state, code, templateString, nullptr);
    }
    NO_RETURN static void throwBuiltinError(ExecutionState& state, ErrorCode code, const char* templateString, String* templateDataString);
    static ErrorObject* createBuiltinError(ExecutionState& state, ErrorCode code, const char* templateString, String* templateDataString);
    static ErrorObject* createError(ExecutionState& state, ErrorCode code, String* errorMessage);
    static String* errorCodeName(ExecutionState& state, ErrorCode code);

    ErrorObject(ExecutionState& state, Object* proto, ErrorCode code, String* errorMessage);

    virtual bool isErrorObject() const override
    {
        return true;
    }

    ErrorCode errorCode() const
    {
        return m_errorCode;
    }

private:
    ErrorCode m_errorCode;
};
} // namespace Conch

#endif
