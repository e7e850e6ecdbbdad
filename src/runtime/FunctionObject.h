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

#ifndef __ConchFunctionObject__
#define __ConchFunctionObject__

#include "runtime/Object.h"
#include "runtime/ErrorObject.h"

namespace Conch {

// length of argv is at least NativeFunctionInfo.m_argumentCount, missing arguments are undefined
// only in construct call, newTarget have Object*
typedef Value (*NativeFunctionPointer)(ExecutionState& state, Value thisValue, size_t argc, Value* argv, Optional<Object*> newTarget);

struct NativeFunctionInfo {
    enum Flags {
        Strict = 1,
        Constructor = 1 << 1,
    };

    bool m_isStrict : 1;
    bool m_isConstructor : 1;
    String* m_name;
    NativeFunctionPointer m_nativeFunction;
    size_t m_argumentCount;

    NativeFunctionInfo(String* name, NativeFunctionPointer fn, size_t argc, int flags = Flags::Strict)
        : m_isStrict(flags & Strict)
        , m_isConstructor(flags & Constructor)
        , m_name(name)
        , m_nativeFunction(fn)
        , m_argumentCount(argc)
    {
    }
};

class FunctionObject : public Object {
public:
    virtual bool isFunctionObject() const override
    {
        return true;
    }

    virtual bool isConstructor() const
    {
        return false;
    }

    virtual Value call(ExecutionState& state, const Value& thisValue, const size_t argc, Value* argv) = 0;

protected:
    FunctionObject(ExecutionState& state, Optional<Object*> proto);

    // name and length are read-only, non-enumerable and configurable
    void initFunctionProperties(ExecutionState& state, String* name, size_t length);
};
} // namespace Conch

#endif
