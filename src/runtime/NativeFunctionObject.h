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

#ifndef __ConchNativeFunctionObject__
#define __ConchNativeFunctionObject__

#include "runtime/FunctionObject.h"

namespace Conch {

class NativeFunctionObject : public FunctionObject {
public:
    NativeFunctionObject(ExecutionState& state, const NativeFunctionInfo& info);

    virtual bool isConstructor() const override
    {
        return m_info.m_isConstructor;
    }

    virtual Value call(ExecutionState& state, const Value& thisValue, const size_t argc, Value* argv) override;

    const NativeFunctionInfo& nativeFunctionInfo() const
    {
        return m_info;
    }

    // opaque data for embedders, the api layer keeps its callback here
    void* internalSlot() const
    {
        return m_internalSlot;
    }

    void setInternalSlot(void* data)
    {
        m_internalSlot = data;
    }

protected:
    Value processNativeFunctionCall(ExecutionState& state, const Value& receiver, const size_t argc, Value* argv, Optional<Object*> newTarget);

    NativeFunctionInfo m_info;
    void* m_internalSlot;
};
} // namespace Conch

#endif
