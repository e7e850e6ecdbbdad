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
#include "NativeFunctionObject.h"

namespace Conch {

NativeFunctionObject::NativeFunctionObject(ExecutionState& state, const NativeFunctionInfo& info)
    : FunctionObject(state, nullptr)
    , m_info(info)
    , m_internalSlot(nullptr)
{
    initFunctionProperties(state, info.m_name, info.m_argumentCount);
}

Value NativeFunctionObject::call(ExecutionState& state, const Value& thisValue, const size_t argc, Value* argv)
{
    return processNativeFunctionCall(state, thisValue, argc, argv, nullptr);
}

Value NativeFunctionObject::processNativeFunctionCall(ExecutionState& state, const Value& receiver, const size_t argc, Value* argv, Optional<Object*> newTarget)
{
    if (UNLIKELY(state.callDepth() >= CONCH_CALL_DEPTH_LIMIT)) {
        ErrorObject::throwBuiltinError(state, ErrorCode::RangeError, ErrorObject::Messages::MaximumCallStackSizeExceeded);
    }

    ExecutionState newState(&state, this, m_info.m_isStrict);

    size_t argumentCount = m_info.m_argumentCount;
    if (argc >= argumentCount) {
        return m_info.m_nativeFunction(newState, receiver, argc, argv, newTarget);
    }

    // pad missing arguments with undefined
    ValueVector paddedArgv;
    paddedArgv.reserve(argumentCount);
    for (size_t i = 0; i < argumentCount; i++) {
        paddedArgv.push_back(i < argc ? argv[i] : Value());
    }
    return m_info.m_nativeFunction(newState, receiver, argumentCount, paddedArgv.data(), newTarget);
}
} // namespace Conch
