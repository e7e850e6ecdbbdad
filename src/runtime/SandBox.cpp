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
#include "SandBox.h"
#include "runtime/NativeFunctionObject.h"
#include "runtime/VMInstance.h"

namespace Conch {

SandBox::SandBox(Context* s)
    : m_context(s)
{
    m_oldSandBox = m_context->vmInstance()->m_currentSandBox;
    m_context->vmInstance()->m_currentSandBox = this;
}

SandBox::~SandBox()
{
    ASSERT(m_context->vmInstance()->m_currentSandBox == this);
    m_context->vmInstance()->m_currentSandBox = m_oldSandBox;
}

void SandBox::processCatch(const Value& error, SandBoxResult& result)
{
    // result stays a valid value so callers never dereference an empty one
    result.result = Value();
    result.error = error;
    result.stackTrace = m_stackTraceDataVector;
    m_stackTraceDataVector.clear();
    m_exception = Value(Value::EmptyValue);
}

SandBox::SandBoxResult SandBox::run(Value (*runner)(ExecutionState&, void*), void* data)
{
    ExecutionState state(m_context);
    return runIn(state, runner, data);
}

SandBox::SandBoxResult SandBox::run(ExecutionState& parentState, Value (*runner)(ExecutionState&, void*), void* data)
{
    ExecutionState state(&parentState, nullptr, parentState.inStrictMode());
    return runIn(state, runner, data);
}

SandBox::SandBoxResult SandBox::runIn(ExecutionState& state, Value (*runner)(ExecutionState&, void*), void* data)
{
    SandBoxResult result;
    try {
        result.result = runner(state, data);
    } catch (const Value& err) {
        processCatch(err, result);
    }
    return result;
}

void SandBox::createStackTrace(StackTraceDataOnStackVector& stackTraceDataVector, ExecutionState& state)
{
    ExecutionState* pState = &state;
    while (pState) {
        if (pState->callee()) {
            NativeFunctionObject* callee = pState->callee().value();
            StackTraceDataOnStack data;
            data.functionName = callee->nativeFunctionInfo().m_name;
            data.isConstructor = callee->isConstructor();
            data.isStrict = pState->inStrictMode();
            stackTraceDataVector.push_back(data);
        }
        pState = pState->parent();
    }
}

void SandBox::throwException(ExecutionState& state, const Value& exception)
{
    m_stackTraceDataVector.clear();
    createStackTrace(m_stackTraceDataVector, state);

    // We MUST save thrown exception Value.
    // because bdwgc cannot track thrown value
    m_exception = exception;
    throw exception;
}
} // namespace Conch
