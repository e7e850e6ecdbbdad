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

#ifndef __ConchExecutionState__
#define __ConchExecutionState__

namespace Conch {

class Context;
class Value;
class NativeFunctionObject;

class ExecutionState {
    MAKE_STACK_ALLOCATED();

public:
    explicit ExecutionState(Context* context)
        : m_context(context)
        , m_parent(nullptr)
        , m_callee(nullptr)
        , m_callDepth(0)
        , m_inStrictMode(false)
    {
    }

    ExecutionState(ExecutionState* parent, NativeFunctionObject* callee, bool inStrictMode)
        : m_context(parent->context())
        , m_parent(parent)
        , m_callee(callee)
        , m_callDepth(parent->callDepth() + 1)
        , m_inStrictMode(inStrictMode)
    {
    }

    Context* context() const
    {
        return m_context;
    }

    ExecutionState* parent() const
    {
        return m_parent;
    }

    Optional<NativeFunctionObject*> callee() const
    {
        return m_callee;
    }

    size_t callDepth() const
    {
        return m_callDepth;
    }

    bool inStrictMode() const
    {
        return m_inStrictMode;
    }

    NO_RETURN void throwException(const Value& e);

private:
    Context* m_context;
    ExecutionState* m_parent;
    NativeFunctionObject* m_callee;
    size_t m_callDepth;
    bool m_inStrictMode;
};
} // namespace Conch

#endif
