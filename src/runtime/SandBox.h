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

#ifndef __ConchSandBox__
#define __ConchSandBox__

#include "runtime/Context.h"

namespace Conch {

struct StackTraceDataOnStack {
    String* functionName;
    bool isConstructor;
    bool isStrict;

    StackTraceDataOnStack()
        : functionName(nullptr)
        , isConstructor(false)
        , isStrict(false)
    {
    }
};

typedef Vector<StackTraceDataOnStack, gc_malloc_allocator<StackTraceDataOnStack>> StackTraceDataOnStackVector;

class SandBox : public gc {
public:
    explicit SandBox(Context* s);
    ~SandBox();

    struct SandBoxResult {
        Value result;
        Value error;
        StackTraceDataOnStackVector stackTrace;

        SandBoxResult()
            : result(Value::EmptyValue)
            , error(Value::EmptyValue)
        {
        }
    };

    SandBoxResult run(Value (*runner)(ExecutionState&, void*), void* data);
    SandBoxResult run(ExecutionState& parentState, Value (*runner)(ExecutionState&, void*), void* data);

    // innermost native call first
    static void createStackTrace(StackTraceDataOnStackVector& stackTraceDataVector, ExecutionState& state);

    NO_RETURN void throwException(ExecutionState& state, const Value& exception);

    Value exception() const
    {
        return m_exception;
    }

    Context* context() const
    {
        return m_context;
    }

protected:
    SandBoxResult runIn(ExecutionState& state, Value (*runner)(ExecutionState&, void*), void* data);
    void processCatch(const Value& error, SandBoxResult& result);

private:
    Context* m_context;
    SandBox* m_oldSandBox;
    StackTraceDataOnStackVector m_stackTraceDataVector;
    Value m_exception; // To avoid accidential GC of exception value
};
} // namespace Conch

#endif
