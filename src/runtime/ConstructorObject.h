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

#ifndef __ConchConstructorObject__
#define __ConchConstructorObject__

#include "runtime/NativeFunctionObject.h"

namespace Conch {

// ConstructorObject pairs an initializer with the prototype handed to every instance it constructs.
// Its own prototype link is the static link, so static members of a parent constructor
// are inherited through the ordinary resolver.
class ConstructorObject : public NativeFunctionObject {
public:
    ConstructorObject(ExecutionState& state, const NativeFunctionInfo& info);

    virtual bool isConstructorObject() const override
    {
        return true;
    }

    virtual bool isConstructor() const override
    {
        return true;
    }

    Object* constructionPrototype() const
    {
        return m_constructionPrototype;
    }

    // instances constructed later get proto, existing instances keep their link
    void setConstructionPrototype(ExecutionState& state, Object* proto);

    Optional<ConstructorObject*> staticLink() const;

    // both raise CycleError and leave the links unchanged when a cycle would form
    void linkStatic(ExecutionState& state, Optional<ConstructorObject*> parent);
    void linkInstancePrototype(ExecutionState& state, Optional<ConstructorObject*> parent);

    Object* construct(ExecutionState& state, const size_t argc, Value* argv);
    Value initialize(ExecutionState& state, Object* self, const size_t argc, Value* argv, Optional<Object*> newTarget = nullptr);
    // runs the initializer of the current static link against self
    Value initializeSuper(ExecutionState& state, Object* self, const size_t argc, Value* argv, Optional<Object*> newTarget = nullptr);

    bool hasInstance(ExecutionState& state, const Value& v) const;

private:
    Object* m_constructionPrototype;
};
} // namespace Conch

#endif
