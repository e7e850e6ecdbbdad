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
#include "ConstructorObject.h"
#include "runtime/Context.h"

namespace Conch {

static Object* createConstructionPrototype(ExecutionState& state, ConstructorObject* constructor)
{
    Object* proto = new Object(state);
    ObjectPropertyDescriptor::PresentAttribute attribute = (ObjectPropertyDescriptor::PresentAttribute)(ObjectPropertyDescriptor::WritablePresent | ObjectPropertyDescriptor::ConfigurablePresent);
    proto->defineOwnPropertyThrowsException(state, ObjectPropertyName(state.context()->staticStrings().constructor), ObjectPropertyDescriptor(Value(constructor), attribute));
    return proto;
}

ConstructorObject::ConstructorObject(ExecutionState& state, const NativeFunctionInfo& info)
    : NativeFunctionObject(state, info)
    , m_constructionPrototype(nullptr)
{
    m_info.m_isConstructor = true;
    m_constructionPrototype = createConstructionPrototype(state, this);
}

void ConstructorObject::setConstructionPrototype(ExecutionState& state, Object* proto)
{
    ASSERT(proto);
    UNUSED_PARAMETER(state);
    m_constructionPrototype = proto;
}

Optional<ConstructorObject*> ConstructorObject::staticLink() const
{
    if (m_prototype && m_prototype->isConstructorObject()) {
        return m_prototype->asConstructorObject();
    }
    return nullptr;
}

void ConstructorObject::linkStatic(ExecutionState& state, Optional<ConstructorObject*> parent)
{
    Object* target = parent ? parent.value() : nullptr;
    setPrototypeThrowsException(state, target);
}

void ConstructorObject::linkInstancePrototype(ExecutionState& state, Optional<ConstructorObject*> parent)
{
    Object* target = parent ? parent->constructionPrototype() : nullptr;
    m_constructionPrototype->setPrototypeThrowsException(state, target);
}

Object* ConstructorObject::construct(ExecutionState& state, const size_t argc, Value* argv)
{
    Object* self = new Object(state, m_constructionPrototype);
    initialize(state, self, argc, argv, this);
    return self;
}

Value ConstructorObject::initialize(ExecutionState& state, Object* self, const size_t argc, Value* argv, Optional<Object*> newTarget)
{
    return processNativeFunctionCall(state, Value(self), argc, argv, newTarget);
}

Value ConstructorObject::initializeSuper(ExecutionState& state, Object* self, const size_t argc, Value* argv, Optional<Object*> newTarget)
{
    Optional<ConstructorObject*> parent = staticLink();
    if (UNLIKELY(!parent)) {
        ErrorObject::throwBuiltinError(state, ErrorCode::TypeError, ErrorObject::Messages::No_Static_Link, m_info.m_name);
    }
    return parent->initialize(state, self, argc, argv, newTarget);
}

bool ConstructorObject::hasInstance(ExecutionState& state, const Value& v) const
{
    if (!v.isObject()) {
        return false;
    }
    return m_constructionPrototype->isPrototypeOf(state, v.asObject());
}
} // namespace Conch
