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
#include "Object.h"
#include "runtime/Context.h"
#include "runtime/ErrorObject.h"
#include "runtime/FunctionObject.h"

namespace Conch {

// counts the move onto the next object of a chain
#define CHECK_PROTOTYPE_CHAIN_HOPS(state, hops)                                                                               \
    do {                                                                                                                      \
        if (UNLIKELY(++hops >= CONCH_PROTOTYPE_CHAIN_LIMIT)) {                                                                \
            ErrorObject::throwBuiltinError(state, ErrorCode::RangeError, ErrorObject::Messages::PrototypeChain_TooLong);      \
        }                                                                                                                     \
    } while (0)

// stops counting once the length is past the limit
static size_t countPrototypeChainLength(Optional<Object*> proto)
{
    size_t length = 0;
    while (proto && length <= CONCH_PROTOTYPE_CHAIN_LIMIT) {
        length++;
        proto = proto->getPrototypeObject();
    }
    return length;
}

Value ObjectGetResult::valueSlowCase(ExecutionState& state, const Value& receiver) const
{
    ASSERT(!m_isDataProperty);
    if (m_jsGetterSetter && m_jsGetterSetter->hasGetter()) {
        return m_jsGetterSetter->getter()->call(state, receiver, 0, nullptr);
    }
    return Value();
}

ObjectPropertyDescriptor ObjectGetResult::convertToPropertyDescriptor() const
{
    ASSERT(hasValue());
    int attribute = ObjectPropertyDescriptor::NotPresent;
    if (m_isEnumerable) {
        attribute |= ObjectPropertyDescriptor::EnumerablePresent;
    }
    if (m_isConfigurable) {
        attribute |= ObjectPropertyDescriptor::ConfigurablePresent;
    }

    if (isDataProperty()) {
        if (m_isWritable) {
            attribute |= ObjectPropertyDescriptor::WritablePresent;
        }
        return ObjectPropertyDescriptor(m_value, (ObjectPropertyDescriptor::PresentAttribute)attribute);
    }
    return ObjectPropertyDescriptor(*m_jsGetterSetter, (ObjectPropertyDescriptor::PresentAttribute)attribute);
}

Object::Object(ExecutionState& state)
    : m_prototype(nullptr)
    , m_prototypeChainLength(1)
{
    UNUSED_PARAMETER(state);
}

Object::Object(ExecutionState& state, Optional<Object*> proto)
    : m_prototype(proto)
    , m_prototypeChainLength(proto ? proto->m_prototypeChainLength + 1 : 1)
{
    if (UNLIKELY(m_prototypeChainLength > CONCH_PROTOTYPE_CHAIN_LIMIT)) {
        // the recorded length is stale when an ancestor was relinked later, count again
        m_prototypeChainLength = countPrototypeChainLength(proto) + 1;
        if (m_prototypeChainLength > CONCH_PROTOTYPE_CHAIN_LIMIT) {
            ErrorObject::throwBuiltinError(state, ErrorCode::RangeError, ErrorObject::Messages::PrototypeChain_TooLong);
        }
    }
}

Value Object::getPrototype(ExecutionState& state) const
{
    UNUSED_PARAMETER(state);
    if (m_prototype) {
        return Value(m_prototype.value());
    }
    return Value(Value::Null);
}

Object::PrototypeLinkResult Object::linkPrototype(Optional<Object*> proto)
{
    if (proto == m_prototype) {
        return PrototypeLinked;
    }

    // walk the requested chain, reaching this object means the link would close a cycle
    Optional<Object*> p = proto;
    size_t length = 0;
    while (p) {
        if (p.value() == this) {
#ifdef CONCH_DEBUG_OBJECT_MODEL
            CONCH_LOG_INFO("[Conch] rejected prototype link %p -> %p (cycle)\n", this, proto.value());
#endif
            return PrototypeLinkCycle;
        }
        // this object takes one more place in front of proto's chain
        if (++length >= CONCH_PROTOTYPE_CHAIN_LIMIT) {
#ifdef CONCH_DEBUG_OBJECT_MODEL
            CONCH_LOG_INFO("[Conch] rejected prototype link %p -> %p (chain too long)\n", this, proto.value());
#endif
            return PrototypeChainTooLong;
        }
        p = p->m_prototype;
    }

    m_prototype = proto;
    m_prototypeChainLength = length + 1;
    return PrototypeLinked;
}

bool Object::setPrototype(ExecutionState& state, Optional<Object*> proto)
{
    UNUSED_PARAMETER(state);
    return linkPrototype(proto) == PrototypeLinked;
}

void Object::setPrototypeThrowsException(ExecutionState& state, Optional<Object*> proto)
{
    switch (linkPrototype(proto)) {
    case PrototypeLinked:
        return;
    case PrototypeLinkCycle:
        ErrorObject::throwBuiltinError(state, ErrorCode::CycleError, ErrorObject::Messages::SetPrototype_Cycle);
        return;
    case PrototypeChainTooLong:
        ErrorObject::throwBuiltinError(state, ErrorCode::RangeError, ErrorObject::Messages::PrototypeChain_TooLong);
        return;
    }
}

bool Object::isPrototypeOf(ExecutionState& state, Object* other) const
{
    Optional<Object*> p = other->m_prototype;
    size_t hops = 0;
    while (p) {
        CHECK_PROTOTYPE_CHAIN_HOPS(state, hops);
        if (p.value() == this) {
            return true;
        }
        p = p->m_prototype;
    }
    return false;
}

ObjectGetResult Object::getOwnProperty(ExecutionState& state, const ObjectPropertyName& P)
{
    UNUSED_PARAMETER(state);
    size_t idx = m_structure.findProperty(P);
    if (idx == SIZE_MAX) {
        return ObjectGetResult();
    }

    const ObjectStructureItem& item = m_structure.readProperty(idx);
    bool isEnumerable = item.m_attribute & ObjectPropertyDescriptor::EnumerablePresent;
    bool isConfigurable = item.m_attribute & ObjectPropertyDescriptor::ConfigurablePresent;
    if (item.isDataProperty()) {
        bool isWritable = item.m_attribute & ObjectPropertyDescriptor::WritablePresent;
        return ObjectGetResult(item.m_value, isWritable, isEnumerable, isConfigurable);
    }
    return ObjectGetResult(item.getterSetter(), isEnumerable, isConfigurable);
}

// a non-configurable property accepts a new descriptor only when nothing observable changes
// except lowering writable or changing the value of a writable data property
static bool isValidRedefinitionOfNonConfigurableProperty(const ObjectPropertyDescriptor& current, const ObjectPropertyDescriptor& desc)
{
    ASSERT(!current.isConfigurable());
    if (desc.isConfigurable()) {
        return false;
    }
    if (desc.isEnumerable() != current.isEnumerable()) {
        return false;
    }
    if (desc.isDataDescriptor() != current.isDataDescriptor()) {
        return false;
    }

    if (current.isDataDescriptor()) {
        if (!current.isWritable()) {
            if (desc.isWritable()) {
                return false;
            }
            if (!desc.value().equalsToByTheSameValueAlgorithm(current.value())) {
                return false;
            }
        }
        return true;
    }

    return desc.getterSetter() == current.getterSetter();
}

bool Object::defineOwnProperty(ExecutionState& state, const ObjectPropertyName& P, const ObjectPropertyDescriptor& desc)
{
    UNUSED_PARAMETER(state);
    size_t idx = m_structure.findProperty(P);
    if (idx == SIZE_MAX) {
        m_structure.addProperty(P, desc);
        return true;
    }

    const ObjectStructureItem& item = m_structure.readProperty(idx);
    if (!(item.m_attribute & ObjectPropertyDescriptor::ConfigurablePresent)) {
        if (!isValidRedefinitionOfNonConfigurableProperty(item.descriptor(), desc)) {
            return false;
        }
    }

    // the whole record is replaced, a setter-only accessor drops a previous getter
    m_structure.replaceProperty(idx, desc);
    return true;
}

void Object::defineOwnPropertyThrowsException(ExecutionState& state, const ObjectPropertyName& P, const ObjectPropertyDescriptor& desc)
{
    if (UNLIKELY(!defineOwnProperty(state, P, desc))) {
        ErrorObject::throwBuiltinError(state, ErrorCode::NotConfigurableError, ErrorObject::Messages::DefineProperty_RedefineNotConfigurable, P.string());
    }
}

bool Object::deleteOwnProperty(ExecutionState& state, const ObjectPropertyName& P)
{
    size_t idx = m_structure.findProperty(P);
    if (idx == SIZE_MAX) {
        // nothing to remove here, an ancestor carrying P makes this a successful no-op
        return m_prototype && m_prototype->hasProperty(state, P);
    }

    if (!(m_structure.readProperty(idx).m_attribute & ObjectPropertyDescriptor::ConfigurablePresent)) {
        return false;
    }

    m_structure.removeProperty(idx);
    return true;
}

ValueVector Object::ownPropertyKeys(ExecutionState& state)
{
    UNUSED_PARAMETER(state);
    ValueVector result;
    size_t count = m_structure.propertyCount();
    result.reserve(count);
    for (size_t i = 0; i < count; i++) {
        result.push_back(m_structure.readProperty(i).m_propertyName.toValue());
    }
    return result;
}

void Object::enumeration(ExecutionState& state, EnumerationCallback callback, void* data, bool shouldSkipNonEnumerable)
{
    // snapshot the keys so the callback may mutate this object
    ValueVector keys = ownPropertyKeys(state);
    for (size_t i = 0; i < keys.size(); i++) {
        ObjectPropertyName name(keys[i].asString());
        ObjectGetResult result = getOwnProperty(state, name);
        if (!result.hasValue()) {
            continue;
        }
        if (shouldSkipNonEnumerable && !result.isEnumerable()) {
            continue;
        }
        if (!callback(state, this, name, result.convertToPropertyDescriptor(), data)) {
            break;
        }
    }
}

ObjectGetResult Object::get(ExecutionState& state, const ObjectPropertyName& P)
{
    Object* iter = this;
    size_t hops = 0;

    while (true) {
        // first match wins, even an accessor without getter ends the lookup
        ObjectGetResult desc = iter->getOwnProperty(state, P);
        if (desc.hasValue()) {
            return desc;
        }

        if (!iter->m_prototype) {
            break;
        }
        iter = iter->m_prototype.value();
        CHECK_PROTOTYPE_CHAIN_HOPS(state, hops);
    }
    return ObjectGetResult();
}

bool Object::hasProperty(ExecutionState& state, const ObjectPropertyName& P)
{
    Object* iter = this;
    size_t hops = 0;

    while (true) {
        if (iter->hasOwnProperty(state, P)) {
            return true;
        }
        if (!iter->m_prototype) {
            return false;
        }
        iter = iter->m_prototype.value();
        CHECK_PROTOTYPE_CHAIN_HOPS(state, hops);
    }
}

bool Object::writeOwnDataProperty(ExecutionState& state, Object* receiver, const ObjectPropertyName& P, const Value& v)
{
    ObjectGetResult existingDesc = receiver->getOwnProperty(state, P);
    if (existingDesc.hasValue()) {
        if (!existingDesc.isDataProperty() || !existingDesc.isWritable()) {
            return false;
        }
        // keep the flags of the existing property, only the value changes
        ObjectPropertyDescriptor desc = existingDesc.convertToPropertyDescriptor();
        return receiver->defineOwnProperty(state, P, ObjectPropertyDescriptor(v, desc.attribute()));
    }
    return receiver->defineOwnProperty(state, P, ObjectPropertyDescriptor(v, ObjectPropertyDescriptor::AllPresent));
}

bool Object::setWithLookupStart(ExecutionState& state, Optional<Object*> lookupStart, const ObjectPropertyName& P, const Value& v, const Value& receiver)
{
    Optional<Object*> iter = lookupStart;
    size_t hops = 0;

    while (iter) {
        ObjectGetResult desc = iter->getOwnProperty(state, P);
        if (desc.hasValue()) {
            if (!desc.isDataProperty()) {
                // an accessor anywhere on the chain owns the write
                JSGetterSetter* getterSetter = desc.jsGetterSetter();
                if (!getterSetter->hasSetter()) {
                    return false;
                }
                Value argv[] = { v };
                getterSetter->setter()->call(state, receiver, 1, argv);
                return true;
            }
            // a data property, own or inherited, never receives the write itself
            break;
        }
        iter = iter->m_prototype;
        if (iter) {
            CHECK_PROTOTYPE_CHAIN_HOPS(state, hops);
        }
    }

    if (!receiver.isObject()) {
        return false;
    }
    return writeOwnDataProperty(state, receiver.asObject(), P, v);
}

bool Object::set(ExecutionState& state, const ObjectPropertyName& P, const Value& v, const Value& receiver)
{
    return setWithLookupStart(state, this, P, v, receiver);
}

bool Object::setThrowsExceptionWhenStrictMode(ExecutionState& state, const ObjectPropertyName& P, const Value& v, const Value& receiver)
{
    bool result = set(state, P, v, receiver);
    if (UNLIKELY(!result) && state.inStrictMode()) {
        ErrorObject::throwBuiltinError(state, ErrorCode::ReadOnlyError, ErrorObject::Messages::SetProperty_ReadOnly, P.string());
    }
    return result;
}

Value Object::superGet(ExecutionState& state, Object* homeObject, const ObjectPropertyName& P, const Value& receiver)
{
    Optional<Object*> lookupStart = homeObject->m_prototype;
    if (!lookupStart) {
        return Value();
    }
    return lookupStart->get(state, P).value(state, receiver);
}

bool Object::superSet(ExecutionState& state, Object* homeObject, const ObjectPropertyName& P, const Value& v, const Value& receiver)
{
    bool result = setWithLookupStart(state, homeObject->m_prototype, P, v, receiver);
    if (UNLIKELY(!result) && state.inStrictMode()) {
        ErrorObject::throwBuiltinError(state, ErrorCode::ReadOnlyError, ErrorObject::Messages::SetProperty_ReadOnly, P.string());
    }
    return result;
}

Value Object::call(ExecutionState& state, const Value& callee, const Value& thisValue, const size_t argc, Value* argv)
{
    if (UNLIKELY(!callee.isFunction())) {
        ErrorObject::throwBuiltinError(state, ErrorCode::TypeError, ErrorObject::Messages::NOT_Callable);
    }
    return callee.asFunction()->call(state, thisValue, argc, argv);
}
} // namespace Conch
