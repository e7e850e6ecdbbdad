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

#ifndef __ConchObject__
#define __ConchObject__

#include "runtime/ObjectStructure.h"
#include "runtime/ExecutionState.h"

namespace Conch {

typedef Vector<Value, gc_malloc_allocator<Value>> ValueVector;

class ObjectGetResult {
public:
    ObjectGetResult()
        : m_hasValue(false)
        , m_isWritable(false)
        , m_isEnumerable(false)
        , m_isConfigurable(false)
        , m_isDataProperty(true)
        , m_value()
        , m_jsGetterSetter(nullptr)
    {
    }

    ObjectGetResult(const Value& v, bool isWritable, bool isEnumerable, bool isConfigurable)
        : m_hasValue(true)
        , m_isWritable(isWritable)
        , m_isEnumerable(isEnumerable)
        , m_isConfigurable(isConfigurable)
        , m_isDataProperty(true)
        , m_value(v)
        , m_jsGetterSetter(nullptr)
    {
    }

    ObjectGetResult(JSGetterSetter* getterSetter, bool isEnumerable, bool isConfigurable)
        : m_hasValue(true)
        , m_isWritable(false)
        , m_isEnumerable(isEnumerable)
        , m_isConfigurable(isConfigurable)
        , m_isDataProperty(false)
        , m_value()
        , m_jsGetterSetter(getterSetter)
    {
    }

    // missing property and accessor without getter both produce undefined
    Value value(ExecutionState& state, const Value& receiver) const
    {
        if (LIKELY(m_isDataProperty))
            return m_value;
        return valueSlowCase(state, receiver);
    }

    JSGetterSetter* jsGetterSetter() const
    {
        ASSERT(!isDataProperty());
        return m_jsGetterSetter;
    }

    bool hasValue() const
    {
        return m_hasValue;
    }

    bool isWritable() const
    {
        ASSERT(hasValue());
        return m_isWritable;
    }

    bool isEnumerable() const
    {
        ASSERT(hasValue());
        return m_isEnumerable;
    }

    bool isConfigurable() const
    {
        ASSERT(hasValue());
        return m_isConfigurable;
    }

    bool isDataProperty() const
    {
        ASSERT(hasValue());
        return m_isDataProperty;
    }

    ObjectPropertyDescriptor convertToPropertyDescriptor() const;

private:
    Value valueSlowCase(ExecutionState& state, const Value& receiver) const;

    bool m_hasValue : 1;
    bool m_isWritable : 1;
    bool m_isEnumerable : 1;
    bool m_isConfigurable : 1;
    bool m_isDataProperty : 1;
    Value m_value;
    JSGetterSetter* m_jsGetterSetter;
};

class Object : public PointerValue {
    friend class ConstructorObject;

public:
    // creates an object with no prototype
    explicit Object(ExecutionState& state);
    Object(ExecutionState& state, Optional<Object*> proto);

    virtual bool isObject() const override
    {
        return true;
    }

    // prototype link
    Optional<Object*> getPrototypeObject() const
    {
        return m_prototype;
    }

    // returns null when there is no prototype
    Value getPrototype(ExecutionState& state) const;

    // returns false, leaving the link untouched, when proto's chain reaches this object
    // or the chain would grow past CONCH_PROTOTYPE_CHAIN_LIMIT objects
    bool setPrototype(ExecutionState& state, Optional<Object*> proto);
    void setPrototypeThrowsException(ExecutionState& state, Optional<Object*> proto);

    bool isPrototypeOf(ExecutionState& state, Object* other) const;

    // own properties
    virtual ObjectGetResult getOwnProperty(ExecutionState& state, const ObjectPropertyName& P);
    virtual bool defineOwnProperty(ExecutionState& state, const ObjectPropertyName& P, const ObjectPropertyDescriptor& desc);
    virtual bool deleteOwnProperty(ExecutionState& state, const ObjectPropertyName& P);

    bool hasOwnProperty(ExecutionState& state, const ObjectPropertyName& P)
    {
        return getOwnProperty(state, P).hasValue();
    }

    void defineOwnPropertyThrowsException(ExecutionState& state, const ObjectPropertyName& P, const ObjectPropertyDescriptor& desc);

    // own property keys in insertion order
    ValueVector ownPropertyKeys(ExecutionState& state);

    // callback returns false to stop
    typedef bool (*EnumerationCallback)(ExecutionState& state, Object* self, const ObjectPropertyName& P, const ObjectPropertyDescriptor& desc, void* data);
    void enumeration(ExecutionState& state, EnumerationCallback callback, void* data, bool shouldSkipNonEnumerable = true);

    // prototype chain access
    ObjectGetResult get(ExecutionState& state, const ObjectPropertyName& P);
    bool hasProperty(ExecutionState& state, const ObjectPropertyName& P);
    bool set(ExecutionState& state, const ObjectPropertyName& P, const Value& v, const Value& receiver);
    // returns false for a rejected write outside strict mode
    bool setThrowsExceptionWhenStrictMode(ExecutionState& state, const ObjectPropertyName& P, const Value& v, const Value& receiver);

    // raises TypeError when callee is not callable
    static Value call(ExecutionState& state, const Value& callee, const Value& thisValue, const size_t argc, Value* argv);

    // super property access, lookup starts at homeObject's current prototype
    static Value superGet(ExecutionState& state, Object* homeObject, const ObjectPropertyName& P, const Value& receiver);
    // same failure handling as setThrowsExceptionWhenStrictMode
    static bool superSet(ExecutionState& state, Object* homeObject, const ObjectPropertyName& P, const Value& v, const Value& receiver);

    void* operator new(size_t size)
    {
        return GC_MALLOC(size);
    }
    void* operator new[](size_t size) = delete;

protected:
    enum PrototypeLinkResult {
        PrototypeLinked,
        PrototypeLinkCycle,
        PrototypeChainTooLong,
    };
    PrototypeLinkResult linkPrototype(Optional<Object*> proto);

    static bool setWithLookupStart(ExecutionState& state, Optional<Object*> lookupStart, const ObjectPropertyName& P, const Value& v, const Value& receiver);
    static bool writeOwnDataProperty(ExecutionState& state, Object* receiver, const ObjectPropertyName& P, const Value& v);

    ObjectStructure m_structure;
    Optional<Object*> m_prototype;
    // objects on the chain starting here, as counted when this link was made
    size_t m_prototypeChainLength;
};
} // namespace Conch

#endif
