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

#ifndef __CONCH_PUBLIC__
#define __CONCH_PUBLIC__

#if !defined(CONCH_EXPORT)
#define CONCH_EXPORT __attribute__((visibility("default")))
#endif

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <new>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#define CONCH_POINTERVALUE_CHILD_REF_LIST(F) \
    F(ConstructorObject)                     \
    F(ErrorObject)                           \
    F(FunctionObject)                        \
    F(Object)                                \
    F(String)

#define CONCH_REF_LIST(F) \
    F(Context)            \
    F(ExecutionState)     \
    F(PointerValue)       \
    F(VMInstance)         \
    CONCH_POINTERVALUE_CHILD_REF_LIST(F)

namespace Conch {

class ValueRef;
class ValueVectorRef;
class PlatformRef;
#define DECLARE_REF_CLASS(Name) class Name##Ref;
CONCH_REF_LIST(DECLARE_REF_CLASS);
#undef DECLARE_REF_CLASS

class CONCH_EXPORT Globals {
public:
    // once per process, finalize takes ownership of platform and deletes it
    static void initialize(PlatformRef* platform);
    static void finalize();

    static bool isInitialized();

    static const char* version();
};

class CONCH_EXPORT Memory {
public:
    // scanned for pointers, reclaimed once unreachable
    static void* gcMalloc(size_t size);
    // never scanned, for raw bytes only
    static void* gcMallocAtomic(size_t size);
    // scanned and never reclaimed until gcFree, usable as a root
    static void* gcMallocUncollectable(size_t size);
    static void gcFree(void* ptr);

    static void gc();

    static size_t heapSize(); // Return the number of bytes in the heap. Excludes bdwgc private data structures
    static void printHeapUsage(); // logs heap usage through CONCH_LOG_INFO
};

// The collector scans the native stack and the slots owned by PersistentRefHolder.
// A Ref stored anywhere else is invisible to it and can be reclaimed.
template <typename T>
class CONCH_EXPORT PersistentRefHolder {
public:
    PersistentRefHolder()
        : m_slot(nullptr)
    {
    }

    PersistentRefHolder(T* ptr)
        : m_slot(nullptr)
    {
        reset(ptr);
    }

    PersistentRefHolder(PersistentRefHolder<T>&& src)
        : m_slot(src.m_slot)
    {
        src.m_slot = nullptr;
    }

    ~PersistentRefHolder()
    {
        dropSlot();
    }

    PersistentRefHolder(const PersistentRefHolder<T>&) = delete;
    const PersistentRefHolder<T>& operator=(const PersistentRefHolder<T>&) = delete;

    const PersistentRefHolder<T>& operator=(PersistentRefHolder<T>&& src)
    {
        if (&src != this) {
            dropSlot();
            std::swap(m_slot, src.m_slot);
        }
        return *this;
    }

    // a null ptr gives the slot back to the collector
    void reset(T* ptr)
    {
        if (!ptr) {
            dropSlot();
        } else {
            if (!m_slot) {
                m_slot = static_cast<T**>(Memory::gcMallocUncollectable(sizeof(T*)));
            }
            *m_slot = ptr;
        }
    }

    T* release()
    {
        T* ptr = get();
        dropSlot();
        return ptr;
    }

    T* get() const
    {
        return m_slot ? *m_slot : nullptr;
    }

    operator T*() const
    {
        return get();
    }

    T* operator->() const
    {
        return get();
    }

private:
    void dropSlot()
    {
        if (m_slot) {
            Memory::gcFree(m_slot);
            m_slot = nullptr;
        }
    }

    T** m_slot;
};

// fixed size array whose storage is scanned by the collector
template <typename T>
class CONCH_EXPORT GCManagedVector {
public:
    GCManagedVector()
        : m_buffer(nullptr)
        , m_size(0)
    {
    }

    explicit GCManagedVector(size_t size)
        : m_buffer(allocate(size))
        , m_size(size)
    {
        for (size_t i = 0; i < m_size; i++) {
            new (&m_buffer[i]) T();
        }
    }

    GCManagedVector(const GCManagedVector<T>& other)
        : m_buffer(allocate(other.m_size))
        , m_size(other.m_size)
    {
        for (size_t i = 0; i < m_size; i++) {
            new (&m_buffer[i]) T(other.m_buffer[i]);
        }
    }

    GCManagedVector(GCManagedVector<T>&& other)
        : m_buffer(other.m_buffer)
        , m_size(other.m_size)
    {
        other.m_buffer = nullptr;
        other.m_size = 0;
    }

    ~GCManagedVector()
    {
        clear();
    }

    const GCManagedVector<T>& operator=(const GCManagedVector<T>& other)
    {
        if (&other != this) {
            GCManagedVector<T> copied(other);
            *this = std::move(copied);
        }
        return *this;
    }

    const GCManagedVector<T>& operator=(GCManagedVector<T>&& other)
    {
        if (&other != this) {
            clear();
            std::swap(m_buffer, other.m_buffer);
            std::swap(m_size, other.m_size);
        }
        return *this;
    }

    size_t size() const
    {
        return m_size;
    }

    T& operator[](const size_t idx)
    {
        return m_buffer[idx];
    }

    const T& operator[](const size_t idx) const
    {
        return m_buffer[idx];
    }

    void clear()
    {
        for (size_t i = 0; i < m_size; i++) {
            m_buffer[i].~T();
        }
        if (m_buffer) {
            Memory::gcFree(m_buffer);
        }
        m_buffer = nullptr;
        m_size = 0;
    }

private:
    static T* allocate(size_t size)
    {
        return size ? static_cast<T*>(Memory::gcMalloc(sizeof(T) * size)) : nullptr;
    }

    T* m_buffer;
    size_t m_size;
};

// nullable Ref pointer, used where a missing object is a normal answer
template <typename T>
class CONCH_EXPORT OptionalRef {
public:
    OptionalRef(T* value = nullptr)
        : m_value(value)
    {
    }

    OptionalRef(std::nullptr_t)
        : m_value(nullptr)
    {
    }

    bool hasValue() const
    {
        return m_value != nullptr;
    }

    operator bool() const
    {
        return hasValue();
    }

    T* value() const
    {
        return m_value;
    }

    T* get() const
    {
        return m_value;
    }

    T* operator->() const
    {
        return m_value;
    }

    bool operator==(const OptionalRef<T>& other) const
    {
        return m_value == other.m_value;
    }

    bool operator!=(const OptionalRef<T>& other) const
    {
        return m_value != other.m_value;
    }

private:
    T* m_value;
};

namespace EvaluatorUtil {
template <size_t... Indexes>
struct IndexList {
};

template <size_t N, size_t... Indexes>
struct MakeIndexList : MakeIndexList<N - 1, N - 1, Indexes...> {
};

template <size_t... Indexes>
struct MakeIndexList<0, Indexes...> {
    typedef IndexList<Indexes...> Type;
};

template <typename Closure, typename Tuple, size_t... Indexes>
inline ValueRef* invokeWithTuple(Closure fn, ExecutionStateRef* state, Tuple& args, IndexList<Indexes...>)
{
    return fn(state, std::get<Indexes>(args)...);
}
} // namespace EvaluatorUtil

class CONCH_EXPORT Evaluator {
public:
    struct CONCH_EXPORT StackTraceData {
        StringRef* functionName;
        bool isConstructor;
        bool isStrict;
        StackTraceData();
    };

    struct CONCH_EXPORT EvaluatorResult {
        EvaluatorResult();

        bool isSuccessful() const
        {
            return !error.hasValue();
        }

        // "Name: message" for a thrown ErrorObject, description of any other value
        std::string resultOrErrorToString(ContextRef* ctx) const;

        ValueRef* result;
        OptionalRef<ValueRef> error;
        GCManagedVector<StackTraceData> stackTrace; // innermost native call first
    };

    // runs closure(state, args...) inside a new sandbox, anything thrown ends up in EvaluatorResult::error
    template <typename... Args, typename F>
    static EvaluatorResult execute(ContextRef* ctx, F&& closure, Args... args)
    {
        typedef ValueRef* (*Closure)(ExecutionStateRef * state, Args...);
        return executeBound(ctx, Closure(closure), args...);
    }

    // same as above, the new state is a child of parent
    template <typename... Args, typename F>
    static EvaluatorResult execute(ExecutionStateRef* parent, F&& closure, Args... args)
    {
        typedef ValueRef* (*Closure)(ExecutionStateRef * state, Args...);
        return executeBound(parent, Closure(closure), args...);
    }

    typedef ValueRef* (*Runner)(ExecutionStateRef* state, void* data);
    static EvaluatorResult executeFunction(ContextRef* ctx, Runner runner, void* data);
    static EvaluatorResult executeFunction(ExecutionStateRef* parent, Runner runner, void* data);

private:
    template <typename Where, typename... Args>
    static EvaluatorResult executeBound(Where* where, ValueRef* (*fn)(ExecutionStateRef* state, Args...), Args... args)
    {
        typedef ValueRef* (*Closure)(ExecutionStateRef * state, Args...);
        struct Bound {
            Closure fn;
            std::tuple<Args...> args;
        } bound = { fn, std::tuple<Args...>(args...) };

        return executeFunction(where, [](ExecutionStateRef* state, void* data) -> ValueRef* {
            Bound* bound = static_cast<Bound*>(data);
            return EvaluatorUtil::invokeWithTuple(bound->fn, state, bound->args, typename EvaluatorUtil::MakeIndexList<sizeof...(Args)>::Type());
        },
                               &bound);
    }
};

// valid only while the native call or Evaluator::execute that handed it out is running
class CONCH_EXPORT ExecutionStateRef {
public:
    OptionalRef<FunctionObjectRef> resolveCallee(); // resolve nearest callee if exists
    GCManagedVector<Evaluator::StackTraceData> computeStackTrace();

    // strict states turn a rejected ObjectRef::set into ReadOnlyError
    bool inStrictMode();

    void throwException(ValueRef* value);

    ContextRef* context();

    OptionalRef<ExecutionStateRef> parent();
};

class CONCH_EXPORT VMInstanceRef {
public:
    static PersistentRefHolder<VMInstanceRef> create();
};

class CONCH_EXPORT ContextRef {
public:
    static PersistentRefHolder<ContextRef> create(VMInstanceRef* vmInstance);

    VMInstanceRef* vmInstance();
};

// a ValueRef* is the encoded value itself, only doubles and PointerValueRef live in the heap
// keep heap values reachable from the stack or a PersistentRefHolder while you need them
class CONCH_EXPORT ValueRef {
public:
    static ValueRef* create(bool);
    static ValueRef* create(int);
    static ValueRef* create(unsigned);
    static ValueRef* create(double);
    static ValueRef* create(ValueRef* src)
    {
        return src;
    }
    static ValueRef* createNull();
    static ValueRef* createUndefined();

    bool isStoredInHeap();
    bool isBoolean();
    bool isNumber();
    bool isNull();
    bool isUndefined();
    bool isInt32();
    bool isDouble();
    bool isTrue();
    bool isFalse();
    bool isCallable(); // can ValueRef::call
    bool isConstructible(); // can ValueRef::construct
    bool isUndefinedOrNull()
    {
        return isUndefined() || isNull();
    }
    bool isPointerValue();

    bool asBoolean();
    double asNumber();
    int32_t asInt32();
    PointerValueRef* asPointerValue();

#define DEFINE_VALUEREF_IS_AS(Name) \
    bool is##Name();                \
    Name##Ref* as##Name();

    CONCH_POINTERVALUE_CHILD_REF_LIST(DEFINE_VALUEREF_IS_AS);
#undef DEFINE_VALUEREF_IS_AS

    // text used when the value becomes a property key, raises TypeError for objects
    StringRef* toPropertyKey(ExecutionStateRef* state);

    // SameValue: NaN equals NaN, +0 and -0 differ, strings by content, others by identity
    bool equalsTo(ExecutionStateRef* state, const ValueRef* other) const;

    ValueRef* call(ExecutionStateRef* state, ValueRef* receiver, const size_t argc, ValueRef** argv);
    ValueRef* construct(ExecutionStateRef* state, const size_t argc, ValueRef** argv);
};

class CONCH_EXPORT ValueVectorRef {
public:
    static ValueVectorRef* create(size_t size = 0);

    size_t size();
    void pushBack(ValueRef* val);
    ValueRef* at(const size_t idx);
    void set(const size_t idx, ValueRef* newValue);
};

class CONCH_EXPORT PointerValueRef : public ValueRef {
public:
};

class CONCH_EXPORT StringRef : public PointerValueRef {
public:
    template <size_t N>
    static StringRef* createFromASCII(const char (&str)[N])
    {
        return createFromASCII(str, N - 1);
    }
    static StringRef* createFromASCII(const char* s, size_t stringLength);
    template <size_t N>
    static StringRef* createFromUTF8(const char (&str)[N])
    {
        return createFromUTF8(str, N - 1);
    }
    static StringRef* createFromUTF8(const char* s, size_t byteLength);

    size_t length();
    bool equals(StringRef* src);
    bool equalsWithASCIIString(const char* buf, size_t len);

    std::string toStdUTF8String();
};

class CONCH_EXPORT ObjectPropertyDescriptorRef {
public:
    // data descriptor
    ObjectPropertyDescriptorRef(ValueRef* value, bool isWritable = true, bool isEnumerable = true, bool isConfigurable = true);
    // accessor descriptor, empty getter or setter means the accessor has none
    ObjectPropertyDescriptorRef(OptionalRef<FunctionObjectRef> getter, OptionalRef<FunctionObjectRef> setter, bool isEnumerable = true, bool isConfigurable = true);

    ObjectPropertyDescriptorRef(const ObjectPropertyDescriptorRef& src);
    const ObjectPropertyDescriptorRef& operator=(const ObjectPropertyDescriptorRef& src);
    ~ObjectPropertyDescriptorRef();

    bool isDataDescriptor() const;
    bool isAccessorDescriptor() const;

    ValueRef* value() const;
    OptionalRef<FunctionObjectRef> getter() const;
    OptionalRef<FunctionObjectRef> setter() const;

    bool isWritable() const;
    bool isEnumerable() const;
    bool isConfigurable() const;

    void* operator new(size_t size);
    void* operator new[](size_t size) = delete;
    void operator delete(void* ptr);
    void operator delete[](void* obj) = delete;

private:
    friend class ObjectRef;
    explicit ObjectPropertyDescriptorRef(void* src);

    void* m_privateData;
};

class CONCH_EXPORT ObjectRef : public PointerValueRef {
public:
    static ObjectRef* create(ExecutionStateRef* state);
    static ObjectRef* create(ExecutionStateRef* state, OptionalRef<ObjectRef> proto);
    static size_t maxPrototypeChainLength();

    // prototype link
    ValueRef* getPrototype(ExecutionStateRef* state); // null when there is no prototype
    OptionalRef<ObjectRef> getPrototypeObject(ExecutionStateRef* state);
    // raises CycleError and keeps the old link when proto's chain reaches this object,
    // RangeError when the chain would hold more than maxPrototypeChainLength() objects
    void setPrototype(ExecutionStateRef* state, OptionalRef<ObjectRef> proto);
    bool isPrototypeOf(ExecutionStateRef* state, ObjectRef* other);

    // resolution through the prototype chain, accessors run with this object as receiver
    // unless another receiver is given
    ValueRef* get(ExecutionStateRef* state, ValueRef* propertyName);
    ValueRef* get(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* receiver);
    // returns false when the write is rejected, raises ReadOnlyError instead in strict states
    bool set(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* value);
    bool set(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* value, ValueRef* receiver);
    bool has(ExecutionStateRef* state, ValueRef* propertyName);

    // own properties
    ValueRef* getOwnProperty(ExecutionStateRef* state, ValueRef* propertyName);
    OptionalRef<ObjectPropertyDescriptorRef> getOwnPropertyDescriptor(ExecutionStateRef* state, ValueRef* propertyName);
    bool hasOwnProperty(ExecutionStateRef* state, ValueRef* propertyName);
    // defining raises NotConfigurableError when an existing non-configurable property would change
    void defineOwnProperty(ExecutionStateRef* state, ValueRef* propertyName, const ObjectPropertyDescriptorRef& desc);
    void defineDataProperty(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* value, bool isWritable, bool isEnumerable, bool isConfigurable);
    void defineAccessorProperty(ExecutionStateRef* state, ValueRef* propertyName, OptionalRef<FunctionObjectRef> getter, OptionalRef<FunctionObjectRef> setter, bool isEnumerable, bool isConfigurable);
    // false only for non-configurable own properties
    bool deleteOwnProperty(ExecutionStateRef* state, ValueRef* propertyName);

    ValueVectorRef* ownPropertyKeys(ExecutionStateRef* state);
    void enumerateObjectOwnProperties(ExecutionStateRef* state, const std::function<bool(ExecutionStateRef* state, ValueRef* propertyName, bool isWritable, bool isEnumerable, bool isConfigurable)>& cb, bool shouldSkipNonEnumerable = true);

    // super property access, lookup starts at the current prototype of homeObject
    // a rejected superSet raises ReadOnlyError in strict states like set does
    static ValueRef* superGet(ExecutionStateRef* state, ObjectRef* homeObject, ValueRef* propertyName, ValueRef* receiver);
    static bool superSet(ExecutionStateRef* state, ObjectRef* homeObject, ValueRef* propertyName, ValueRef* value, ValueRef* receiver);
};

class CONCH_EXPORT FunctionObjectRef : public ObjectRef {
public:
    // if newTarget is present, that means constructor call
    typedef ValueRef* (*NativeFunctionPointer)(ExecutionStateRef* state, ValueRef* thisValue,
                                               size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget);

    struct CONCH_EXPORT NativeFunctionInfo {
        bool m_isStrict;
        StringRef* m_name;
        NativeFunctionPointer m_nativeFunction;
        size_t m_argumentCount;

        NativeFunctionInfo(StringRef* name, NativeFunctionPointer fn, size_t argc, bool isStrict = true)
            : m_isStrict(isStrict)
            , m_name(name)
            , m_nativeFunction(fn)
            , m_argumentCount(argc)
        {
        }
    };

    static FunctionObjectRef* create(ExecutionStateRef* state, NativeFunctionInfo info);

    ValueRef* call(ExecutionStateRef* state, ValueRef* thisValue, const size_t argc, ValueRef** argv);

    StringRef* name();
    size_t argumentCount();
    bool isStrict();
    bool isConstructor();
};

class CONCH_EXPORT ConstructorObjectRef : public FunctionObjectRef {
public:
    // the initializer receives the new instance as thisValue
    static ConstructorObjectRef* create(ExecutionStateRef* state, NativeFunctionInfo info);

    ObjectRef* construct(ExecutionStateRef* state, const size_t argc, ValueRef** argv);
    ValueRef* initialize(ExecutionStateRef* state, ObjectRef* self, const size_t argc, ValueRef** argv);
    // runs the initializer of the current static link, raises TypeError when there is none
    ValueRef* initializeSuper(ExecutionStateRef* state, ObjectRef* self, const size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget = nullptr);

    ObjectRef* constructionPrototype();
    void setConstructionPrototype(ExecutionStateRef* state, ObjectRef* proto);

    OptionalRef<ConstructorObjectRef> staticLink();
    // both raise CycleError when the new link would close a cycle
    void linkStatic(ExecutionStateRef* state, OptionalRef<ConstructorObjectRef> parent);
    void linkInstancePrototype(ExecutionStateRef* state, OptionalRef<ConstructorObjectRef> parent);

    bool hasInstance(ExecutionStateRef* state, ValueRef* value);
};

class CONCH_EXPORT ErrorObjectRef : public ObjectRef {
public:
    enum Code {
        None,
        TypeError,
        RangeError,
        CycleError,
        NotConfigurableError,
        ReadOnlyError,
    };
    static ErrorObjectRef* create(ExecutionStateRef* state, ErrorObjectRef::Code code, StringRef* errorMessage);
    // prototype shared by every error raised with code in context, carries the name property
    static ObjectRef* errorPrototype(ContextRef* context, ErrorObjectRef::Code code);

    Code errorCode();
};

class CONCH_EXPORT PlatformRef {
public:
    virtual ~PlatformRef() {}

    // you can use these functions only if you enabled custom logging
    static bool isCustomLoggingEnabled();
    // default custom logger
    virtual void customInfoLogger(const char* format, va_list arg)
    {
        vfprintf(stdout, format, arg);
    }

    virtual void customErrorLogger(const char* format, va_list arg)
    {
        vfprintf(stderr, format, arg);
    }
};

} // namespace Conch

#endif
