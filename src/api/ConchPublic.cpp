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
#include "api/ConchPublic.h"
#include "runtime/Context.h"
#include "runtime/VMInstance.h"
#include "runtime/SandBox.h"
#include "runtime/ConstructorObject.h"
#include "api/internal/ValueAdapter.h"

namespace Conch {

static PlatformRef* g_platform;

#ifdef ENABLE_CUSTOM_LOGGING
void customConchInfoLogger(const char* format, ...)
{
    va_list arg;
    va_start(arg, format);
    if (g_platform) {
        g_platform->customInfoLogger(format, arg);
    } else {
        vfprintf(stdout, format, arg);
    }
    va_end(arg);
}

void customConchErrorLogger(const char* format, ...)
{
    va_list arg;
    va_start(arg, format);
    if (g_platform) {
        g_platform->customErrorLogger(format, arg);
    } else {
        vfprintf(stderr, format, arg);
    }
    va_end(arg);
}
#endif

bool PlatformRef::isCustomLoggingEnabled()
{
#ifdef ENABLE_CUSTOM_LOGGING
    return true;
#else
    return false;
#endif
}

static bool g_globalsInited;
void Globals::initialize(PlatformRef* platform)
{
    // this function should be invoked once at the start of the program
    RELEASE_ASSERT(!g_globalsInited);
    Heap::initialize();
    g_platform = platform;
    g_globalsInited = true;
}

void Globals::finalize()
{
    // this function should be invoked once at the end of the program
    RELEASE_ASSERT(!!g_globalsInited);
    Heap::finalize();

    delete g_platform;
    g_platform = nullptr;
    g_globalsInited = false;
}

bool Globals::isInitialized()
{
    return g_globalsInited;
}

const char* Globals::version()
{
    return CONCH_VERSION;
}

void* Memory::gcMalloc(size_t siz)
{
    return GC_MALLOC(siz);
}

void* Memory::gcMallocAtomic(size_t siz)
{
    return GC_MALLOC_ATOMIC(siz);
}

void* Memory::gcMallocUncollectable(size_t siz)
{
    return GC_MALLOC_UNCOLLECTABLE(siz);
}

void Memory::gcFree(void* ptr)
{
    GC_FREE(ptr);
}

void Memory::gc()
{
    Heap::collect();
}

size_t Memory::heapSize()
{
    return Heap::heapSize();
}

void Memory::printHeapUsage()
{
    Heap::printGCHeapUsage();
}

static ValueVector toValueVector(const size_t argc, ValueRef** argv)
{
    ValueVector result;
    result.reserve(argc);
    for (size_t i = 0; i < argc; i++) {
        result.push_back(toImpl(argv[i]));
    }
    return result;
}

static Optional<Object*> toOptionalObject(OptionalRef<ObjectRef> ref)
{
    if (ref) {
        return toImpl(ref.get());
    }
    return nullptr;
}

Evaluator::StackTraceData::StackTraceData()
    : functionName(nullptr)
    , isConstructor(false)
    , isStrict(false)
{
}

Evaluator::EvaluatorResult::EvaluatorResult()
    : result(ValueRef::createUndefined())
{
}

std::string Evaluator::EvaluatorResult::resultOrErrorToString(ContextRef* ctx) const
{
    Value v = isSuccessful() ? toImpl(result) : toImpl(error.value());
    if (!v.isPointerValue() || !v.asPointerValue()->isErrorObject()) {
        return v.toStringForDescription()->toStdString();
    }

    ErrorObject* e = v.asPointerValue()->asErrorObject();
    ExecutionState state(toImpl(ctx));
    std::string s = ErrorObject::errorCodeName(state, e->errorCode())->toStdString();
    ObjectGetResult message = e->getOwnProperty(state, ObjectPropertyName(state.context()->staticStrings().message));
    if (message.hasValue() && message.isDataProperty()) {
        s += ": ";
        s += message.value(state, Value(e)).toStringForDescription()->toStdString();
    }
    return s;
}

static GCManagedVector<Evaluator::StackTraceData> toStackTraceRef(const StackTraceDataOnStackVector& frames)
{
    GCManagedVector<Evaluator::StackTraceData> result(frames.size());
    for (size_t i = 0; i < frames.size(); i++) {
        result[i].functionName = toRef(frames[i].functionName);
        result[i].isConstructor = frames[i].isConstructor;
        result[i].isStrict = frames[i].isStrict;
    }
    return result;
}

struct RunnerData {
    Evaluator::Runner runner;
    void* data;
};

static Value callRunner(ExecutionState& state, void* data)
{
    RunnerData* runnerData = static_cast<RunnerData*>(data);
    ValueRef* result = runnerData->runner(toRef(&state), runnerData->data);
    // a runner that returns nothing produced undefined
    return result ? toImpl(result) : Value();
}

static Evaluator::EvaluatorResult toEvaluatorResultRef(const SandBox::SandBoxResult& result)
{
    Evaluator::EvaluatorResult r;
    r.result = toRef(result.result);
    r.error = toOptionalValue(result.error);
    if (r.error) {
        r.stackTrace = toStackTraceRef(result.stackTrace);
    }
    return r;
}

Evaluator::EvaluatorResult Evaluator::executeFunction(ContextRef* ctx, Runner runner, void* data)
{
    SandBox sb(toImpl(ctx));
    RunnerData runnerData = { runner, data };
    return toEvaluatorResultRef(sb.run(callRunner, &runnerData));
}

Evaluator::EvaluatorResult Evaluator::executeFunction(ExecutionStateRef* parent, Runner runner, void* data)
{
    ExecutionState* parentState = toImpl(parent);
    SandBox sb(parentState->context());
    RunnerData runnerData = { runner, data };
    return toEvaluatorResultRef(sb.run(*parentState, callRunner, &runnerData));
}

OptionalRef<FunctionObjectRef> ExecutionStateRef::resolveCallee()
{
    ExecutionState* state = toImpl(this);
    while (state) {
        if (state->callee()) {
            return toRef(state->callee().value());
        }
        state = state->parent();
    }
    return nullptr;
}

GCManagedVector<Evaluator::StackTraceData> ExecutionStateRef::computeStackTrace()
{
    StackTraceDataOnStackVector frames;
    SandBox::createStackTrace(frames, *toImpl(this));
    return toStackTraceRef(frames);
}
    return result;
}

bool ExecutionStateRef::inStrictMode()
{
    return toImpl(this)->inStrictMode();
}

void ExecutionStateRef::throwException(ValueRef* value)
{
    ExecutionState* imp = toImpl(this);
    imp->throwException(toImpl(value));
}

ContextRef* ExecutionStateRef::context()
{
    return toRef(toImpl(this)->context());
}

OptionalRef<ExecutionStateRef> ExecutionStateRef::parent()
{
    ExecutionState* p = toImpl(this)->parent();
    if (p) {
        return toRef(p);
    }
    return nullptr;
}

PersistentRefHolder<VMInstanceRef> VMInstanceRef::create()
{
    return PersistentRefHolder<VMInstanceRef>(toRef(new VMInstance()));
}

PersistentRefHolder<ContextRef> ContextRef::create(VMInstanceRef* vminstanceref)
{
    VMInstance* vminstance = toImpl(vminstanceref);
    return PersistentRefHolder<ContextRef>(toRef(new Context(vminstance)));
}

VMInstanceRef* ContextRef::vmInstance()
{
    return toRef(toImpl(this)->vmInstance());
}

ValueRef* ValueRef::create(bool value)
{
    return toRef(Value(value));
}

ValueRef* ValueRef::create(int value)
{
    return toRef(Value(static_cast<int32_t>(value)));
}

ValueRef* ValueRef::create(unsigned value)
{
    return toRef(Value(static_cast<uint32_t>(value)));
}

ValueRef* ValueRef::create(double value)
{
    return toRef(Value(value));
}

ValueRef* ValueRef::createNull()
{
    return toRef(Value(Value::Null));
}

ValueRef* ValueRef::createUndefined()
{
    return toRef(Value(Value::Undefined));
}

bool ValueRef::isStoredInHeap()
{
    return toImpl(this).isPointerValue();
}

bool ValueRef::isBoolean()
{
    return toImpl(this).isBoolean();
}

bool ValueRef::isNumber()
{
    return toImpl(this).isNumber();
}

bool ValueRef::isNull()
{
    return toImpl(this).isNull();
}

bool ValueRef::isUndefined()
{
    return toImpl(this).isUndefined();
}

bool ValueRef::isInt32()
{
    return toImpl(this).isInt32();
}

bool ValueRef::isDouble()
{
    Value v = toImpl(this);
    return v.isNumber() && !v.isInt32();
}

bool ValueRef::isTrue()
{
    return toImpl(this).isTrue();
}

bool ValueRef::isFalse()
{
    return toImpl(this).isFalse();
}

bool ValueRef::isCallable()
{
    return toImpl(this).isFunction();
}

bool ValueRef::isConstructible()
{
    return toImpl(this).isConstructor();
}

bool ValueRef::isPointerValue()
{
    Value v = toImpl(this);
    return v.isPointerValue() && !v.asPointerValue()->isDoubleInValue();
}

bool ValueRef::asBoolean()
{
    return toImpl(this).asBoolean();
}

double ValueRef::asNumber()
{
    return toImpl(this).asNumber();
}

int32_t ValueRef::asInt32()
{
    return toImpl(this).asInt32();
}

PointerValueRef* ValueRef::asPointerValue()
{
    return toRef(toImpl(this).asPointerValue());
}

bool ValueRef::isString()
{
    return toImpl(this).isString();
}

StringRef* ValueRef::asString()
{
    return toRef(toImpl(this).asString());
}

bool ValueRef::isObject()
{
    return toImpl(this).isObject();
}

ObjectRef* ValueRef::asObject()
{
    return toRef(toImpl(this).asObject());
}

bool ValueRef::isFunctionObject()
{
    return toImpl(this).isFunction();
}

FunctionObjectRef* ValueRef::asFunctionObject()
{
    return toRef(toImpl(this).asFunction());
}

bool ValueRef::isConstructorObject()
{
    return toImpl(this).isConstructor();
}

ConstructorObjectRef* ValueRef::asConstructorObject()
{
    return toRef(toImpl(this).asConstructor());
}

bool ValueRef::isErrorObject()
{
    Value v = toImpl(this);
    return v.isPointerValue() && v.asPointerValue()->isErrorObject();
}

ErrorObjectRef* ValueRef::asErrorObject()
{
    return toRef(toImpl(this).asPointerValue()->asErrorObject());
}

StringRef* ValueRef::toPropertyKey(ExecutionStateRef* state)
{
    return toRef(toImpl(this).toPropertyKey(*toImpl(state)));
}

bool ValueRef::equalsTo(ExecutionStateRef* state, const ValueRef* other) const
{
    UNUSED_PARAMETER(state);
    return toImpl(this).equalsToByTheSameValueAlgorithm(toImpl(other));
}

ValueRef* ValueRef::call(ExecutionStateRef* state, ValueRef* receiver, const size_t argc, ValueRef** argv)
{
    ValueVector arguments = toValueVector(argc, argv);
    return toRef(Object::call(*toImpl(state), toImpl(this), toImpl(receiver), argc, arguments.data()));
}

ValueRef* ValueRef::construct(ExecutionStateRef* state, const size_t argc, ValueRef** argv)
{
    Value callee = toImpl(this);
    if (UNLIKELY(!callee.isConstructor())) {
        ErrorObject::throwBuiltinError(*toImpl(state), ErrorCode::TypeError, ErrorObject::Messages::Not_Constructor);
    }
    ValueVector arguments = toValueVector(argc, argv);
    return toRef(callee.asConstructor()->construct(*toImpl(state), argc, arguments.data()));
}

ValueVectorRef* ValueVectorRef::create(size_t size)
{
    ValueVector* result = new ValueVector();
    result->reserve(size);
    for (size_t i = 0; i < size; i++) {
        result->push_back(Value());
    }
    return toRef(result);
}

size_t ValueVectorRef::size()
{
    return toImpl(this)->size();
}

void ValueVectorRef::pushBack(ValueRef* val)
{
    toImpl(this)->push_back(toImpl(val));
}

ValueRef* ValueVectorRef::at(const size_t idx)
{
    return toRef((*toImpl(this))[idx]);
}

void ValueVectorRef::set(const size_t idx, ValueRef* newValue)
{
    (*toImpl(this))[idx] = toImpl(newValue);
}

StringRef* StringRef::createFromASCII(const char* s, size_t stringLength)
{
    return toRef(String::fromASCII(s, stringLength));
}

StringRef* StringRef::createFromUTF8(const char* s, size_t byteLength)
{
    return toRef(String::fromUTF8(s, byteLength));
}

size_t StringRef::length()
{
    return toImpl(this)->length();
}

bool StringRef::equals(StringRef* src)
{
    return toImpl(this)->equals(toImpl(src));
}

bool StringRef::equalsWithASCIIString(const char* buf, size_t len)
{
    return toImpl(this)->equals(buf, len);
}

std::string StringRef::toStdUTF8String()
{
    return toImpl(this)->toStdString();
}

static ObjectPropertyDescriptor::PresentAttribute toPresentAttribute(bool isWritable, bool isEnumerable, bool isConfigurable)
{
    int attr = ObjectPropertyDescriptor::NotPresent;
    if (isWritable)
        attr = attr | ObjectPropertyDescriptor::WritablePresent;
    if (isEnumerable)
        attr = attr | ObjectPropertyDescriptor::EnumerablePresent;
    if (isConfigurable)
        attr = attr | ObjectPropertyDescriptor::ConfigurablePresent;
    return (ObjectPropertyDescriptor::PresentAttribute)attr;
}

static JSGetterSetter toJSGetterSetter(OptionalRef<FunctionObjectRef> getter, OptionalRef<FunctionObjectRef> setter)
{
    Optional<FunctionObject*> g;
    Optional<FunctionObject*> s;
    if (getter) {
        g = toImpl(getter.get());
    }
    if (setter) {
        s = toImpl(setter.get());
    }
    return JSGetterSetter(g, s);
}

static OptionalRef<FunctionObjectRef> toOptionalFunction(Optional<FunctionObject*> fn)
{
    if (fn) {
        return toRef(fn.value());
    }
    return nullptr;
}

void* ObjectPropertyDescriptorRef::operator new(size_t size)
{
    return GC_MALLOC(size);
}

void ObjectPropertyDescriptorRef::operator delete(void* ptr)
{
    GC_FREE(ptr);
}

ObjectPropertyDescriptorRef::~ObjectPropertyDescriptorRef()
{
    ASSERT(!!m_privateData);
    ((ObjectPropertyDescriptor*)m_privateData)->~ObjectPropertyDescriptor();
    GC_FREE(m_privateData);
    m_privateData = nullptr;
}

ObjectPropertyDescriptorRef::ObjectPropertyDescriptorRef(void* src)
    : m_privateData(new (GC) ObjectPropertyDescriptor(*((ObjectPropertyDescriptor*)src)))
{
}

ObjectPropertyDescriptorRef::ObjectPropertyDescriptorRef(ValueRef* value, bool isWritable, bool isEnumerable, bool isConfigurable)
    : m_privateData(new (GC) ObjectPropertyDescriptor(toImpl(value), toPresentAttribute(isWritable, isEnumerable, isConfigurable)))
{
}

ObjectPropertyDescriptorRef::ObjectPropertyDescriptorRef(OptionalRef<FunctionObjectRef> getter, OptionalRef<FunctionObjectRef> setter, bool isEnumerable, bool isConfigurable)
    : m_privateData(new (GC) ObjectPropertyDescriptor(toJSGetterSetter(getter, setter), toPresentAttribute(false, isEnumerable, isConfigurable)))
{
}

ObjectPropertyDescriptorRef::ObjectPropertyDescriptorRef(const ObjectPropertyDescriptorRef& src)
    : m_privateData(new (GC) ObjectPropertyDescriptor(*((ObjectPropertyDescriptor*)src.m_privateData)))
{
}

const ObjectPropertyDescriptorRef& ObjectPropertyDescriptorRef::operator=(const ObjectPropertyDescriptorRef& src)
{
    if (&src != this) {
        ((ObjectPropertyDescriptor*)m_privateData)->~ObjectPropertyDescriptor();
        new (m_privateData) ObjectPropertyDescriptor(*((ObjectPropertyDescriptor*)src.m_privateData));
    }
    return *this;
}

bool ObjectPropertyDescriptorRef::isDataDescriptor() const
{
    return ((ObjectPropertyDescriptor*)m_privateData)->isDataDescriptor();
}

bool ObjectPropertyDescriptorRef::isAccessorDescriptor() const
{
    return ((ObjectPropertyDescriptor*)m_privateData)->isAccessorDescriptor();
}

ValueRef* ObjectPropertyDescriptorRef::value() const
{
    return toRef(((ObjectPropertyDescriptor*)m_privateData)->value());
}

OptionalRef<FunctionObjectRef> ObjectPropertyDescriptorRef::getter() const
{
    return toOptionalFunction(((ObjectPropertyDescriptor*)m_privateData)->getterSetter().getter());
}

OptionalRef<FunctionObjectRef> ObjectPropertyDescriptorRef::setter() const
{
    return toOptionalFunction(((ObjectPropertyDescriptor*)m_privateData)->getterSetter().setter());
}

bool ObjectPropertyDescriptorRef::isWritable() const
{
    return ((ObjectPropertyDescriptor*)m_privateData)->isWritable();
}

bool ObjectPropertyDescriptorRef::isEnumerable() const
{
    return ((ObjectPropertyDescriptor*)m_privateData)->isEnumerable();
}

bool ObjectPropertyDescriptorRef::isConfigurable() const
{
    return ((ObjectPropertyDescriptor*)m_privateData)->isConfigurable();
}

ObjectRef* ObjectRef::create(ExecutionStateRef* state)
{
    return toRef(new Object(*toImpl(state)));
}

ObjectRef* ObjectRef::create(ExecutionStateRef* state, OptionalRef<ObjectRef> proto)
{
    return toRef(new Object(*toImpl(state), toOptionalObject(proto)));
}

size_t ObjectRef::maxPrototypeChainLength()
{
    return CONCH_PROTOTYPE_CHAIN_LIMIT;
}

ValueRef* ObjectRef::getPrototype(ExecutionStateRef* state)
{
    return toRef(toImpl(this)->getPrototype(*toImpl(state)));
}

OptionalRef<ObjectRef> ObjectRef::getPrototypeObject(ExecutionStateRef* state)
{
    UNUSED_PARAMETER(state);
    Optional<Object*> proto = toImpl(this)->getPrototypeObject();
    if (proto) {
        return toRef(proto.value());
    }
    return nullptr;
}

void ObjectRef::setPrototype(ExecutionStateRef* state, OptionalRef<ObjectRef> proto)
{
    toImpl(this)->setPrototypeThrowsException(*toImpl(state), toOptionalObject(proto));
}

bool ObjectRef::isPrototypeOf(ExecutionStateRef* state, ObjectRef* other)
{
    return toImpl(this)->isPrototypeOf(*toImpl(state), toImpl(other));
}

ValueRef* ObjectRef::get(ExecutionStateRef* state, ValueRef* propertyName)
{
    auto result = toImpl(this)->get(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
    if (result.hasValue()) {
        return toRef(result.value(*toImpl(state), toImpl(this)));
    }
    return ValueRef::createUndefined();
}

ValueRef* ObjectRef::get(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* receiver)
{
    auto result = toImpl(this)->get(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
    if (result.hasValue()) {
        return toRef(result.value(*toImpl(state), toImpl(receiver)));
    }
    return ValueRef::createUndefined();
}

bool ObjectRef::set(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* value)
{
    return toImpl(this)->setThrowsExceptionWhenStrictMode(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)), toImpl(value), toImpl(this));
}

bool ObjectRef::set(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* value, ValueRef* receiver)
{
    return toImpl(this)->setThrowsExceptionWhenStrictMode(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)), toImpl(value), toImpl(receiver));
}

bool ObjectRef::has(ExecutionStateRef* state, ValueRef* propertyName)
{
    return toImpl(this)->hasProperty(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
}

ValueRef* ObjectRef::getOwnProperty(ExecutionStateRef* state, ValueRef* propertyName)
{
    auto result = toImpl(this)->getOwnProperty(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
    if (result.hasValue()) {
        return toRef(result.value(*toImpl(state), toImpl(this)));
    }
    return ValueRef::createUndefined();
}

OptionalRef<ObjectPropertyDescriptorRef> ObjectRef::getOwnPropertyDescriptor(ExecutionStateRef* state, ValueRef* propertyName)
{
    auto result = toImpl(this)->getOwnProperty(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
    if (!result.hasValue()) {
        return nullptr;
    }
    ObjectPropertyDescriptor desc = result.convertToPropertyDescriptor();
    return new ObjectPropertyDescriptorRef(&desc);
}

bool ObjectRef::hasOwnProperty(ExecutionStateRef* state, ValueRef* propertyName)
{
    return toImpl(this)->hasOwnProperty(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
}

void ObjectRef::defineOwnProperty(ExecutionStateRef* state, ValueRef* propertyName, const ObjectPropertyDescriptorRef& desc)
{
    toImpl(this)->defineOwnPropertyThrowsException(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)), *((ObjectPropertyDescriptor*)desc.m_privateData));
}

void ObjectRef::defineDataProperty(ExecutionStateRef* state, ValueRef* propertyName, ValueRef* value, bool isWritable, bool isEnumerable, bool isConfigurable)
{
    toImpl(this)->defineOwnPropertyThrowsException(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)),
                                                   ObjectPropertyDescriptor(toImpl(value), toPresentAttribute(isWritable, isEnumerable, isConfigurable)));
}

void ObjectRef::defineAccessorProperty(ExecutionStateRef* state, ValueRef* propertyName, OptionalRef<FunctionObjectRef> getter, OptionalRef<FunctionObjectRef> setter, bool isEnumerable, bool isConfigurable)
{
    toImpl(this)->defineOwnPropertyThrowsException(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)),
                                                   ObjectPropertyDescriptor(toJSGetterSetter(getter, setter), toPresentAttribute(false, isEnumerable, isConfigurable)));
}

bool ObjectRef::deleteOwnProperty(ExecutionStateRef* state, ValueRef* propertyName)
{
    return toImpl(this)->deleteOwnProperty(*toImpl(state), ObjectPropertyName(*toImpl(state), toImpl(propertyName)));
}

ValueVectorRef* ObjectRef::ownPropertyKeys(ExecutionStateRef* state)
{
    ValueVector* result = new ValueVector(toImpl(this)->ownPropertyKeys(*toImpl(state)));
    return toRef(result);
}

void ObjectRef::enumerateObjectOwnProperties(ExecutionStateRef* state, const std::function<bool(ExecutionStateRef* state, ValueRef* propertyName, bool isWritable, bool isEnumerable, bool isConfigurable)>& cb, bool shouldSkipNonEnumerable)
{
    toImpl(this)->enumeration(*toImpl(state), [](ExecutionState& state, Object* self, const ObjectPropertyName& name, const ObjectPropertyDescriptor& desc, void* data) -> bool {
        const std::function<bool(ExecutionStateRef * state, ValueRef * propertyName, bool isWritable, bool isEnumerable, bool isConfigurable)>* cb
            = (const std::function<bool(ExecutionStateRef * state, ValueRef * propertyName, bool isWritable, bool isEnumerable, bool isConfigurable)>*)data;
        return (*cb)(toRef(&state), toRef(name.toValue()), desc.isWritable(), desc.isEnumerable(), desc.isConfigurable());
    },
                              (void*)&cb, shouldSkipNonEnumerable);
}

ValueRef* ObjectRef::superGet(ExecutionStateRef* state, ObjectRef* homeObject, ValueRef* propertyName, ValueRef* receiver)
{
    return toRef(Object::superGet(*toImpl(state), toImpl(homeObject), ObjectPropertyName(*toImpl(state), toImpl(propertyName)), toImpl(receiver)));
}

bool ObjectRef::superSet(ExecutionStateRef* state, ObjectRef* homeObject, ValueRef* propertyName, ValueRef* value, ValueRef* receiver)
{
    return Object::superSet(*toImpl(state), toImpl(homeObject), ObjectPropertyName(*toImpl(state), toImpl(propertyName)), toImpl(value), toImpl(receiver));
}

class CallPublicFunctionData : public gc {
public:
    explicit CallPublicFunctionData(FunctionObjectRef::NativeFunctionPointer publicFn)
        : m_publicFn(publicFn)
    {
    }

    FunctionObjectRef::NativeFunctionPointer m_publicFn;
};

static Value publicFunctionBridge(ExecutionState& state, Value thisValue, size_t calledArgc, Value* calledArgv, Optional<Object*> newTarget)
{
    NativeFunctionObject* func = state.callee().value();
    CallPublicFunctionData* code = reinterpret_cast<CallPublicFunctionData*>(func->internalSlot());

    Vector<ValueRef*, gc_malloc_allocator<ValueRef*>> newArgv;
    newArgv.reserve(calledArgc);
    for (size_t i = 0; i < calledArgc; i++) {
        newArgv.push_back(toRef(calledArgv[i]));
    }

    OptionalRef<ObjectRef> publicNewTarget;
    if (newTarget) {
        publicNewTarget = toRef(newTarget.value());
    }

    ValueRef* result = code->m_publicFn(toRef(&state), toRef(thisValue), calledArgc, newArgv.data(), publicNewTarget);
    return result ? toImpl(result) : Value();
}

static ::Conch::NativeFunctionInfo toNativeFunctionInfo(const FunctionObjectRef::NativeFunctionInfo& info, bool isConstructor)
{
    int flags = 0;
    flags |= info.m_isStrict ? ::Conch::NativeFunctionInfo::Strict : 0;
    flags |= isConstructor ? ::Conch::NativeFunctionInfo::Constructor : 0;
    return ::Conch::NativeFunctionInfo(info.m_name ? toImpl(info.m_name) : nullptr, publicFunctionBridge, info.m_argumentCount, flags);
}

FunctionObjectRef* FunctionObjectRef::create(ExecutionStateRef* state, FunctionObjectRef::NativeFunctionInfo info)
{
    NativeFunctionObject* func = new NativeFunctionObject(*toImpl(state), toNativeFunctionInfo(info, false));
    func->setInternalSlot(new CallPublicFunctionData(info.m_nativeFunction));
    return toRef(func);
}

static NativeFunctionObject* toNativeFunction(FunctionObjectRef* ref)
{
    // every function record reachable through the public api is native
    return static_cast<NativeFunctionObject*>(toImpl(ref));
}

ValueRef* FunctionObjectRef::call(ExecutionStateRef* state, ValueRef* thisValue, const size_t argc, ValueRef** argv)
{
    ValueVector arguments = toValueVector(argc, argv);
    return toRef(toImpl(this)->call(*toImpl(state), toImpl(thisValue), argc, arguments.data()));
}

StringRef* FunctionObjectRef::name()
{
    return toRef(toNativeFunction(this)->nativeFunctionInfo().m_name);
}

size_t FunctionObjectRef::argumentCount()
{
    return toNativeFunction(this)->nativeFunctionInfo().m_argumentCount;
}

bool FunctionObjectRef::isStrict()
{
    return toNativeFunction(this)->nativeFunctionInfo().m_isStrict;
}

bool FunctionObjectRef::isConstructor()
{
    return toImpl(this)->isConstructor();
}

ConstructorObjectRef* ConstructorObjectRef::create(ExecutionStateRef* state, FunctionObjectRef::NativeFunctionInfo info)
{
    ConstructorObject* func = new ConstructorObject(*toImpl(state), toNativeFunctionInfo(info, true));
    func->setInternalSlot(new CallPublicFunctionData(info.m_nativeFunction));
    return toRef(func);
}

ObjectRef* ConstructorObjectRef::construct(ExecutionStateRef* state, const size_t argc, ValueRef** argv)
{
    ValueVector arguments = toValueVector(argc, argv);
    return toRef(toImpl(this)->construct(*toImpl(state), argc, arguments.data()));
}

ValueRef* ConstructorObjectRef::initialize(ExecutionStateRef* state, ObjectRef* self, const size_t argc, ValueRef** argv)
{
    ValueVector arguments = toValueVector(argc, argv);
    return toRef(toImpl(this)->initialize(*toImpl(state), toImpl(self), argc, arguments.data()));
}

ValueRef* ConstructorObjectRef::initializeSuper(ExecutionStateRef* state, ObjectRef* self, const size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    ValueVector arguments = toValueVector(argc, argv);
    return toRef(toImpl(this)->initializeSuper(*toImpl(state), toImpl(self), argc, arguments.data(), toOptionalObject(newTarget)));
}

ObjectRef* ConstructorObjectRef::constructionPrototype()
{
    return toRef(toImpl(this)->constructionPrototype());
}

void ConstructorObjectRef::setConstructionPrototype(ExecutionStateRef* state, ObjectRef* proto)
{
    toImpl(this)->setConstructionPrototype(*toImpl(state), toImpl(proto));
}

OptionalRef<ConstructorObjectRef> ConstructorObjectRef::staticLink()
{
    Optional<ConstructorObject*> link = toImpl(this)->staticLink();
    if (link) {
        return toRef(link.value());
    }
    return nullptr;
}

static Optional<ConstructorObject*> toOptionalConstructor(OptionalRef<ConstructorObjectRef> ref)
{
    if (ref) {
        return toImpl(ref.get());
    }
    return nullptr;
}

void ConstructorObjectRef::linkStatic(ExecutionStateRef* state, OptionalRef<ConstructorObjectRef> parent)
{
    toImpl(this)->linkStatic(*toImpl(state), toOptionalConstructor(parent));
}

void ConstructorObjectRef::linkInstancePrototype(ExecutionStateRef* state, OptionalRef<ConstructorObjectRef> parent)
{
    toImpl(this)->linkInstancePrototype(*toImpl(state), toOptionalConstructor(parent));
}

bool ConstructorObjectRef::hasInstance(ExecutionStateRef* state, ValueRef* value)
{
    return toImpl(this)->hasInstance(*toImpl(state), toImpl(value));
}

COMPILE_ASSERT((int)ErrorObjectRef::Code::None == (int)ErrorCode::None, "");
COMPILE_ASSERT((int)ErrorObjectRef::Code::TypeError == (int)ErrorCode::TypeError, "");
COMPILE_ASSERT((int)ErrorObjectRef::Code::RangeError == (int)ErrorCode::RangeError, "");
COMPILE_ASSERT((int)ErrorObjectRef::Code::CycleError == (int)ErrorCode::CycleError, "");
COMPILE_ASSERT((int)ErrorObjectRef::Code::NotConfigurableError == (int)ErrorCode::NotConfigurableError, "");
COMPILE_ASSERT((int)ErrorObjectRef::Code::ReadOnlyError == (int)ErrorCode::ReadOnlyError, "");

ErrorObjectRef* ErrorObjectRef::create(ExecutionStateRef* state, ErrorObjectRef::Code code, StringRef* errorMessage)
{
    ASSERT(code != ErrorObjectRef::Code::None);
    return toRef(ErrorObject::createError(*toImpl(state), (ErrorCode)code, toImpl(errorMessage)));
}

ObjectRef* ErrorObjectRef::errorPrototype(ContextRef* context, ErrorObjectRef::Code code)
{
    return toRef(toImpl(context)->errorPrototype((ErrorCode)code));
}

ErrorObjectRef::Code ErrorObjectRef::errorCode()
{
    return (ErrorObjectRef::Code)toImpl(this)->errorCode();
}

} // namespace Conch
