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

#include "api/ConchPublic.h"

using namespace Conch;

#include "gtest/gtest.h"

#include <cmath>
#include <cstring>
#include <string>

class TestPlatform : public PlatformRef {
};

PersistentRefHolder<VMInstanceRef> g_instance;
PersistentRefHolder<ContextRef> g_context;

template <size_t N>
static StringRef* key(const char (&str)[N])
{
    return StringRef::createFromASCII(str, N - 1);
}

static FunctionObjectRef* createFunction(ExecutionStateRef* state, const char* name, FunctionObjectRef::NativeFunctionPointer fn, size_t argc, bool isStrict = false)
{
    FunctionObjectRef::NativeFunctionInfo info(StringRef::createFromASCII(name, strlen(name)), fn, argc, isStrict);
    return FunctionObjectRef::create(state, info);
}

static ConstructorObjectRef* createConstructor(ExecutionStateRef* state, const char* name, FunctionObjectRef::NativeFunctionPointer fn, size_t argc)
{
    FunctionObjectRef::NativeFunctionInfo info(StringRef::createFromASCII(name, strlen(name)), fn, argc, false);
    return ConstructorObjectRef::create(state, info);
}

static ErrorObjectRef::Code errorCodeOf(Evaluator::EvaluatorResult& result)
{
    if (result.isSuccessful() || !result.error->isErrorObject()) {
        return ErrorObjectRef::Code::None;
    }
    return result.error->asErrorObject()->errorCode();
}

static bool isString(ValueRef* v, const char* expected)
{
    return v->isString() && v->asString()->toStdUTF8String() == expected;
}

static ValueRef* getterReturnsOne(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    return ValueRef::create(1);
}

// stores the written value into "_x" of the receiver
static ValueRef* setterStoresIntoReceiver(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    thisValue->asObject()->defineDataProperty(state, key("_x"), argv[0], true, true, true);
    return ValueRef::createUndefined();
}

static ValueRef* getterReadsReceiverName(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    return thisValue->asObject()->get(state, key("name"));
}

// this.set(argv[0], argv[1]) from inside a function
static ValueRef* writer(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    return ValueRef::create(thisValue->asObject()->set(state, argv[0], argv[1]));
}

// super.set(argv[1], argv[2]) with argv[0] as home object and this as receiver
static ValueRef* superWriter(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    return ValueRef::create(ObjectRef::superSet(state, argv[0]->asObject(), argv[1], argv[2], thisValue));
}

static ValueRef* getterReadsItself(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    return thisValue->asObject()->get(state, key("self"));
}

// reads the static table of whatever constructor the receiver resolves to
static ValueRef* getterReadsStaticTable(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    ValueRef* constructor = thisValue->asObject()->get(state, key("constructor"));
    return constructor->asObject()->get(state, key("table"));
}

static ValueRef* stackDepthOfCall(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    GCManagedVector<Evaluator::StackTraceData> trace = state->computeStackTrace();
    EXPECT_TRUE(trace[0].functionName->equalsWithASCIIString("inner", 5));
    EXPECT_TRUE(trace[0].isStrict);
    return ValueRef::create(static_cast<int>(trace.size()));
}

static ValueRef* pointInitializer(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    ObjectRef* self = thisValue->asObject();
    self->defineDataProperty(state, key("x"), argv[0], true, true, true);
    self->defineDataProperty(state, key("y"), argv[1], true, true, true);
    self->defineDataProperty(state, key("withNewTarget"), ValueRef::create(newTarget.hasValue()), true, true, true);
    return ValueRef::createUndefined();
}

static ValueRef* baseInitializer(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    thisValue->asObject()->defineDataProperty(state, key("initializedBy"), state->resolveCallee()->name(), true, true, true);
    return ValueRef::createUndefined();
}

static ValueRef* derivedInitializer(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    ConstructorObjectRef* self = state->resolveCallee()->asConstructorObject();
    self->initializeSuper(state, thisValue->asObject(), argc, argv, newTarget);
    thisValue->asObject()->defineDataProperty(state, key("derived"), ValueRef::create(true), true, true, true);
    return ValueRef::createUndefined();
}

static ValueRef* emptyInitializer(ExecutionStateRef* state, ValueRef* thisValue, size_t argc, ValueRef** argv, OptionalRef<ObjectRef> newTarget)
{
    return ValueRef::createUndefined();
}

int main(int argc, char* argv[])
{
    testing::InitGoogleTest(&argc, argv);

    Globals::initialize(new TestPlatform());

    g_instance = VMInstanceRef::create();
    g_context = ContextRef::create(g_instance.get());

    int result = RUN_ALL_TESTS();

    g_context.release();
    g_instance.release();
    Globals::finalize();

    return result;
}

TEST(ValueRef, Basic1)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        auto minusValue = ValueRef::create(-1);
        auto vector = ValueVectorRef::create(3);
        vector->set(0, minusValue);

        EXPECT_TRUE(minusValue->isInt32());
        EXPECT_EQ(vector->at(0)->asInt32(), -1);

        auto doubleValue = ValueRef::create(1.5);
        vector->set(1, doubleValue);
        EXPECT_TRUE(doubleValue->isDouble());
        EXPECT_TRUE(doubleValue->isStoredInHeap());
        EXPECT_FALSE(doubleValue->isPointerValue());
        EXPECT_EQ(vector->at(1)->asNumber(), 1.5);

        EXPECT_TRUE(vector->at(2)->isUndefined());
        vector->pushBack(ValueRef::createNull());
        EXPECT_EQ(vector->size(), 4u);
        EXPECT_TRUE(vector->at(3)->isNull());
        EXPECT_TRUE(vector->at(3)->isUndefinedOrNull());

        EXPECT_TRUE(ValueRef::create(true)->isTrue());
        EXPECT_TRUE(ValueRef::create(false)->isFalse());
        EXPECT_TRUE(ValueRef::create(2.0)->isInt32());

        return ValueRef::createUndefined();
    });
}

TEST(ValueRef, SameValue)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        EXPECT_TRUE(ValueRef::create(0)->equalsTo(state, ValueRef::create(0.0)));
        EXPECT_FALSE(ValueRef::create(0.0)->equalsTo(state, ValueRef::create(-0.0)));
        EXPECT_TRUE(ValueRef::create(std::nan(""))->equalsTo(state, ValueRef::create(std::nan(""))));
        EXPECT_TRUE(key("abc")->equalsTo(state, key("abc")));
        EXPECT_FALSE(key("abc")->equalsTo(state, key("abd")));

        ObjectRef* a = ObjectRef::create(state);
        ObjectRef* b = ObjectRef::create(state);
        EXPECT_TRUE(a->equalsTo(state, a));
        EXPECT_FALSE(a->equalsTo(state, b));
        EXPECT_FALSE(ValueRef::createNull()->equalsTo(state, ValueRef::createUndefined()));
        return ValueRef::createUndefined();
    });
}

TEST(ValueRef, PropertyKey)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        EXPECT_TRUE(isString(ValueRef::create(1)->toPropertyKey(state), "1"));
        EXPECT_TRUE(isString(ValueRef::create(-7)->toPropertyKey(state), "-7"));
        EXPECT_TRUE(isString(ValueRef::create(1.5)->toPropertyKey(state), "1.5"));
        EXPECT_TRUE(isString(ValueRef::create(-0.25)->toPropertyKey(state), "-0.25"));
        EXPECT_TRUE(isString(ValueRef::create(4294967296.0)->toPropertyKey(state), "4294967296"));
        EXPECT_TRUE(isString(ValueRef::create(1e20)->toPropertyKey(state), "100000000000000000000"));
        EXPECT_TRUE(isString(ValueRef::create(1e21)->toPropertyKey(state), "1e+21"));
        EXPECT_TRUE(isString(ValueRef::create(1.5e300)->toPropertyKey(state), "1.5e+300"));
        EXPECT_TRUE(isString(ValueRef::create(0.000001)->toPropertyKey(state), "0.000001"));
        EXPECT_TRUE(isString(ValueRef::create(0.0000015)->toPropertyKey(state), "0.0000015"));
        EXPECT_TRUE(isString(ValueRef::create(1e-7)->toPropertyKey(state), "1e-7"));
        EXPECT_TRUE(isString(ValueRef::create(-1.25e-10)->toPropertyKey(state), "-1.25e-10"));
        EXPECT_TRUE(isString(ValueRef::create(0.1)->toPropertyKey(state), "0.1"));
        EXPECT_TRUE(isString(ValueRef::create(std::nan(""))->toPropertyKey(state), "NaN"));
        EXPECT_TRUE(isString(ValueRef::create(true)->toPropertyKey(state), "true"));
        EXPECT_TRUE(isString(ValueRef::createNull()->toPropertyKey(state), "null"));
        EXPECT_TRUE(isString(ValueRef::createUndefined()->toPropertyKey(state), "undefined"));

        // numeric keys and their text are the same property
        ObjectRef* obj = ObjectRef::create(state);
        obj->defineDataProperty(state, ValueRef::create(1), key("one"), true, true, true);
        EXPECT_TRUE(isString(obj->get(state, key("1")), "one"));

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            return obj->get(state, obj);
        },
                                    obj);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::TypeError);
        return ValueRef::createUndefined();
    });
}

TEST(StringRef, Basic1)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        StringRef* s = StringRef::createFromASCII("hello");
        EXPECT_EQ(s->length(), 5u);
        EXPECT_TRUE(s->equals(StringRef::createFromUTF8("hello")));
        EXPECT_TRUE(s->equalsWithASCIIString("hello", 5));
        EXPECT_FALSE(s->equalsWithASCIIString("hell", 4));
        EXPECT_EQ(s->toStdUTF8String(), "hello");
        EXPECT_TRUE(s->isString());
        EXPECT_FALSE(s->isObject());
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, GetWalksTheChain)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* c = ObjectRef::create(state);
        ObjectRef* b = ObjectRef::create(state, c);
        ObjectRef* a = ObjectRef::create(state, b);

        c->defineDataProperty(state, key("k"), ValueRef::create(3), true, true, true);
        EXPECT_EQ(a->get(state, key("k"))->asInt32(), 3);

        b->defineDataProperty(state, key("k"), ValueRef::create(2), true, true, true);
        EXPECT_EQ(a->get(state, key("k"))->asInt32(), 2);
        EXPECT_EQ(c->get(state, key("k"))->asInt32(), 3);

        a->defineDataProperty(state, key("k"), ValueRef::create(1), true, true, true);
        EXPECT_EQ(a->get(state, key("k"))->asInt32(), 1);

        EXPECT_TRUE(a->get(state, key("missing"))->isUndefined());
        EXPECT_FALSE(a->has(state, key("missing")));
        EXPECT_TRUE(a->has(state, key("k")));

        EXPECT_TRUE(a->getPrototypeObject(state).get() == b);
        EXPECT_TRUE(c->getPrototype(state)->isNull());
        EXPECT_TRUE(c->isPrototypeOf(state, a));
        EXPECT_FALSE(a->isPrototypeOf(state, c));
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, SetWritesOnlyTheReceiver)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        ancestor->defineDataProperty(state, key("k"), ValueRef::create(1), true, true, true);

        EXPECT_TRUE(obj->set(state, key("k"), ValueRef::create(2)));
        EXPECT_EQ(obj->getOwnProperty(state, key("k"))->asInt32(), 2);
        EXPECT_EQ(ancestor->get(state, key("k"))->asInt32(), 1);

        // a new own property is writable, enumerable and configurable
        OptionalRef<ObjectPropertyDescriptorRef> desc = obj->getOwnPropertyDescriptor(state, key("k"));
        EXPECT_TRUE(desc.hasValue());
        EXPECT_TRUE(desc->isWritable());
        EXPECT_TRUE(desc->isEnumerable());
        EXPECT_TRUE(desc->isConfigurable());

        // an existing own property keeps its flags
        obj->defineDataProperty(state, key("hidden"), ValueRef::create(1), true, false, true);
        EXPECT_TRUE(obj->set(state, key("hidden"), ValueRef::create(5)));
        desc = obj->getOwnPropertyDescriptor(state, key("hidden"));
        EXPECT_EQ(desc->value()->asInt32(), 5);
        EXPECT_FALSE(desc->isEnumerable());
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, InheritedReadOnlyDoesNotBlockOwnWrite)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        ancestor->defineDataProperty(state, key("k"), ValueRef::create(1), false, true, false);

        EXPECT_TRUE(obj->set(state, key("k"), ValueRef::create(2)));
        EXPECT_EQ(obj->get(state, key("k"))->asInt32(), 2);
        EXPECT_EQ(ancestor->get(state, key("k"))->asInt32(), 1);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, DeleteUnshadowsAncestor)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        ancestor->defineDataProperty(state, key("k"), ValueRef::create(1), true, true, true);
        obj->set(state, key("k"), ValueRef::create(2));

        EXPECT_TRUE(obj->deleteOwnProperty(state, key("k")));
        EXPECT_FALSE(obj->hasOwnProperty(state, key("k")));
        EXPECT_EQ(obj->get(state, key("k"))->asInt32(), 1);
        EXPECT_EQ(ancestor->get(state, key("k"))->asInt32(), 1);

        // only the ancestor has it now, deleting is a successful no-op
        EXPECT_TRUE(obj->deleteOwnProperty(state, key("k")));
        EXPECT_TRUE(ancestor->hasOwnProperty(state, key("k")));
        EXPECT_EQ(obj->get(state, key("k"))->asInt32(), 1);

        // nobody has it
        EXPECT_FALSE(obj->deleteOwnProperty(state, key("nothing")));
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, UndefinedValueStillShadows)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        ancestor->defineDataProperty(state, key("k"), ValueRef::create(5), true, true, true);

        EXPECT_TRUE(obj->set(state, key("k"), ValueRef::createUndefined()));
        EXPECT_TRUE(obj->get(state, key("k"))->isUndefined());
        EXPECT_TRUE(obj->has(state, key("k")));
        EXPECT_TRUE(obj->hasOwnProperty(state, key("k")));

        EXPECT_TRUE(obj->deleteOwnProperty(state, key("k")));
        EXPECT_EQ(obj->get(state, key("k"))->asInt32(), 5);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, SetterOnlyAccessorShadowsInheritedGetter)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* getter = createFunction(state, "getter", getterReturnsOne, 0);
        FunctionObjectRef* setter = createFunction(state, "setter", setterStoresIntoReceiver, 1);

        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        ancestor->defineAccessorProperty(state, key("x"), getter, nullptr, true, true);
        EXPECT_EQ(obj->get(state, key("x"))->asInt32(), 1);

        obj->defineAccessorProperty(state, key("x"), nullptr, setter, true, true);
        EXPECT_TRUE(obj->get(state, key("x"))->isUndefined());
        EXPECT_EQ(ancestor->get(state, key("x"))->asInt32(), 1);

        // redefining replaces the whole record, the getter is gone for good
        OptionalRef<ObjectPropertyDescriptorRef> desc = obj->getOwnPropertyDescriptor(state, key("x"));
        EXPECT_TRUE(desc->isAccessorDescriptor());
        EXPECT_FALSE(desc->getter().hasValue());
        EXPECT_TRUE(desc->setter().get() == setter);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, InheritedSetterRunsOnReceiver)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* setter = createFunction(state, "setter", setterStoresIntoReceiver, 1);

        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* middle = ObjectRef::create(state, ancestor);
        ObjectRef* obj = ObjectRef::create(state, middle);
        ancestor->defineAccessorProperty(state, key("x"), nullptr, setter, true, true);

        EXPECT_TRUE(obj->set(state, key("x"), ValueRef::create(7)));
        EXPECT_EQ(obj->getOwnProperty(state, key("_x"))->asInt32(), 7);
        EXPECT_FALSE(obj->hasOwnProperty(state, key("x")));
        EXPECT_FALSE(ancestor->hasOwnProperty(state, key("_x")));
        EXPECT_FALSE(middle->hasOwnProperty(state, key("_x")));
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, WriteThroughGetterOnlyAccessor)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* getter = createFunction(state, "getter", getterReturnsOne, 0);
        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        ancestor->defineAccessorProperty(state, key("x"), getter, nullptr, true, true);

        // silently dropped outside strict mode
        EXPECT_FALSE(state->inStrictMode());
        EXPECT_FALSE(obj->set(state, key("x"), ValueRef::create(2)));
        EXPECT_FALSE(obj->hasOwnProperty(state, key("x")));
        EXPECT_EQ(obj->get(state, key("x"))->asInt32(), 1);

        FunctionObjectRef* sloppyWriter = createFunction(state, "sloppyWriter", writer, 2, false);
        ValueRef* argv[] = { key("x"), ValueRef::create(2) };
        EXPECT_TRUE(sloppyWriter->call(state, obj, 2, argv)->isFalse());

        // a strict function turns the same write into ReadOnlyError
        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            FunctionObjectRef* strictWriter = createFunction(state, "strictWriter", writer, 2, true);
            ValueRef* argv[] = { key("x"), ValueRef::create(2) };
            return strictWriter->call(state, obj, 2, argv);
        },
                                    obj);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::ReadOnlyError);
        EXPECT_FALSE(obj->hasOwnProperty(state, key("x")));
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, OwnReadOnlyProperty)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* obj = ObjectRef::create(state);
        obj->defineDataProperty(state, key("k"), ValueRef::create(1), false, true, true);

        EXPECT_FALSE(obj->set(state, key("k"), ValueRef::create(2)));
        EXPECT_EQ(obj->get(state, key("k"))->asInt32(), 1);

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            FunctionObjectRef* strictWriter = createFunction(state, "strictWriter", writer, 2, true);
            ValueRef* argv[] = { key("k"), ValueRef::create(2) };
            return strictWriter->call(state, obj, 2, argv);
        },
                                    obj);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::ReadOnlyError);
        EXPECT_EQ(obj->get(state, key("k"))->asInt32(), 1);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, SetPrototypeRejectsCycles)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* a = ObjectRef::create(state);
        ObjectRef* b = ObjectRef::create(state, a);
        ObjectRef* c = ObjectRef::create(state, b);

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* a, ObjectRef* c) -> ValueRef* {
            a->setPrototype(state, c);
            return ValueRef::createUndefined();
        },
                                    a, c);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::CycleError);
        EXPECT_FALSE(a->getPrototypeObject(state).hasValue());

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* a, ObjectRef* c) -> ValueRef* {
            a->setPrototype(state, a);
            return ValueRef::createUndefined();
        },
                               a, c);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::CycleError);
        EXPECT_FALSE(a->getPrototypeObject(state).hasValue());

        // relinking to an unrelated chain is fine at any time
        ObjectRef* other = ObjectRef::create(state);
        other->defineDataProperty(state, key("k"), ValueRef::create(9), true, true, true);
        c->setPrototype(state, other);
        EXPECT_TRUE(c->getPrototypeObject(state).get() == other);
        EXPECT_EQ(c->get(state, key("k"))->asInt32(), 9);
        c->setPrototype(state, nullptr);
        EXPECT_TRUE(c->getPrototype(state)->isNull());
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, DescriptorRoundTrip)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* obj = ObjectRef::create(state);
        ObjectPropertyDescriptorRef data(ValueRef::create(3), false, true, false);
        obj->defineOwnProperty(state, key("data"), data);

        OptionalRef<ObjectPropertyDescriptorRef> desc = obj->getOwnPropertyDescriptor(state, key("data"));
        EXPECT_TRUE(desc.hasValue());
        EXPECT_TRUE(desc->isDataDescriptor());
        EXPECT_EQ(desc->value()->asInt32(), 3);
        EXPECT_FALSE(desc->isWritable());
        EXPECT_TRUE(desc->isEnumerable());
        EXPECT_FALSE(desc->isConfigurable());

        FunctionObjectRef* getter = createFunction(state, "getter", getterReturnsOne, 0);
        FunctionObjectRef* setter = createFunction(state, "setter", setterStoresIntoReceiver, 1);
        ObjectPropertyDescriptorRef accessor(getter, setter, false, true);
        obj->defineOwnProperty(state, key("accessor"), accessor);

        desc = obj->getOwnPropertyDescriptor(state, key("accessor"));
        EXPECT_TRUE(desc->isAccessorDescriptor());
        EXPECT_TRUE(desc->getter().get() == getter);
        EXPECT_TRUE(desc->setter().get() == setter);
        EXPECT_FALSE(desc->isWritable());
        EXPECT_FALSE(desc->isEnumerable());
        EXPECT_TRUE(desc->isConfigurable());

        ObjectPropertyDescriptorRef copied = accessor;
        EXPECT_TRUE(copied.isAccessorDescriptor());
        copied = data;
        EXPECT_TRUE(copied.isDataDescriptor());
        EXPECT_EQ(copied.value()->asInt32(), 3);

        EXPECT_FALSE(obj->getOwnPropertyDescriptor(state, key("missing")).hasValue());
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, NonConfigurableProperty)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* obj = ObjectRef::create(state);
        obj->defineDataProperty(state, key("fixed"), ValueRef::create(1), false, true, false);
        obj->defineDataProperty(state, key("counter"), ValueRef::create(1), true, true, false);

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            obj->defineDataProperty(state, key("fixed"), ValueRef::create(2), false, true, false);
            return ValueRef::createUndefined();
        },
                                    obj);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::NotConfigurableError);
        EXPECT_EQ(obj->get(state, key("fixed"))->asInt32(), 1);

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            obj->defineDataProperty(state, key("fixed"), ValueRef::create(1), false, false, false);
            return ValueRef::createUndefined();
        },
                               obj);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::NotConfigurableError);
        EXPECT_TRUE(obj->getOwnPropertyDescriptor(state, key("fixed"))->isEnumerable());

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            FunctionObjectRef* getter = createFunction(state, "getter", getterReturnsOne, 0);
            obj->defineAccessorProperty(state, key("counter"), getter, nullptr, true, false);
            return ValueRef::createUndefined();
        },
                               obj);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::NotConfigurableError);
        EXPECT_TRUE(obj->getOwnPropertyDescriptor(state, key("counter"))->isDataDescriptor());

        // nothing observable changes, so these are accepted
        obj->defineDataProperty(state, key("fixed"), ValueRef::create(1), false, true, false);
        obj->defineDataProperty(state, key("counter"), ValueRef::create(2), true, true, false);
        EXPECT_EQ(obj->get(state, key("counter"))->asInt32(), 2);
        obj->defineDataProperty(state, key("counter"), ValueRef::create(3), false, true, false);
        EXPECT_FALSE(obj->getOwnPropertyDescriptor(state, key("counter"))->isWritable());

        EXPECT_FALSE(obj->deleteOwnProperty(state, key("fixed")));
        EXPECT_TRUE(obj->hasOwnProperty(state, key("fixed")));
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, OwnPropertyKeysKeepInsertionOrder)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* obj = ObjectRef::create(state);
        obj->defineDataProperty(state, key("a"), ValueRef::create(1), true, true, true);
        obj->defineDataProperty(state, key("b"), ValueRef::create(2), true, false, true);
        obj->defineDataProperty(state, key("c"), ValueRef::create(3), true, true, true);

        // redefining keeps the position
        obj->defineDataProperty(state, key("a"), ValueRef::create(10), true, true, true);
        ValueVectorRef* keys = obj->ownPropertyKeys(state);
        EXPECT_EQ(keys->size(), 3u);
        EXPECT_TRUE(isString(keys->at(0), "a"));
        EXPECT_TRUE(isString(keys->at(1), "b"));
        EXPECT_TRUE(isString(keys->at(2), "c"));

        // delete then define appends
        obj->deleteOwnProperty(state, key("a"));
        obj->defineDataProperty(state, key("a"), ValueRef::create(1), true, true, true);
        keys = obj->ownPropertyKeys(state);
        EXPECT_TRUE(isString(keys->at(0), "b"));
        EXPECT_TRUE(isString(keys->at(2), "a"));

        std::string visited;
        obj->enumerateObjectOwnProperties(state, [&](ExecutionStateRef* state, ValueRef* propertyName, bool isWritable, bool isEnumerable, bool isConfigurable) -> bool {
            EXPECT_TRUE(isEnumerable);
            visited += propertyName->asString()->toStdUTF8String();
            return true;
        });
        EXPECT_EQ(visited, "ca");

        visited.clear();
        obj->enumerateObjectOwnProperties(state, [&](ExecutionStateRef* state, ValueRef* propertyName, bool isWritable, bool isEnumerable, bool isConfigurable) -> bool {
            visited += propertyName->asString()->toStdUTF8String();
            return visited.length() < 2;
        },
                                          false);
        EXPECT_EQ(visited, "bc");
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, ManyProperties)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ObjectRef* ancestor = ObjectRef::create(state);
        ObjectRef* obj = ObjectRef::create(state, ancestor);
        for (int i = 0; i < 64; i++) {
            obj->defineDataProperty(state, ValueRef::create(i), ValueRef::create(i * 2), true, true, true);
        }
        ancestor->defineDataProperty(state, ValueRef::create(5), ValueRef::create(-1), true, true, true);

        for (int i = 0; i < 64; i++) {
            EXPECT_EQ(obj->get(state, ValueRef::create(i))->asInt32(), i * 2);
        }

        for (int i = 0; i < 64; i += 5) {
            EXPECT_TRUE(obj->deleteOwnProperty(state, ValueRef::create(i)));
        }
        for (int i = 0; i < 64; i++) {
            if (i % 5 == 0) {
                EXPECT_FALSE(obj->hasOwnProperty(state, ValueRef::create(i)));
            } else {
                EXPECT_EQ(obj->get(state, ValueRef::create(i))->asInt32(), i * 2);
            }
        }
        EXPECT_EQ(obj->get(state, ValueRef::create(5))->asInt32(), -1);

        ValueVectorRef* keys = obj->ownPropertyKeys(state);
        EXPECT_EQ(keys->size(), 51u);
        EXPECT_TRUE(isString(keys->at(0), "1"));
        EXPECT_TRUE(isString(keys->at(50), "63"));

        obj->defineDataProperty(state, ValueRef::create(0), ValueRef::create(100), true, true, true);
        keys = obj->ownPropertyKeys(state);
        EXPECT_TRUE(isString(keys->at(51), "0"));
        EXPECT_EQ(obj->get(state, ValueRef::create(0))->asInt32(), 100);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, SuperPropertyAccess)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* getter = createFunction(state, "who", getterReadsReceiverName, 0);

        ObjectRef* parent = ObjectRef::create(state);
        parent->defineDataProperty(state, key("greeting"), key("hello"), true, true, true);
        parent->defineAccessorProperty(state, key("who"), getter, nullptr, true, true);

        ObjectRef* home = ObjectRef::create(state, parent);
        home->defineDataProperty(state, key("greeting"), key("shadowed"), true, true, true);

        ObjectRef* receiver = ObjectRef::create(state);
        receiver->defineDataProperty(state, key("name"), key("receiver"), true, true, true);

        EXPECT_TRUE(isString(ObjectRef::superGet(state, home, key("greeting"), receiver), "hello"));
        EXPECT_TRUE(isString(ObjectRef::superGet(state, home, key("who"), receiver), "receiver"));

        // resolution follows the link as it is at call time
        ObjectRef* otherParent = ObjectRef::create(state);
        otherParent->defineDataProperty(state, key("greeting"), key("hi"), true, true, true);
        home->setPrototype(state, otherParent);
        EXPECT_TRUE(isString(ObjectRef::superGet(state, home, key("greeting"), receiver), "hi"));

        EXPECT_TRUE(ObjectRef::superSet(state, home, key("greeting"), key("written"), receiver));
        EXPECT_TRUE(isString(receiver->getOwnProperty(state, key("greeting")), "written"));
        EXPECT_TRUE(isString(otherParent->get(state, key("greeting")), "hi"));
        EXPECT_TRUE(isString(home->get(state, key("greeting")), "shadowed"));

        home->setPrototype(state, nullptr);
        EXPECT_TRUE(ObjectRef::superGet(state, home, key("greeting"), receiver)->isUndefined());
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, StrictSuperSet)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* getter = createFunction(state, "getter", getterReturnsOne, 0);
        ObjectRef* parent = ObjectRef::create(state);
        parent->defineAccessorProperty(state, key("x"), getter, nullptr, true, true);
        ObjectRef* home = ObjectRef::create(state, parent);
        ObjectRef* receiver = ObjectRef::create(state);

        EXPECT_FALSE(ObjectRef::superSet(state, home, key("x"), ValueRef::create(2), receiver));

        FunctionObjectRef* sloppyWriter = createFunction(state, "sloppyWriter", superWriter, 3, false);
        ValueRef* argv[] = { home, key("x"), ValueRef::create(2) };
        EXPECT_TRUE(sloppyWriter->call(state, receiver, 3, argv)->isFalse());

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* home, ObjectRef* receiver) -> ValueRef* {
            FunctionObjectRef* strictWriter = createFunction(state, "strictWriter", superWriter, 3, true);
            ValueRef* argv[] = { home, key("x"), ValueRef::create(2) };
            return strictWriter->call(state, receiver, 3, argv);
        },
                                    home, receiver);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::ReadOnlyError);
        EXPECT_FALSE(receiver->hasOwnProperty(state, key("x")));

        // an accepted write is unaffected by strictness
        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* home, ObjectRef* receiver) -> ValueRef* {
            FunctionObjectRef* strictWriter = createFunction(state, "strictWriter", superWriter, 3, true);
            ValueRef* argv[] = { home, key("y"), ValueRef::create(3) };
            return strictWriter->call(state, receiver, 3, argv);
        },
                               home, receiver);
        EXPECT_TRUE(r.isSuccessful());
        EXPECT_TRUE(r.result->isTrue());
        EXPECT_EQ(receiver->getOwnProperty(state, key("y"))->asInt32(), 3);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, ExplicitReceiver)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* getter = createFunction(state, "who", getterReadsReceiverName, 0);
        FunctionObjectRef* setter = createFunction(state, "setter", setterStoresIntoReceiver, 1);

        ObjectRef* b = ObjectRef::create(state);
        b->defineAccessorProperty(state, key("who"), getter, nullptr, true, true);
        b->defineAccessorProperty(state, key("x"), nullptr, setter, true, true);
        ObjectRef* a = ObjectRef::create(state, b);
        a->defineDataProperty(state, key("name"), key("a"), true, true, true);

        // r shares no chain with a
        ObjectRef* r = ObjectRef::create(state);
        r->defineDataProperty(state, key("name"), key("r"), true, true, true);

        EXPECT_TRUE(isString(a->get(state, key("who")), "a"));
        EXPECT_TRUE(isString(a->get(state, key("who"), r), "r"));
        EXPECT_TRUE(a->get(state, key("missing"), r)->isUndefined());

        // the setter found through a runs on r
        EXPECT_TRUE(a->set(state, key("x"), ValueRef::create(5), r));
        EXPECT_EQ(r->getOwnProperty(state, key("_x"))->asInt32(), 5);
        EXPECT_FALSE(a->hasOwnProperty(state, key("_x")));

        // a plain write lands on r as well
        EXPECT_TRUE(a->set(state, key("plain"), ValueRef::create(7), r));
        EXPECT_EQ(r->getOwnProperty(state, key("plain"))->asInt32(), 7);
        EXPECT_FALSE(a->hasOwnProperty(state, key("plain")));

        // a primitive receiver has nowhere to store a value
        EXPECT_FALSE(a->set(state, key("plain"), ValueRef::create(1), ValueRef::create(3)));
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, OwnDataPropertyHidesInheritedSetter)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* setter = createFunction(state, "setter", setterStoresIntoReceiver, 1);
        ObjectRef* b = ObjectRef::create(state);
        b->defineAccessorProperty(state, key("k"), nullptr, setter, true, true);

        ObjectRef* a = ObjectRef::create(state, b);
        a->defineDataProperty(state, key("k"), ValueRef::create(1), true, true, true);
        EXPECT_TRUE(a->set(state, key("k"), ValueRef::create(2)));
        EXPECT_EQ(a->getOwnProperty(state, key("k"))->asInt32(), 2);
        EXPECT_FALSE(a->hasOwnProperty(state, key("_x")));

        // an inherited data property closer to the receiver hides it too
        ObjectRef* leaf = ObjectRef::create(state, a);
        EXPECT_TRUE(leaf->set(state, key("k"), ValueRef::create(3)));
        EXPECT_EQ(leaf->getOwnProperty(state, key("k"))->asInt32(), 3);
        EXPECT_EQ(a->getOwnProperty(state, key("k"))->asInt32(), 2);
        EXPECT_FALSE(leaf->hasOwnProperty(state, key("_x")));

        // once the data property is gone the setter owns the write again
        EXPECT_TRUE(a->deleteOwnProperty(state, key("k")));
        EXPECT_TRUE(a->set(state, key("k"), ValueRef::create(4)));
        EXPECT_FALSE(a->hasOwnProperty(state, key("k")));
        EXPECT_EQ(a->getOwnProperty(state, key("_x"))->asInt32(), 4);
        return ValueRef::createUndefined();
    });
}

TEST(ObjectRef, PrototypeChainLength)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        const size_t limit = ObjectRef::maxPrototypeChainLength();
        ObjectRef* root = ObjectRef::create(state);
        root->defineDataProperty(state, key("k"), ValueRef::create(1), true, true, true);
        ObjectRef* tip = root;
        for (size_t i = 1; i < limit; i++) {
            tip = ObjectRef::create(state, tip);
        }

        // a chain of exactly limit objects is usable
        EXPECT_EQ(tip->get(state, key("k"))->asInt32(), 1);
        EXPECT_TRUE(tip->get(state, key("missing"))->isUndefined());
        EXPECT_FALSE(tip->has(state, key("missing")));
        EXPECT_TRUE(root->isPrototypeOf(state, tip));

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* tip) -> ValueRef* {
            return ObjectRef::create(state, tip);
        },
                                    tip);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);

        ObjectRef* other = ObjectRef::create(state);
        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* other, ObjectRef* tip) -> ValueRef* {
            other->setPrototype(state, tip);
            return ValueRef::createUndefined();
        },
                               other, tip);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);
        EXPECT_FALSE(other->getPrototypeObject(state).hasValue());

        // relinking the root makes every chain above it longer, walks past the limit raise RangeError
        ObjectRef* extra = ObjectRef::create(state);
        root->setPrototype(state, extra);

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* tip) -> ValueRef* {
            return tip->get(state, key("missing"));
        },
                               tip);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* tip) -> ValueRef* {
            return ValueRef::create(tip->has(state, key("missing")));
        },
                               tip);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* tip) -> ValueRef* {
            return ValueRef::create(tip->set(state, key("missing"), ValueRef::create(1)));
        },
                               tip);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);
        EXPECT_FALSE(tip->hasOwnProperty(state, key("missing")));

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* extra, ObjectRef* tip) -> ValueRef* {
            return ValueRef::create(extra->isPrototypeOf(state, tip));
        },
                               extra, tip);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);

        // keys found within the limit still resolve
        EXPECT_EQ(tip->get(state, key("k"))->asInt32(), 1);

        root->setPrototype(state, nullptr);
        EXPECT_TRUE(tip->get(state, key("missing"))->isUndefined());
        return ValueRef::createUndefined();
    });
}

TEST(FunctionObjectRef, Basic1)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        FunctionObjectRef* fn = createFunction(state, "fn", writer, 2, true);
        EXPECT_TRUE(fn->isCallable());
        EXPECT_FALSE(fn->isConstructible());
        EXPECT_FALSE(fn->isConstructor());
        EXPECT_TRUE(fn->isStrict());
        EXPECT_EQ(fn->argumentCount(), 2u);
        EXPECT_TRUE(fn->name()->equalsWithASCIIString("fn", 2));

        OptionalRef<ObjectPropertyDescriptorRef> desc = fn->getOwnPropertyDescriptor(state, key("name"));
        EXPECT_TRUE(isString(desc->value(), "fn"));
        EXPECT_FALSE(desc->isWritable());
        EXPECT_FALSE(desc->isEnumerable());
        EXPECT_TRUE(desc->isConfigurable());
        EXPECT_EQ(fn->get(state, key("length"))->asInt32(), 2);

        // missing arguments arrive as undefined
        ObjectRef* target = ObjectRef::create(state);
        ValueRef* argv[] = { key("k") };
        EXPECT_TRUE(fn->call(state, target, 1, argv)->isTrue());
        EXPECT_TRUE(target->hasOwnProperty(state, key("k")));
        EXPECT_TRUE(target->get(state, key("k"))->isUndefined());

        FunctionObjectRef* inner = createFunction(state, "inner", stackDepthOfCall, 0, true);
        EXPECT_EQ(inner->call(state, ValueRef::createUndefined(), 0, nullptr)->asInt32(), 1);
        EXPECT_TRUE(state->resolveCallee().get() == nullptr);
        return ValueRef::createUndefined();
    });
}

TEST(FunctionObjectRef, CallErrors)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            return obj->call(state, ValueRef::createUndefined(), 0, nullptr);
        },
                                    ObjectRef::create(state));
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::TypeError);

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            FunctionObjectRef* fn = createFunction(state, "fn", getterReturnsOne, 0);
            return fn->construct(state, 0, nullptr);
        },
                               ObjectRef::create(state));
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::TypeError);

        // a getter reading its own property runs out of call depth instead of native stack
        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* obj) -> ValueRef* {
            FunctionObjectRef* getter = createFunction(state, "recurse", getterReadsItself, 0);
            obj->defineAccessorProperty(state, key("self"), getter, nullptr, true, true);
            return obj->get(state, key("self"));
        },
                               ObjectRef::create(state));
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::RangeError);
        EXPECT_TRUE(r.stackTrace.size() > 0);
        EXPECT_TRUE(r.stackTrace[0].functionName->equalsWithASCIIString("recurse", 7));
        EXPECT_FALSE(r.stackTrace[0].isConstructor);
        return ValueRef::createUndefined();
    });
}

TEST(ErrorObjectRef, Basic1)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ErrorObjectRef* e = ErrorObjectRef::create(state, ErrorObjectRef::Code::RangeError, StringRef::createFromASCII("out of range"));
        EXPECT_EQ(e->errorCode(), ErrorObjectRef::Code::RangeError);
        EXPECT_TRUE(isString(e->get(state, key("name")), "RangeError"));
        EXPECT_TRUE(isString(e->get(state, key("message")), "out of range"));
        EXPECT_FALSE(e->getOwnPropertyDescriptor(state, key("message"))->isEnumerable());
        EXPECT_TRUE(e->getPrototypeObject(state).get() == ErrorObjectRef::errorPrototype(state->context(), ErrorObjectRef::Code::RangeError));

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* a) -> ValueRef* {
            a->setPrototype(state, a);
            return ValueRef::createUndefined();
        },
                                    ObjectRef::create(state));
        EXPECT_FALSE(r.isSuccessful());
        EXPECT_TRUE(r.error->isErrorObject());
        EXPECT_TRUE(isString(r.error->asObject()->get(state, key("name")), "CycleError"));
        EXPECT_EQ(r.resultOrErrorToString(state->context()).find("CycleError: "), 0u);

        // any value can be thrown
        r = Evaluator::execute(state, [](ExecutionStateRef* state, ObjectRef* a) -> ValueRef* {
            state->throwException(ValueRef::create(42));
            return ValueRef::createUndefined();
        },
                               ObjectRef::create(state));
        EXPECT_EQ(r.error->asInt32(), 42);
        EXPECT_EQ(r.resultOrErrorToString(state->context()), "42");
        return ValueRef::createUndefined();
    });
}

TEST(ConstructorObjectRef, Construct)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ConstructorObjectRef* point = createConstructor(state, "Point", pointInitializer, 2);
        EXPECT_TRUE(point->isConstructible());
        EXPECT_TRUE(point->isConstructor());

        ValueRef* argv[] = { ValueRef::create(1) };
        ObjectRef* p = point->construct(state, 1, argv);
        EXPECT_TRUE(p->getPrototypeObject(state).get() == point->constructionPrototype());
        EXPECT_EQ(p->get(state, key("x"))->asInt32(), 1);
        EXPECT_TRUE(p->get(state, key("y"))->isUndefined());
        EXPECT_TRUE(p->get(state, key("withNewTarget"))->isTrue());

        ValueRef* constructed = point->construct(state, 0, nullptr);
        EXPECT_TRUE(constructed->isObject());
        EXPECT_TRUE(point->hasInstance(state, p));
        EXPECT_FALSE(point->hasInstance(state, ObjectRef::create(state)));
        EXPECT_FALSE(point->hasInstance(state, ValueRef::create(1)));

        // initializing an existing object, the Super.call(this) idiom
        ObjectRef* plain = ObjectRef::create(state);
        point->call(state, plain, 1, argv);
        EXPECT_EQ(plain->get(state, key("x"))->asInt32(), 1);
        EXPECT_TRUE(plain->get(state, key("withNewTarget"))->isFalse());
        EXPECT_FALSE(plain->getPrototypeObject(state).hasValue());

        point->initialize(state, plain, 0, nullptr);
        EXPECT_TRUE(plain->get(state, key("x"))->isUndefined());
        return ValueRef::createUndefined();
    });
}

TEST(ConstructorObjectRef, ConstructorBackReference)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ConstructorObjectRef* point = createConstructor(state, "Point", emptyInitializer, 0);
        ObjectRef* proto = point->constructionPrototype();

        OptionalRef<ObjectPropertyDescriptorRef> desc = proto->getOwnPropertyDescriptor(state, key("constructor"));
        EXPECT_TRUE(desc->value() == point);
        EXPECT_TRUE(desc->isWritable());
        EXPECT_FALSE(desc->isEnumerable());
        EXPECT_TRUE(desc->isConfigurable());

        ObjectRef* before = point->construct(state, 0, nullptr);
        EXPECT_TRUE(before->get(state, key("constructor")) == point);

        ObjectRef* replacement = ObjectRef::create(state);
        EXPECT_TRUE(proto->set(state, key("constructor"), replacement));
        ObjectRef* after = point->construct(state, 0, nullptr);

        // one shared descriptor, instance links are untouched
        EXPECT_TRUE(before->get(state, key("constructor")) == replacement);
        EXPECT_TRUE(after->get(state, key("constructor")) == replacement);
        EXPECT_TRUE(before->getPrototypeObject(state).get() == proto);
        EXPECT_TRUE(after->getPrototypeObject(state).get() == proto);
        EXPECT_FALSE(before->hasOwnProperty(state, key("constructor")));
        return ValueRef::createUndefined();
    });
}

TEST(ConstructorObjectRef, StaticTableThroughInheritedGetter)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ConstructorObjectRef* model = createConstructor(state, "Model", emptyInitializer, 0);
        model->defineDataProperty(state, key("table"), key("users"), true, true, true);

        FunctionObjectRef* getter = createFunction(state, "table", getterReadsStaticTable, 0);
        model->constructionPrototype()->defineAccessorProperty(state, key("table"), getter, nullptr, false, true);

        ObjectRef* user = model->construct(state, 0, nullptr);
        user->defineDataProperty(state, key("id"), key("x"), true, true, true);
        EXPECT_TRUE(isString(user->get(state, key("table")), "users"));

        model->set(state, key("table"), key("accounts"));
        EXPECT_TRUE(isString(user->get(state, key("table")), "accounts"));
        EXPECT_FALSE(user->hasOwnProperty(state, key("table")));

        // a linked constructor inherits the static table until it shadows it
        ConstructorObjectRef* admin = createConstructor(state, "Admin", emptyInitializer, 0);
        admin->linkStatic(state, model);
        admin->linkInstancePrototype(state, model);
        EXPECT_TRUE(admin->staticLink().get() == model);
        EXPECT_TRUE(isString(admin->get(state, key("table")), "accounts"));

        ObjectRef* root = admin->construct(state, 0, nullptr);
        EXPECT_TRUE(isString(root->get(state, key("table")), "accounts"));
        EXPECT_TRUE(model->hasInstance(state, root));
        EXPECT_TRUE(admin->hasInstance(state, root));
        EXPECT_FALSE(admin->hasInstance(state, user));

        admin->defineDataProperty(state, key("table"), key("admins"), true, true, true);
        EXPECT_TRUE(isString(root->get(state, key("table")), "admins"));
        EXPECT_TRUE(isString(user->get(state, key("table")), "accounts"));
        return ValueRef::createUndefined();
    });
}

TEST(ConstructorObjectRef, InitializeSuper)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ConstructorObjectRef* base = createConstructor(state, "Base", baseInitializer, 0);
        ConstructorObjectRef* otherBase = createConstructor(state, "OtherBase", baseInitializer, 0);
        ConstructorObjectRef* derived = createConstructor(state, "Derived", derivedInitializer, 0);
        derived->linkStatic(state, base);
        derived->linkInstancePrototype(state, base);

        ObjectRef* d = derived->construct(state, 0, nullptr);
        EXPECT_TRUE(isString(d->get(state, key("initializedBy")), "Base"));
        EXPECT_TRUE(d->get(state, key("derived"))->isTrue());

        // the parent initializer is looked up again on every call
        derived->linkStatic(state, otherBase);
        d = derived->construct(state, 0, nullptr);
        EXPECT_TRUE(isString(d->get(state, key("initializedBy")), "OtherBase"));

        derived->linkStatic(state, nullptr);
        EXPECT_FALSE(derived->staticLink().hasValue());
        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ConstructorObjectRef* derived) -> ValueRef* {
            return derived->construct(state, 0, nullptr);
        },
                                    derived);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::TypeError);
        EXPECT_TRUE(r.stackTrace.size() > 0);
        EXPECT_TRUE(r.stackTrace[0].functionName->equalsWithASCIIString("Derived", 7));
        EXPECT_TRUE(r.stackTrace[0].isConstructor);
        return ValueRef::createUndefined();
    });
}

TEST(ConstructorObjectRef, LinkCycles)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ConstructorObjectRef* base = createConstructor(state, "Base", emptyInitializer, 0);
        ConstructorObjectRef* derived = createConstructor(state, "Derived", emptyInitializer, 0);
        derived->linkStatic(state, base);
        derived->linkInstancePrototype(state, base);

        auto r = Evaluator::execute(state, [](ExecutionStateRef* state, ConstructorObjectRef* base, ConstructorObjectRef* derived) -> ValueRef* {
            base->linkStatic(state, derived);
            return ValueRef::createUndefined();
        },
                                    base, derived);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::CycleError);
        EXPECT_FALSE(base->staticLink().hasValue());

        r = Evaluator::execute(state, [](ExecutionStateRef* state, ConstructorObjectRef* base, ConstructorObjectRef* derived) -> ValueRef* {
            base->linkInstancePrototype(state, derived);
            return ValueRef::createUndefined();
        },
                               base, derived);
        EXPECT_EQ(errorCodeOf(r), ErrorObjectRef::Code::CycleError);
        EXPECT_FALSE(base->constructionPrototype()->getPrototypeObject(state).hasValue());

        derived->linkInstancePrototype(state, nullptr);
        EXPECT_FALSE(derived->constructionPrototype()->getPrototypeObject(state).hasValue());
        return ValueRef::createUndefined();
    });
}

TEST(ConstructorObjectRef, SetConstructionPrototype)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        ConstructorObjectRef* point = createConstructor(state, "Point", emptyInitializer, 0);
        ObjectRef* oldProto = point->constructionPrototype();
        ObjectRef* before = point->construct(state, 0, nullptr);

        ObjectRef* newProto = ObjectRef::create(state);
        point->setConstructionPrototype(state, newProto);
        ObjectRef* after = point->construct(state, 0, nullptr);

        EXPECT_TRUE(before->getPrototypeObject(state).get() == oldProto);
        EXPECT_TRUE(after->getPrototypeObject(state).get() == newProto);
        EXPECT_TRUE(point->hasInstance(state, after));
        EXPECT_FALSE(point->hasInstance(state, before));
        return ValueRef::createUndefined();
    });
}

TEST(Memory, Basic1)
{
    Evaluator::execute(g_context.get(), [](ExecutionStateRef* state) -> ValueRef* {
        PersistentRefHolder<ObjectRef> holder(ObjectRef::create(state));
        holder->defineDataProperty(state, key("kept"), ValueRef::create(1), true, true, true);

        Memory::gc();
        EXPECT_TRUE(Memory::heapSize() > 0);
        EXPECT_EQ(holder->get(state, key("kept"))->asInt32(), 1);
        Memory::printHeapUsage();

        EXPECT_TRUE(Globals::isInitialized());
        EXPECT_STREQ(Globals::version(), "1.0.0");
        return ValueRef::createUndefined();
    });
}
