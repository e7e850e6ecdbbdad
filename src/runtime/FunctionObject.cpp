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
#include "FunctionObject.h"
#include "runtime/Context.h"

namespace Conch {

FunctionObject::FunctionObject(ExecutionState& state, Optional<Object*> proto)
    : Object(state, proto)
{
}

void FunctionObject::initFunctionProperties(ExecutionState& state, String* name, size_t length)
{
    const StaticStrings& strings = state.context()->staticStrings();
    ObjectPropertyDescriptor::PresentAttribute attribute = ObjectPropertyDescriptor::ConfigurablePresent;

    defineOwnPropertyThrowsException(state, ObjectPropertyName(strings.length), ObjectPropertyDescriptor(Value(static_cast<uint32_t>(length)), attribute));
    defineOwnPropertyThrowsException(state, ObjectPropertyName(strings.name), ObjectPropertyDescriptor(Value(name ? name : strings.emptyString), attribute));
}
} // namespace Conch
