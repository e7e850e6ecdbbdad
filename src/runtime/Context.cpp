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
#include "Context.h"
#include "runtime/VMInstance.h"
#include "runtime/SandBox.h"

namespace Conch {

Context::Context(VMInstance* instance)
    : m_instance(instance)
{
    m_staticStrings.initStaticStrings();

    ExecutionState state(this);
    m_errorPrototypes[static_cast<size_t>(ErrorCode::None)] = nullptr;
    for (size_t i = 1; i < CONCH_ERROR_CODE_COUNT; i++) {
        ErrorCode code = static_cast<ErrorCode>(i);
        Object* proto = new Object(state);
        proto->defineOwnProperty(state, ObjectPropertyName(m_staticStrings.name),
                                 ObjectPropertyDescriptor(Value(ErrorObject::errorCodeName(state, code)), (ObjectPropertyDescriptor::PresentAttribute)(ObjectPropertyDescriptor::WritablePresent | ObjectPropertyDescriptor::ConfigurablePresent)));
        proto->defineOwnProperty(state, ObjectPropertyName(m_staticStrings.message),
                                 ObjectPropertyDescriptor(Value(m_staticStrings.emptyString), (ObjectPropertyDescriptor::PresentAttribute)(ObjectPropertyDescriptor::WritablePresent | ObjectPropertyDescriptor::ConfigurablePresent)));
        m_errorPrototypes[i] = proto;
    }
}

void Context::throwException(ExecutionState& state, const Value& exception)
{
    if (LIKELY(vmInstance()->currentSandBox() != nullptr)) {
        vmInstance()->currentSandBox()->throwException(state, exception);
    } else {
        CONCH_LOG_ERROR("there is no sandbox but exception occurred\n");
        RELEASE_ASSERT_NOT_REACHED();
    }
}
} // namespace Conch
