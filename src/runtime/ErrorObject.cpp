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
#include "ErrorObject.h"
#include "runtime/Context.h"

namespace Conch {

ErrorObject* ErrorObject::createError(ExecutionState& state, ErrorCode code, String* errorMessage)
{
    return new ErrorObject(state, state.context()->errorPrototype(code), code, errorMessage);
}

ErrorObject* ErrorObject::createBuiltinError(ExecutionState& state, ErrorCode code, const char* templateString, String* templateDataString)
{
    std::string message(templateString);
    size_t idx;
    if ((idx = message.find("%s")) != std::string::npos) {
        std::string replacer = templateDataString ? templateDataString->toStdString() : std::string();
        message.replace(idx, 2, replacer);
    }

    return createError(state, code, String::fromUTF8(message.data(), message.length()));
}

void ErrorObject::throwBuiltinError(ExecutionState& state, ErrorCode code, const char* templateString, String* templateDataString)
{
    state.throwException(Value(ErrorObject::createBuiltinError(state, code, templateString, templateDataString)));
}

String* ErrorObject::errorCodeName(ExecutionState& state, ErrorCode code)
{
    const StaticStrings& strings = state.context()->staticStrings();
    switch (code) {
    case ErrorCode::TypeError:
        return strings.TypeError;
    case ErrorCode::RangeError:
        return strings.RangeError;
    case ErrorCode::CycleError:
        return strings.CycleError;
    case ErrorCode::NotConfigurableError:
        return strings.NotConfigurableError;
    case ErrorCode::ReadOnlyError:
        return strings.ReadOnlyError;
    default:
        ASSERT_NOT_REACHED();
        return strings.emptyString;
    }
}

ErrorObject::ErrorObject(ExecutionState& state, Object* proto, ErrorCode code, String* errorMessage)
    : Object(state, proto)
    , m_errorCode(code)
{
    if (errorMessage->length()) {
        defineOwnPropertyThrowsException(state, ObjectPropertyName(state.context()->staticStrings().message),
                                         ObjectPropertyDescriptor(Value(errorMessage), (ObjectPropertyDescriptor::PresentAttribute)(ObjectPropertyDescriptor::WritablePresent | ObjectPropertyDescriptor::ConfigurablePresent)));
    }
}
} // namespace Conch
