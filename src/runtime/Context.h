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

#ifndef __ConchContext__
#define __ConchContext__

#include "runtime/ErrorObject.h"
#include "runtime/StaticStrings.h"

namespace Conch {

class VMInstance;

class Context : public gc {
public:
    explicit Context(VMInstance* instance);

    VMInstance* vmInstance() const
    {
        return m_instance;
    }

    const StaticStrings& staticStrings() const
    {
        return m_staticStrings;
    }

    // shared prototype of every error raised with code, carries the name property
    Object* errorPrototype(ErrorCode code) const
    {
        ASSERT(code != ErrorCode::None);
        return m_errorPrototypes[static_cast<size_t>(code)];
    }

    NO_RETURN void throwException(ExecutionState& state, const Value& exception);

private:
    VMInstance* m_instance;
    StaticStrings m_staticStrings;
    Object* m_errorPrototypes[CONCH_ERROR_CODE_COUNT];
};
} // namespace Conch

#endif
