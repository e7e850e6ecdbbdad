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

#ifndef __ConchString__
#define __ConchString__

#include "runtime/PointerValue.h"

namespace Conch {

// immutable 8-bit string, content is treated as UTF-8
class String : public PointerValue {
public:
    virtual bool isString() const override
    {
        return true;
    }

    template <const size_t srcLen>
    static String* fromASCII(const char (&src)[srcLen])
    {
        ASSERT(srcLen - 1 == strlen(src));
        return fromASCII(src, srcLen - 1);
    }

    static String* fromASCII(const char* s, size_t len);
    static String* fromUTF8(const char* src, size_t len);
    static String* fromInt32(int32_t v);
    static String* fromDouble(double v);

    size_t length() const
    {
        return m_length;
    }

    const char* characters() const
    {
        return m_buffer;
    }

    bool equals(const String* src) const;

    template <const size_t srcLen>
    bool equals(const char (&src)[srcLen]) const
    {
        return equals(src, srcLen - 1);
    }

    bool equals(const char* src, size_t srcLen) const
    {
        if (srcLen != m_length) {
            return false;
        }
        return memcmp(src, m_buffer, srcLen) == 0;
    }

    template <typename T>
    static inline size_t stringHash(T* src, size_t length)
    {
        size_t hash = static_cast<size_t>(0xc70f6907UL);
        for (; length; --length)
            hash = (hash * 131) + *src++;
        return hash;
    }

    size_t hashValue() const
    {
        return m_hash;
    }

    std::string toStdString() const
    {
        return std::string(m_buffer, m_length);
    }

private:
    String(char* buffer, size_t length);

    char* m_buffer;
    size_t m_length;
    size_t m_hash;
};

} // namespace Conch

namespace std {
template <>
struct hash<Conch::String*> {
    size_t operator()(Conch::String* const& x) const
    {
        return x->hashValue();
    }
};

template <>
struct equal_to<Conch::String*> {
    bool operator()(Conch::String* const& a, Conch::String* const& b) const
    {
        return a->equals(b);
    }
};
} // namespace std

#endif
