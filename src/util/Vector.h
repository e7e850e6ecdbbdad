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

#ifndef __ConchVector__
#define __ConchVector__

#include <new>
#include <type_traits>

namespace Conch {

template <typename T, bool isFundamental = std::is_fundamental<T>::value>
struct VectorCopier {
};

template <typename T>
struct VectorCopier<T, true> {
    static void copy(T* dst, const T* src, const size_t size)
    {
        memcpy(dst, src, sizeof(T) * size);
    }
};

template <typename T>
struct VectorCopier<T, false> {
    static void copy(T* dst, const T* src, const size_t size)
    {
        for (size_t i = 0; i < size; i++) {
            new (&dst[i]) T(src[i]);
        }
    }
};

// growable array whose buffer comes from Allocator
// elements are never destroyed, so T must be trivially destructible
template <typename T, typename Allocator, int const glowFactor = 150>
class Vector : public gc {
    COMPILE_ASSERT(std::is_trivially_destructible<T>::value, "");

public:
    Vector()
        : m_buffer(nullptr)
        , m_size(0)
        , m_capacity(0)
    {
    }

    Vector(Vector<T, Allocator, glowFactor>&& other)
        : m_buffer(other.m_buffer)
        , m_size(other.m_size)
        , m_capacity(other.m_capacity)
    {
        other.m_buffer = nullptr;
        other.m_size = 0;
        other.m_capacity = 0;
    }

    Vector(const Vector<T, Allocator, glowFactor>& other)
        : m_buffer(nullptr)
        , m_size(0)
        , m_capacity(0)
    {
        copyFrom(other);
    }

    const Vector<T, Allocator, glowFactor>& operator=(const Vector<T, Allocator, glowFactor>& other)
    {
        if (&other == this)
            return *this;

        clear();
        copyFrom(other);
        return *this;
    }

    ~Vector()
    {
        clear();
    }

    void push_back(const T& val)
    {
        if (m_capacity <= m_size) {
            reserve(computeAllocateSize(m_size + 1));
        }
        new (&m_buffer[m_size]) T(val);
        m_size++;
    }

    void erase(size_t pos)
    {
        ASSERT(pos < m_size);
        for (size_t i = pos + 1; i < m_size; i++) {
            m_buffer[i - 1] = m_buffer[i];
        }
        m_size--;
        // drop the stale tail copy so the collector does not see it
        memset(static_cast<void*>(&m_buffer[m_size]), 0, sizeof(T));
    }

    void reserve(size_t newCapacity)
    {
        if (newCapacity <= m_capacity) {
            return;
        }
        T* newBuffer = Allocator().allocate(newCapacity);
        if (m_buffer) {
            VectorCopier<T>::copy(newBuffer, m_buffer, m_size);
            Allocator().deallocate(m_buffer, m_capacity);
        }
        m_buffer = newBuffer;
        m_capacity = newCapacity;
    }

    void clear()
    {
        if (m_buffer) {
            Allocator().deallocate(m_buffer, m_capacity);
        }
        m_buffer = nullptr;
        m_size = 0;
        m_capacity = 0;
    }

    size_t size() const
    {
        return m_size;
    }

    T& operator[](const size_t idx)
    {
        ASSERT(idx < m_size);
        return m_buffer[idx];
    }

    const T& operator[](const size_t idx) const
    {
        ASSERT(idx < m_size);
        return m_buffer[idx];
    }

    T* data()
    {
        return m_buffer;
    }

    const T* data() const
    {
        return m_buffer;
    }

private:
    void copyFrom(const Vector<T, Allocator, glowFactor>& other)
    {
        if (other.m_size) {
            reserve(other.m_size);
            VectorCopier<T>::copy(m_buffer, other.m_buffer, other.m_size);
            m_size = other.m_size;
        }
    }

    static size_t computeAllocateSize(size_t siz)
    {
        return std::max(siz, (siz * glowFactor) / 100 + 1);
    }

    T* m_buffer;
    size_t m_size;
    size_t m_capacity;
};
} // namespace Conch

#endif
