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

#ifndef __ConchAllocator__
#define __ConchAllocator__

namespace Conch {

// container allocator for buffers that may hold pointers into the gc heap
// the collector scans these buffers, so they keep their elements alive
template <typename T>
class gc_malloc_allocator {
public:
    typedef T value_type;
    typedef T* pointer;
    typedef const T* const_pointer;
    typedef T& reference;
    typedef const T& const_reference;
    typedef size_t size_type;
    typedef ptrdiff_t difference_type;

    template <typename U>
    struct rebind {
        typedef gc_malloc_allocator<U> other;
    };

    gc_malloc_allocator() {}
    template <typename U>
    gc_malloc_allocator(const gc_malloc_allocator<U>&)
    {
    }

    T* allocate(size_type n, const void* = nullptr)
    {
        return static_cast<T*>(GC_MALLOC(sizeof(T) * n));
    }

    void deallocate(T* p, size_type)
    {
        GC_FREE(p);
    }

    size_type max_size() const
    {
        return SIZE_MAX / sizeof(T);
    }

    bool operator==(const gc_malloc_allocator&) const
    {
        return true;
    }

    bool operator!=(const gc_malloc_allocator&) const
    {
        return false;
    }
};
} // namespace Conch

#endif
