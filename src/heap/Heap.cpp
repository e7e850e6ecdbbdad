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
#include "Heap.h"

namespace Conch {

static bool g_isInited = false;

void Heap::initialize()
{
    if (g_isInited)
        return;

    GC_INIT();
    GC_set_force_unmap_on_gcollect(1);
    g_isInited = true;
}

void Heap::finalize()
{
    if (!g_isInited)
        return;

    for (size_t i = 0; i < 5; i++) {
        GC_gcollect_and_unmap();
    }
    g_isInited = false;
}

bool Heap::isInitialized()
{
    return g_isInited;
}

void Heap::collect()
{
    ASSERT(g_isInited);
    GC_gcollect();
}

size_t Heap::heapSize()
{
    return GC_get_heap_size();
}

void Heap::printGCHeapUsage()
{
    CONCH_LOG_INFO("[Conch] heap size %zu bytes, free %zu bytes, allocated since last gc %zu bytes\n",
                   GC_get_heap_size(), GC_get_free_bytes(), GC_get_bytes_since_gc());
}
} // namespace Conch
