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
#include "ObjectStructure.h"

namespace Conch {

size_t ObjectStructure::findProperty(const ObjectPropertyName& name) const
{
    if (m_propertyNameMap) {
        auto iter = m_propertyNameMap->find(name);
        if (iter == m_propertyNameMap->end()) {
            return SIZE_MAX;
        }
        return iter->second;
    }

    size_t size = m_properties.size();
    for (size_t i = 0; i < size; i++) {
        if (m_properties[i].m_propertyName == name) {
            return i;
        }
    }
    return SIZE_MAX;
}

void ObjectStructure::addProperty(const ObjectPropertyName& name, const ObjectPropertyDescriptor& desc)
{
    ASSERT(findProperty(name) == SIZE_MAX);
    m_properties.push_back(ObjectStructureItem(name, desc));

    if (m_propertyNameMap) {
        m_propertyNameMap->insert(std::make_pair(name, m_properties.size() - 1));
    } else if (m_properties.size() >= CONCH_OBJECT_STRUCTURE_ACCESS_CACHE_BUILD_MIN_SIZE) {
        buildPropertyNameMap();
    }
}

void ObjectStructure::replaceProperty(size_t idx, const ObjectPropertyDescriptor& desc)
{
    ObjectStructureItem& item = m_properties[idx];
    item = ObjectStructureItem(item.m_propertyName, desc);
}

void ObjectStructure::removeProperty(size_t idx)
{
    ObjectPropertyName name = m_properties[idx].m_propertyName;
    m_properties.erase(idx);

    if (m_propertyNameMap) {
        m_propertyNameMap->erase(name);
        for (auto iter = m_propertyNameMap->begin(); iter != m_propertyNameMap->end(); ++iter) {
            if (iter->second > idx) {
                iter.value()--;
            }
        }
    }
}

void ObjectStructure::buildPropertyNameMap()
{
    ASSERT(!m_propertyNameMap);
    PropertyNameMapWithCache* map = new PropertyNameMapWithCache();
    size_t size = m_properties.size();
    map->reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        map->insert(std::make_pair(m_properties[i].m_propertyName, i));
    }
    m_propertyNameMap = map;
}
} // namespace Conch
