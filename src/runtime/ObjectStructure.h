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

#ifndef __ConchObjectStructure__
#define __ConchObjectStructure__

#include "runtime/ObjectPropertyName.h"
#include "runtime/ObjectPropertyDescriptor.h"
#include "util/Vector.h"

namespace Conch {

struct ObjectStructureItem {
    ObjectStructureItem(const ObjectPropertyName& name, const ObjectPropertyDescriptor& desc)
        : m_propertyName(name)
        , m_attribute(desc.attribute())
        , m_isDataProperty(desc.isDataDescriptor())
        , m_value(encodeSlot(desc))
    {
    }

    bool isDataProperty() const
    {
        return m_isDataProperty;
    }

    // accessor slots hold a JSGetterSetter owned by this item
    JSGetterSetter* getterSetter() const
    {
        ASSERT(!m_isDataProperty);
        return m_value.asPointerValue()->asJSGetterSetter();
    }

    ObjectPropertyDescriptor descriptor() const
    {
        if (m_isDataProperty) {
            return ObjectPropertyDescriptor(m_value, m_attribute);
        }
        return ObjectPropertyDescriptor(*getterSetter(), m_attribute);
    }

    static Value encodeSlot(const ObjectPropertyDescriptor& desc)
    {
        if (desc.isDataDescriptor()) {
            return desc.value();
        }
        return Value(new JSGetterSetter(desc.getterSetter()));
    }

    ObjectPropertyName m_propertyName;
    ObjectPropertyDescriptor::PresentAttribute m_attribute;
    bool m_isDataProperty;
    Value m_value;
};

typedef Vector<ObjectStructureItem, gc_malloc_allocator<ObjectStructureItem>> ObjectStructureItemVector;

typedef HashMap<ObjectPropertyName, size_t, std::hash<ObjectPropertyName>, std::equal_to<ObjectPropertyName>,
                gc_malloc_allocator<std::pair<ObjectPropertyName, size_t>>>
    PropertyNameMap;

class PropertyNameMapWithCache : public PropertyNameMap, public gc {
};

// own property table of one Object
// keeps insertion order, lookups switch to a hash index once the table is large
class ObjectStructure {
public:
    ObjectStructure()
        : m_propertyNameMap(nullptr)
    {
    }

    size_t propertyCount() const
    {
        return m_properties.size();
    }

    const ObjectStructureItem& readProperty(size_t idx) const
    {
        return m_properties[idx];
    }

    // returns SIZE_MAX when name is not an own property
    size_t findProperty(const ObjectPropertyName& name) const;

    void addProperty(const ObjectPropertyName& name, const ObjectPropertyDescriptor& desc);
    void replaceProperty(size_t idx, const ObjectPropertyDescriptor& desc);
    void removeProperty(size_t idx);

private:
    void buildPropertyNameMap();

    ObjectStructureItemVector m_properties;
    PropertyNameMapWithCache* m_propertyNameMap;
};
} // namespace Conch

#endif
