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
#include "String.h"

namespace Conch {

String::String(char* buffer, size_t length)
    : m_buffer(buffer)
    , m_length(length)
{
    size_t hash = stringHash((const unsigned char*)buffer, length);
    if (UNLIKELY((hash % sizeof(size_t)) == 0)) {
        hash++;
    }
    m_hash = hash;
}

String* String::fromASCII(const char* s, size_t len)
{
    char* buffer = (char*)GC_MALLOC_ATOMIC(len + 1);
    memcpy(buffer, s, len);
    buffer[len] = 0;
    return new String(buffer, len);
}

String* String::fromUTF8(const char* src, size_t len)
{
    // stored as-is, keys compare by bytes
    return fromASCII(src, len);
}

String* String::fromInt32(int32_t v)
{
    char buf[CONCH_STRING_NUMBER_BUFFER_SIZE];
    int len = snprintf(buf, sizeof(buf), "%d", v);
    return fromASCII(buf, len);
}

String* String::fromDouble(double v)
{
    if (std::isnan(v)) {
        return fromASCII("NaN");
    }
    if (std::isinf(v)) {
        return v > 0 ? fromASCII("Infinity") : fromASCII("-Infinity");
    }
    if (v == 0) {
        return fromASCII("0");
    }
    if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max() && v == (int32_t)v) {
        return fromInt32((int32_t)v);
    }

    // shortest digits that read back as the same double
    char buf[CONCH_STRING_NUMBER_BUFFER_SIZE];
    int precision = 1;
    while (true) {
        snprintf(buf, sizeof(buf), "%.*e", precision - 1, v);
        if (precision == 17 || strtod(buf, nullptr) == v) {
            break;
        }
        precision++;
    }

    // buf is [-]d[.ddd]e(+|-)dd, split it into digits and decimal exponent
    char digits[CONCH_STRING_NUMBER_BUFFER_SIZE];
    int k = 0;
    const char* p = buf;
    bool isNegative = *p == '-';
    if (isNegative) {
        p++;
    }
    for (; *p != 'e'; p++) {
        if (*p != '.') {
            digits[k++] = *p;
        }
    }
    while (k > 1 && digits[k - 1] == '0') {
        k--;
    }
    // the value is 0.digits * 10^n
    int n = atoi(p + 1) + 1;

    char result[CONCH_STRING_NUMBER_BUFFER_SIZE];
    int len = 0;
    if (isNegative) {
        result[len++] = '-';
    }
    if (k <= n && n <= 21) {
        memcpy(result + len, digits, k);
        len += k;
        for (int i = k; i < n; i++) {
            result[len++] = '0';
        }
    } else if (0 < n && n <= 21) {
        memcpy(result + len, digits, n);
        len += n;
        result[len++] = '.';
        memcpy(result + len, digits + n, k - n);
        len += k - n;
    } else if (-6 < n && n <= 0) {
        result[len++] = '0';
        result[len++] = '.';
        for (int i = n; i < 0; i++) {
            result[len++] = '0';
        }
        memcpy(result + len, digits, k);
        len += k;
    } else {
        result[len++] = digits[0];
        if (k > 1) {
            result[len++] = '.';
            memcpy(result + len, digits + 1, k - 1);
            len += k - 1;
        }
        len += snprintf(result + len, sizeof(result) - len, "e%c%d", n - 1 < 0 ? '-' : '+', std::abs(n - 1));
    }
    return fromASCII(result, len);
}

bool String::equals(const String* src) const
{
    if (this == src) {
        return true;
    }
    if (m_hash != src->m_hash) {
        return false;
    }
    return equals(src->m_buffer, src->m_length);
}
} // namespace Conch
