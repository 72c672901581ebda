/** LeaseJson definitions file
 *  Description: Escaping for the strings interpolated into the hand built json bodies of the lease registry.
 *  @file leasejson.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <string>

namespace leaseio {

    /***
     * Escapes a value for use inside a json string literal. Quotes, backslashes and control characters
     * are escaped, every other byte is copied unchanged.
     * @param value the raw string
     * @return the escaped string, without surrounding quotes
     */
    inline std::string json_escape(const std::string &value) {
        static const char hexdigits[] = "0123456789abcdef";
        std::string escaped;
        escaped.reserve(value.size());

        for (const char c : value) {
            switch (c) {
                case '"':
                    escaped.append("\\\"");
                    break;
                case '\\':
                    escaped.append("\\\\");
                    break;
                case '\b':
                    escaped.append("\\b");
                    break;
                case '\f':
                    escaped.append("\\f");
                    break;
                case '\n':
                    escaped.append("\\n");
                    break;
                case '\r':
                    escaped.append("\\r");
                    break;
                case '\t':
                    escaped.append("\\t");
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        escaped.append("\\u00");
                        escaped.push_back(hexdigits[(static_cast<unsigned char>(c) >> 4) & 0xf]);
                        escaped.push_back(hexdigits[static_cast<unsigned char>(c) & 0xf]);
                    } else {
                        escaped.push_back(c);
                    }
            }
        }
        return escaped;
    }
}
