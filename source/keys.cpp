// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// keys.cpp - List key rendering

#include <ydelta/keys.h>
#include <ydelta/errors.h>
#include <ydelta/path.h>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace ydelta {

std::string key_value_as_string(const LeafValue& val)
{
    const LeafValue& v = val.unwrapped();
    return std::visit([&](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, EnumValue>) {
            if (auto name = arg.name()) {
                return *name;
            }
            throw DiffError(DiffErrorCode::KeyStringFailure,
                            "cannot map enumerated value " + std::to_string(arg.value) + " to a name");
        } else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Binary>) {
            return base64_encode(arg);
        } else {
            throw DiffError(DiffErrorCode::KeyStringFailure,
                            "cannot convert key value " + value_to_string(v) + " to a string");
        }
    }, v.data);
}

std::map<std::string, std::string> key_strings(const Record& entry)
{
    std::map<std::string, std::string> result;
    for (const auto& [name, value] : entry.key_map()) {
        try {
            result.emplace(name, key_value_as_string(value));
        } catch (const DiffError& e) {
            throw e.wrap("cannot convert keys to strings for " + entry.schema->name + ", key " + name);
        }
    }
    return result;
}

std::string list_key_string(const Record& entry)
{
    return key_predicate_string(key_strings(entry));
}

// ============================================================
// Base64 (binary keys)
// ============================================================

std::string base64_encode(const Binary& data)
{
    using namespace boost::archive::iterators;
    using encoder = base64_from_binary<transform_width<Binary::const_iterator, 6, 8>>;

    std::string out(encoder(data.begin()), encoder(data.end()));
    out.append((3 - data.size() % 3) % 3, '=');
    return out;
}

Binary base64_decode(std::string_view text)
{
    using namespace boost::archive::iterators;
    using decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    if (text.size() % 4 != 0) {
        throw DiffError(DiffErrorCode::ValueDecodingFailure,
                        "invalid base64 length " + std::to_string(text.size()));
    }

    std::string padded(text);
    const auto pad = static_cast<std::size_t>(
        std::distance(padded.rbegin(),
                      std::find_if(padded.rbegin(), padded.rend(), [](char c) { return c != '='; })));
    if (pad > 2) {
        throw DiffError(DiffErrorCode::ValueDecodingFailure, "invalid base64 padding in '" + padded + "'");
    }
    std::replace(padded.end() - static_cast<std::ptrdiff_t>(pad), padded.end(), '=', 'A');

    try {
        Binary out(decoder(padded.cbegin()), decoder(padded.cend()));
        out.resize(out.size() - pad);
        return out;
    } catch (const dataflow_exception& e) {
        throw DiffError(DiffErrorCode::ValueDecodingFailure,
                        "invalid base64 '" + std::string(text) + "': " + e.what());
    }
}

} // namespace ydelta
