/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/txt_record.hpp"

#include "discoverykit/core/log.hpp"
#include "discoverykit/core/string.hpp"

#include <set>

dsk::dnssd::TxtRecord dsk::dnssd::parse_txt_record(const uint8_t* data, const size_t size) {
    TxtRecord txt;
    if (data == nullptr) {
        return txt;
    }

    std::set<std::string> seen_keys;  // Lower case
    size_t offset = 0;

    while (offset < size) {
        const size_t length = data[offset];
        offset += 1;

        if (length == 0) {
            continue;
        }

        if (length > size - offset) {
            DSK_WARNING("TXT record truncated at offset {}", offset - 1);
            break;
        }

        const std::string entry(reinterpret_cast<const char*>(data + offset), length);
        offset += length;

        const auto separator = entry.find('=');
        auto key = entry.substr(0, separator);
        if (key.empty()) {
            continue;
        }

        if (!seen_keys.insert(string_to_lower(key)).second) {
            continue;
        }

        txt.emplace(std::move(key), separator == std::string::npos ? std::string() : entry.substr(separator + 1));
    }

    return txt;
}

std::optional<std::string> dsk::dnssd::txt_record_find(const TxtRecord& txt, const std::string& key) {
    for (const auto& [k, v] : txt) {
        if (string_compare_case_insensitive(k, key)) {
            return v;
        }
    }
    return std::nullopt;
}

std::string dsk::dnssd::txt_record_to_string(const TxtRecord& txt) {
    std::string result = "{";
    for (auto it = txt.begin(); it != txt.end(); ++it) {
        if (it != txt.begin()) {
            result += ", ";
        }
        result += it->first;
        result += "=";
        result += it->second;
    }
    result += "}";
    return result;
}
