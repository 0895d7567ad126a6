/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace dsk::dnssd {

/// Simple typedef for representing a TXT record.
using TxtRecord = std::map<std::string, std::string>;

/**
 * Extracts the keys and values from the RDATA of a DNS-SD TXT record, which is a sequence of length prefixed
 * "key=value" strings.
 *  - Entries without '=' become keys with an empty value.
 *  - Keys are compared case-insensitively and the first occurrence of a key wins.
 *  - Empty entries and entries with an empty key are skipped.
 *  - Parsing stops at an entry which runs past the end of the data.
 * @param data Pointer to the RDATA.
 * @param size The number of bytes in data.
 * @return The keys and values.
 */
TxtRecord parse_txt_record(const uint8_t* data, size_t size);

/**
 * Finds a key case-insensitively.
 * @param txt The record.
 * @param key The key.
 * @return The value, or nullopt when the key is not present.
 */
std::optional<std::string> txt_record_find(const TxtRecord& txt, const std::string& key);

/**
 * @param txt The record.
 * @return A description of the record for logging: "{key=value, key=value}".
 */
std::string txt_record_to_string(const TxtRecord& txt);

}  // namespace dsk::dnssd
