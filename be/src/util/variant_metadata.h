// Copyright 2021-present StarRocks, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/status.h"
#include "common/statusor.h"

namespace vshred {

/**
 * Read-only view of a Variant metadata dictionary.
 *
 *                 7     6  5   4  3             0
 *                +-------+---+---+---------------+
 * header         |       |   |   |    version    |
 *                +-------+---+---+---------------+
 *                    ^         ^
 *                    |         +-- sorted_strings
 *                    +-- offset_size_minus_one
 *
 * header, dictionary_size, dictionary_size + 1 offsets, then the concatenated key bytes.
 * dictionary_size and all offsets are little endian unsigned integers of offset_size bytes.
 */
class VariantMetadata {
public:
    // The caller must guarantee that `metadata` has been validated, see create().
    explicit VariantMetadata(std::string_view metadata);

    // Validates the header and the offset table and returns a view over `metadata`.
    static StatusOr<VariantMetadata> create(std::string_view metadata);

    uint8_t header() const;
    uint8_t version() const;
    bool is_sorted_and_unique() const;
    uint8_t offset_size() const;
    // indicating the number of strings in the dictionary
    uint32_t dict_size() const { return _dict_size; }
    // return the field name for the index
    StatusOr<std::string_view> get_key(uint32_t index) const;
    // return the index for the key in the dictionary, if any
    std::optional<uint32_t> get_index(std::string_view key) const;

    // return the metadata raw string view
    std::string_view raw() const { return _metadata; }

    static constexpr char kEmptyMetadataChars[] = {0x1, 0x0, 0x0};
    static constexpr std::string_view kEmptyMetadata{kEmptyMetadataChars, sizeof(kEmptyMetadataChars)};

    static constexpr uint8_t kVersionMask = 0b1111;
    static constexpr uint8_t kSupportedVersion = 1;
    static constexpr size_t kHeaderSizeBytes = 1;
    static constexpr uint8_t kSortedStringMask = 0b10000;
    static constexpr uint8_t kOffsetSizeBitShift = 6;
    static constexpr uint8_t kOffsetSizeMask = 0b11;

    bool operator==(const VariantMetadata& other) const { return _metadata == other._metadata; }

private:
    uint32_t read_offset(uint32_t index) const;

    std::string_view _metadata;
    uint32_t _dict_size{0};
};

// Builds the canonical metadata dictionary of a set of field names.
//
// The result only depends on the set of names: duplicates collapse, input order is
// irrelevant, and keys are stored sorted with the smallest offset size that fits.
class VariantMetadataBuilder {
public:
    static StatusOr<std::string> build(const std::vector<std::string_view>& keys);

    static StatusOr<std::string> build(const std::vector<std::string>& keys);

    inline static uint8_t minimal_uint_size(uint32_t value) {
        if (value <= 0xFF) return 1;
        if (value <= 0xFFFF) return 2;
        if (value <= 0xFFFFFF) return 3;
        return 4;
    }

    inline static void append_uint_le(std::string* out, uint32_t value, uint8_t size) {
        for (uint8_t i = 0; i < size; ++i) {
            out->push_back(static_cast<char>((value >> (i * 8)) & 0xFF));
        }
    }
};

} // namespace vshred
