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

#include "util/variant_metadata.h"

#include <fmt/format.h>
#include <simdutf.h>

#include <algorithm>
#include <limits>

#include "common/logging.h"

namespace vshred {

static inline uint32_t read_little_endian_unsigned32(const char* data, uint8_t size) {
    DCHECK_LE(size, 4);
    DCHECK_GE(size, 1);
    uint32_t result = 0;
    for (uint8_t i = 0; i < size; ++i) {
        result |= static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << (i * 8);
    }
    return result;
}

VariantMetadata::VariantMetadata(std::string_view metadata) : _metadata(metadata) {
    DCHECK_GE(_metadata.size(), kHeaderSizeBytes + 1);
    _dict_size = read_little_endian_unsigned32(_metadata.data() + kHeaderSizeBytes, offset_size());
}

StatusOr<VariantMetadata> VariantMetadata::create(std::string_view metadata) {
    if (metadata.size() < kHeaderSizeBytes) {
        return Status::VariantError("Variant metadata is empty");
    }
    const auto header = static_cast<uint8_t>(metadata[0]);
    if ((header & kVersionMask) != kSupportedVersion) {
        return Status::VariantError(
                fmt::format("Unsupported variant metadata version: {}", static_cast<int>(header & kVersionMask)));
    }
    const uint8_t offset_sz = ((header >> kOffsetSizeBitShift) & kOffsetSizeMask) + 1;
    if (metadata.size() < kHeaderSizeBytes + offset_sz) {
        return Status::VariantError("Variant metadata is too short to hold the dictionary size");
    }
    const uint32_t dict_sz = read_little_endian_unsigned32(metadata.data() + kHeaderSizeBytes, offset_sz);
    // header + dictionary_size + (dictionary_size + 1) offsets
    const uint64_t strings_start =
            kHeaderSizeBytes + static_cast<uint64_t>(offset_sz) * (static_cast<uint64_t>(dict_sz) + 2);
    if (metadata.size() < strings_start) {
        return Status::VariantError(fmt::format("Variant metadata is too short for {} dictionary offsets",
                                                static_cast<uint64_t>(dict_sz) + 1));
    }
    const char* offset_base = metadata.data() + kHeaderSizeBytes + offset_sz;
    uint32_t prev_offset = read_little_endian_unsigned32(offset_base, offset_sz);
    if (prev_offset != 0) {
        return Status::VariantError("Variant metadata first offset must be 0");
    }
    for (uint32_t i = 1; i <= dict_sz; ++i) {
        uint32_t offset =
                read_little_endian_unsigned32(offset_base + static_cast<size_t>(i) * offset_sz, offset_sz);
        if (offset < prev_offset) {
            return Status::VariantError("Variant metadata offsets are not monotonic");
        }
        prev_offset = offset;
    }
    if (strings_start + prev_offset > metadata.size()) {
        return Status::VariantError("Variant string out of range");
    }
    return VariantMetadata(metadata);
}

uint8_t VariantMetadata::header() const {
    return static_cast<uint8_t>(_metadata[0]);
}

uint8_t VariantMetadata::version() const {
    return header() & kVersionMask;
}

bool VariantMetadata::is_sorted_and_unique() const {
    return (header() & kSortedStringMask) != 0;
}

uint8_t VariantMetadata::offset_size() const {
    return ((header() >> kOffsetSizeBitShift) & kOffsetSizeMask) + 1;
}

uint32_t VariantMetadata::read_offset(uint32_t index) const {
    const uint8_t offset_sz = offset_size();
    const size_t pos = kHeaderSizeBytes + static_cast<size_t>(offset_sz) * (static_cast<size_t>(index) + 1);
    return read_little_endian_unsigned32(_metadata.data() + pos, offset_sz);
}

StatusOr<std::string_view> VariantMetadata::get_key(uint32_t index) const {
    if (index >= _dict_size) {
        return Status::VariantError(fmt::format("Variant index out of range: {} >= {}", index, _dict_size));
    }
    const uint8_t offset_sz = offset_size();
    uint32_t value_offset = read_offset(index);
    uint32_t value_next_offset = read_offset(index + 1);
    size_t string_start =
            kHeaderSizeBytes + static_cast<size_t>(offset_sz) * (static_cast<size_t>(_dict_size) + 2) + value_offset;
    if (value_next_offset < value_offset || string_start + (value_next_offset - value_offset) > _metadata.size()) {
        return Status::VariantError("Variant string out of range");
    }
    return std::string_view(_metadata.data() + string_start, value_next_offset - value_offset);
}

std::optional<uint32_t> VariantMetadata::get_index(std::string_view key) const {
    if (is_sorted_and_unique()) {
        uint32_t lo = 0;
        uint32_t hi = _dict_size;
        while (lo < hi) {
            uint32_t mid = lo + (hi - lo) / 2;
            auto mid_key = get_key(mid);
            if (!mid_key.ok()) {
                return std::nullopt;
            }
            int cmp = mid_key.value().compare(key);
            if (cmp == 0) {
                return mid;
            } else if (cmp < 0) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        return std::nullopt;
    }

    for (uint32_t i = 0; i < _dict_size; ++i) {
        auto candidate = get_key(i);
        if (candidate.ok() && candidate.value() == key) {
            return i;
        }
    }
    return std::nullopt;
}

StatusOr<std::string> VariantMetadataBuilder::build(const std::vector<std::string_view>& keys) {
    if (keys.empty()) {
        return std::string(VariantMetadata::kEmptyMetadata);
    }

    std::vector<std::string_view> sorted_keys(keys.begin(), keys.end());
    std::sort(sorted_keys.begin(), sorted_keys.end());
    sorted_keys.erase(std::unique(sorted_keys.begin(), sorted_keys.end()), sorted_keys.end());

    uint32_t total_string_size = 0;
    for (const auto& key : sorted_keys) {
        if (!simdutf::validate_utf8(key.data(), key.size())) {
            return Status::VariantError(fmt::format("Variant metadata key is not valid UTF-8, size={}", key.size()));
        }
        if (key.size() > std::numeric_limits<uint32_t>::max() - total_string_size) {
            return Status::VariantError("Variant metadata string size overflow");
        }
        total_string_size += static_cast<uint32_t>(key.size());
    }

    const auto dict_size = static_cast<uint32_t>(sorted_keys.size());
    const uint32_t max_value = std::max(dict_size, total_string_size);
    const uint8_t offset_size = minimal_uint_size(max_value);

    uint8_t header = VariantMetadata::kSupportedVersion;
    header |= VariantMetadata::kSortedStringMask;
    header |= static_cast<uint8_t>((offset_size - 1) << VariantMetadata::kOffsetSizeBitShift);

    std::string metadata;
    metadata.reserve(1 + offset_size * (dict_size + 2) + total_string_size);
    metadata.push_back(static_cast<char>(header));
    append_uint_le(&metadata, dict_size, offset_size);

    uint32_t offset = 0;
    append_uint_le(&metadata, offset, offset_size);
    for (const auto& key : sorted_keys) {
        offset += static_cast<uint32_t>(key.size());
        append_uint_le(&metadata, offset, offset_size);
    }
    for (const auto& key : sorted_keys) {
        metadata.append(key.data(), key.size());
    }

    VLOG_METADATA << "built variant metadata, dict_size=" << dict_size << ", offset_size=" << (int)offset_size
                  << ", bytes=" << metadata.size();
    return metadata;
}

StatusOr<std::string> VariantMetadataBuilder::build(const std::vector<std::string>& keys) {
    std::vector<std::string_view> views(keys.begin(), keys.end());
    return build(views);
}

} // namespace vshred
