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

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/status.h"
#include "common/statusor.h"

namespace vshred {

// Scalar types a shredded typed_value may hold.
struct StringType {
    bool operator==(const StringType&) const = default;
};

enum class IntegralSize : uint8_t { BYTE = 8, SHORT = 16, INT = 32, LONG = 64 };

struct IntegralType {
    IntegralSize size;

    int bit_width() const { return static_cast<int>(size); }

    bool operator==(const IntegralType&) const = default;
};

struct FloatType {
    bool operator==(const FloatType&) const = default;
};

struct DoubleType {
    bool operator==(const DoubleType&) const = default;
};

struct BooleanType {
    bool operator==(const BooleanType&) const = default;
};

struct BinaryType {
    bool operator==(const BinaryType&) const = default;
};

// Variant decimals are stored as DECIMAL4, DECIMAL8 or DECIMAL16, so the precision is bounded by 38.
struct DecimalType {
    static constexpr int32_t kMaxPrecision = 38;

    int32_t precision;
    int32_t scale;

    bool operator==(const DecimalType&) const = default;
};

struct DateType {
    bool operator==(const DateType&) const = default;
};

// Timestamp with time zone (UTC adjusted).
struct TimestampType {
    bool operator==(const TimestampType&) const = default;
};

// Timestamp without time zone.
struct TimestampNTZType {
    bool operator==(const TimestampNTZType&) const = default;
};

struct UuidType {
    bool operator==(const UuidType&) const = default;
};

using ScalarType = std::variant<StringType, IntegralType, FloatType, DoubleType, BooleanType, BinaryType, DecimalType,
                                DateType, TimestampType, TimestampNTZType, UuidType>;

// e.g. "string", "int32", "decimal(10,2)", "timestamp_ntz"
std::string scalar_type_to_string(const ScalarType& type);

class VariantSchema;

// One named field of a shredded object. The field exclusively owns its schema.
struct ObjectField {
    ObjectField(std::string name, std::unique_ptr<VariantSchema> field_schema);

    ObjectField(ObjectField&&) noexcept;
    ObjectField& operator=(ObjectField&&) noexcept;
    ~ObjectField();

    std::string field_name;
    std::unique_ptr<VariantSchema> schema;
};

using ObjectFields = std::vector<ObjectField>;

// VariantSchema describes how a variant value is shredded, following
// https://github.com/apache/parquet-format/blob/master/VariantShredding.md.
//
// A node has a `value` slot holding the variant encoded fallback and an optional
// `typed_value` slot. If the typed_value is an array or an object, the node recursively
// holds the shredding schema of the elements or of every field. The top level node also
// has a `metadata` slot with the field-name dictionary, nested nodes never do.
//
// Slot indices are the positions of the present slots in the physical group. A slot
// that is not present has index kInvalidIdx, present slots are numbered contiguously
// from 0, so num_fields() is always the number of present slots.
//
// A schema is built bottom-up by create() and is immutable afterwards, except for
// promote_to_typed(). Once built it can be read concurrently without synchronization.
class VariantSchema {
public:
    static constexpr int32_t kInvalidIdx = -1;

    using FieldIndexMap = phmap::flat_hash_map<std::string, size_t>;

    ~VariantSchema();

    VariantSchema(const VariantSchema&) = delete;
    VariantSchema& operator=(const VariantSchema&) = delete;

    // Builds a node from explicit slot indices. At most one of `scalar_schema`, `object_schema`
    // and `array_schema` may be given, and only together with a typed_value slot. A typed_value
    // slot without any payload is accepted: the physical column then decides its kind, and it is
    // the shape promote_to_typed() gives an unshredded node.
    // Returns InvalidSchema if any structural rule is violated.
    static StatusOr<std::unique_ptr<VariantSchema>> create(int32_t typed_idx, int32_t value_idx,
                                                           int32_t top_level_metadata_idx, int32_t num_fields,
                                                           std::optional<ScalarType> scalar_schema,
                                                           std::optional<ObjectFields> object_schema,
                                                           std::unique_ptr<VariantSchema> array_schema);

    // The helpers below lay the slots out as metadata, value, typed_value, skipping the
    // slots that are not present. `top_level` adds the metadata slot, `with_value` the
    // value slot.
    static StatusOr<std::unique_ptr<VariantSchema>> create_unshredded(bool top_level);
    static StatusOr<std::unique_ptr<VariantSchema>> create_scalar(ScalarType type, bool top_level,
                                                                  bool with_value = true);
    static StatusOr<std::unique_ptr<VariantSchema>> create_object(ObjectFields fields, bool top_level,
                                                                  bool with_value = true);
    static StatusOr<std::unique_ptr<VariantSchema>> create_array(std::unique_ptr<VariantSchema> element,
                                                                 bool top_level, bool with_value = true);

    // Turns the node into a typed node: the typed_value slot moves to `typed_idx`, the value
    // slot is dropped and the metadata of the object field names is (re)computed. Scalar and
    // array nodes get the metadata of an empty dictionary. The node is left untouched on error.
    Status promote_to_typed(int32_t typed_idx);

    // The metadata computed by the last promote_to_typed(), Uninitialized if never promoted.
    // The view points into this node and is invalidated by the next promote_to_typed() or by
    // destroying the node; copy it to keep it longer.
    StatusOr<std::string_view> metadata() const;

    // Whether the variant is stored entirely in the top level value slot. Readers can skip
    // the shredding logic for such columns.
    bool is_unshredded() const { return _top_level_metadata_idx >= 0 && _value_idx >= 0 && _typed_idx < 0; }

    // Position of `name` in object_schema(), nullopt if unknown or if this is not an object.
    std::optional<size_t> field_position(std::string_view name) const;

    int32_t typed_idx() const { return _typed_idx; }
    int32_t value_idx() const { return _value_idx; }
    int32_t top_level_metadata_idx() const { return _top_level_metadata_idx; }
    int32_t num_fields() const { return _num_fields; }

    bool is_root() const { return _top_level_metadata_idx >= 0; }
    bool has_typed_value() const { return _typed_idx >= 0; }
    bool has_value() const { return _value_idx >= 0; }

    bool is_scalar() const { return _scalar_schema.has_value(); }
    bool is_object() const { return _object_schema.has_value(); }
    bool is_array() const { return _array_schema != nullptr; }

    const std::optional<ScalarType>& scalar_schema() const { return _scalar_schema; }
    const std::optional<ObjectFields>& object_schema() const { return _object_schema; }
    const VariantSchema* array_schema() const { return _array_schema.get(); }

    // Number of nested levels, 1 for a node without array or object children.
    int32_t depth() const { return _depth; }
    // Number of object fields in this subtree.
    int32_t width() const { return _width; }

    std::string to_string() const;

private:
    VariantSchema(int32_t typed_idx, int32_t value_idx, int32_t top_level_metadata_idx, int32_t num_fields,
                  std::optional<ScalarType> scalar_schema, std::optional<ObjectFields> object_schema,
                  FieldIndexMap object_schema_map, std::unique_ptr<VariantSchema> array_schema, int32_t depth,
                  int32_t width);

    int32_t _typed_idx;
    int32_t _value_idx;
    const int32_t _top_level_metadata_idx;
    int32_t _num_fields;

    const std::optional<ScalarType> _scalar_schema;
    const std::optional<ObjectFields> _object_schema;
    // field name -> index into _object_schema, built once with _object_schema.
    const FieldIndexMap _object_schema_map;
    const std::unique_ptr<VariantSchema> _array_schema;

    const int32_t _depth;
    const int32_t _width;

    std::optional<std::string> _metadata;
};

inline std::ostream& operator<<(std::ostream& os, const VariantSchema& schema) {
    return os << schema.to_string();
}

} // namespace vshred
