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

#include "types/variant_schema.h"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "common/config.h"
#include "common/logging.h"
#include "util/variant_metadata.h"

namespace vshred {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string scalar_type_to_string(const ScalarType& type) {
    return std::visit(overloaded{[](const StringType&) -> std::string { return "string"; },
                                 [](const IntegralType& t) -> std::string {
                                     return fmt::format("int{}", t.bit_width());
                                 },
                                 [](const FloatType&) -> std::string { return "float"; },
                                 [](const DoubleType&) -> std::string { return "double"; },
                                 [](const BooleanType&) -> std::string { return "boolean"; },
                                 [](const BinaryType&) -> std::string { return "binary"; },
                                 [](const DecimalType& t) -> std::string {
                                     return fmt::format("decimal({},{})", t.precision, t.scale);
                                 },
                                 [](const DateType&) -> std::string { return "date"; },
                                 [](const TimestampType&) -> std::string { return "timestamp"; },
                                 [](const TimestampNTZType&) -> std::string { return "timestamp_ntz"; },
                                 [](const UuidType&) -> std::string { return "uuid"; }},
                      type);
}

ObjectField::ObjectField(std::string name, std::unique_ptr<VariantSchema> field_schema)
        : field_name(std::move(name)), schema(std::move(field_schema)) {}

ObjectField::ObjectField(ObjectField&&) noexcept = default;
ObjectField& ObjectField::operator=(ObjectField&&) noexcept = default;
ObjectField::~ObjectField() = default;

static Status invalid_schema(const std::string& msg) {
    VLOG_SCHEMA << "reject variant shredding schema: " << msg;
    return Status::InvalidSchema(msg);
}

// Present slot indices must be exactly {0, .., num_fields - 1}.
static Status check_slot_layout(int32_t typed_idx, int32_t value_idx, int32_t metadata_idx, int32_t num_fields) {
    const int32_t slots[] = {typed_idx, value_idx, metadata_idx};
    int32_t present = 0;
    for (int32_t idx : slots) {
        if (idx < VariantSchema::kInvalidIdx) {
            return invalid_schema(fmt::format("slot index must be -1 or non-negative, got {}", idx));
        }
        if (idx >= 0) {
            ++present;
        }
    }
    if (present == 0) {
        return invalid_schema("at least one of value, typed_value and metadata must be present");
    }
    if (num_fields != present) {
        return invalid_schema(fmt::format("num_fields {} does not match {} present slots", num_fields, present));
    }
    bool seen[3] = {false, false, false};
    for (int32_t idx : slots) {
        if (idx < 0) {
            continue;
        }
        if (idx >= num_fields) {
            return invalid_schema(
                    fmt::format("slot index {} is out of range, present slots must be numbered from 0 to {}", idx,
                                num_fields - 1));
        }
        if (seen[idx]) {
            return invalid_schema(fmt::format("slot index {} is used by more than one slot", idx));
        }
        seen[idx] = true;
    }
    return Status::OK();
}

static Status check_scalar_type(const ScalarType& type) {
    if (const auto* decimal = std::get_if<DecimalType>(&type)) {
        if (decimal->precision < 1 || decimal->precision > DecimalType::kMaxPrecision) {
            return invalid_schema(fmt::format("decimal precision must be in [1, {}], got {}",
                                              DecimalType::kMaxPrecision, decimal->precision));
        }
        if (decimal->scale < 0 || decimal->scale > decimal->precision) {
            return invalid_schema(fmt::format("decimal scale must be in [0, {}], got {}", decimal->precision,
                                              decimal->scale));
        }
    }
    return Status::OK();
}

static Status check_nested(const VariantSchema* child, std::string_view what) {
    if (child == nullptr) {
        return invalid_schema(fmt::format("{} has no schema", what));
    }
    if (child->is_root()) {
        return invalid_schema(fmt::format("{} must not have a metadata slot", what));
    }
    return Status::OK();
}

VariantSchema::VariantSchema(int32_t typed_idx, int32_t value_idx, int32_t top_level_metadata_idx,
                             int32_t num_fields, std::optional<ScalarType> scalar_schema,
                             std::optional<ObjectFields> object_schema, FieldIndexMap object_schema_map,
                             std::unique_ptr<VariantSchema> array_schema, int32_t depth, int32_t width)
        : _typed_idx(typed_idx),
          _value_idx(value_idx),
          _top_level_metadata_idx(top_level_metadata_idx),
          _num_fields(num_fields),
          _scalar_schema(std::move(scalar_schema)),
          _object_schema(std::move(object_schema)),
          _object_schema_map(std::move(object_schema_map)),
          _array_schema(std::move(array_schema)),
          _depth(depth),
          _width(width) {}

VariantSchema::~VariantSchema() = default;

StatusOr<std::unique_ptr<VariantSchema>> VariantSchema::create(int32_t typed_idx, int32_t value_idx,
                                                               int32_t top_level_metadata_idx, int32_t num_fields,
                                                               std::optional<ScalarType> scalar_schema,
                                                               std::optional<ObjectFields> object_schema,
                                                               std::unique_ptr<VariantSchema> array_schema) {
    const int num_typed_kinds = static_cast<int>(scalar_schema.has_value()) +
                                static_cast<int>(object_schema.has_value()) + static_cast<int>(array_schema != nullptr);
    if (num_typed_kinds > 1) {
        return invalid_schema("typed_value can only be one of scalar, object and array");
    }
    if (num_typed_kinds == 1 && typed_idx < 0) {
        return invalid_schema("a scalar, object or array schema requires a typed_value slot");
    }
    RETURN_IF_ERROR(check_slot_layout(typed_idx, value_idx, top_level_metadata_idx, num_fields));

    int32_t child_depth = 0;
    int64_t width = 0;
    FieldIndexMap object_schema_map;
    if (scalar_schema.has_value()) {
        RETURN_IF_ERROR(check_scalar_type(*scalar_schema));
    } else if (array_schema != nullptr) {
        RETURN_IF_ERROR(check_nested(array_schema.get(), "array element"));
        child_depth = array_schema->depth();
        width = array_schema->width();
    } else if (object_schema.has_value()) {
        object_schema_map.reserve(object_schema->size());
        for (size_t i = 0; i < object_schema->size(); ++i) {
            const ObjectField& field = (*object_schema)[i];
            RETURN_IF_ERROR(check_nested(field.schema.get(), fmt::format("object field '{}'", field.field_name)));
            if (!object_schema_map.emplace(field.field_name, i).second) {
                return invalid_schema(fmt::format("duplicate object field '{}'", field.field_name));
            }
            child_depth = std::max(child_depth, field.schema->depth());
            width += 1 + field.schema->width();
        }
    }

    const int32_t depth = child_depth + 1;
    // A limit <= 0 disables the check.
    const int32_t max_depth = config::variant_shredding_max_schema_depth;
    const int32_t max_width = config::variant_shredding_max_schema_width;
    if (max_depth > 0 && depth > max_depth) {
        return invalid_schema(
                fmt::format("schema depth {} exceeds variant_shredding_max_schema_depth {}", depth, max_depth));
    }
    if (max_width > 0 && width > max_width) {
        return invalid_schema(fmt::format("schema has {} object fields, exceeds variant_shredding_max_schema_width {}",
                                          width, max_width));
    }

    return std::unique_ptr<VariantSchema>(new VariantSchema(
            typed_idx, value_idx, top_level_metadata_idx, num_fields, std::move(scalar_schema),
            std::move(object_schema), std::move(object_schema_map), std::move(array_schema), depth,
            static_cast<int32_t>(width)));
}

namespace {

struct SlotAssignment {
    int32_t metadata_idx = VariantSchema::kInvalidIdx;
    int32_t value_idx = VariantSchema::kInvalidIdx;
    int32_t typed_idx = VariantSchema::kInvalidIdx;
    int32_t num_fields = 0;
};

SlotAssignment assign_slots(bool top_level, bool with_value, bool with_typed) {
    SlotAssignment slots;
    if (top_level) slots.metadata_idx = slots.num_fields++;
    if (with_value) slots.value_idx = slots.num_fields++;
    if (with_typed) slots.typed_idx = slots.num_fields++;
    return slots;
}

} // namespace

StatusOr<std::unique_ptr<VariantSchema>> VariantSchema::create_unshredded(bool top_level) {
    auto slots = assign_slots(top_level, true, false);
    return create(slots.typed_idx, slots.value_idx, slots.metadata_idx, slots.num_fields, std::nullopt, std::nullopt,
                  nullptr);
}

StatusOr<std::unique_ptr<VariantSchema>> VariantSchema::create_scalar(ScalarType type, bool top_level,
                                                                      bool with_value) {
    auto slots = assign_slots(top_level, with_value, true);
    return create(slots.typed_idx, slots.value_idx, slots.metadata_idx, slots.num_fields, std::move(type),
                  std::nullopt, nullptr);
}

StatusOr<std::unique_ptr<VariantSchema>> VariantSchema::create_object(ObjectFields fields, bool top_level,
                                                                      bool with_value) {
    auto slots = assign_slots(top_level, with_value, true);
    return create(slots.typed_idx, slots.value_idx, slots.metadata_idx, slots.num_fields, std::nullopt,
                  std::move(fields), nullptr);
}

StatusOr<std::unique_ptr<VariantSchema>> VariantSchema::create_array(std::unique_ptr<VariantSchema> element,
                                                                     bool top_level, bool with_value) {
    auto slots = assign_slots(top_level, with_value, true);
    return create(slots.typed_idx, slots.value_idx, slots.metadata_idx, slots.num_fields, std::nullopt,
                  std::nullopt, std::move(element));
}

Status VariantSchema::promote_to_typed(int32_t typed_idx) {
    if (typed_idx < 0) {
        return invalid_schema(fmt::format("typed_value index must be non-negative, got {}", typed_idx));
    }
    const int32_t num_fields = 1 + static_cast<int32_t>(_top_level_metadata_idx >= 0);
    RETURN_IF_ERROR(check_slot_layout(typed_idx, kInvalidIdx, _top_level_metadata_idx, num_fields));

    std::vector<std::string_view> field_names;
    if (_object_schema.has_value()) {
        field_names.reserve(_object_schema->size());
        for (const auto& field : *_object_schema) {
            field_names.emplace_back(field.field_name);
        }
    }
    auto metadata = VariantMetadataBuilder::build(field_names);
    if (!metadata.ok()) {
        LOG(WARNING) << "failed to build metadata of variant shredding schema " << to_string() << ": "
                     << metadata.status();
        return metadata.status();
    }

    _typed_idx = typed_idx;
    _value_idx = kInvalidIdx;
    _num_fields = num_fields;
    _metadata = std::move(metadata).value();
    return Status::OK();
}

StatusOr<std::string_view> VariantSchema::metadata() const {
    if (!_metadata.has_value()) {
        return Status::Uninitialized("metadata of variant shredding schema has not been computed");
    }
    return std::string_view(*_metadata);
}

std::optional<size_t> VariantSchema::field_position(std::string_view name) const {
    auto it = _object_schema_map.find(name);
    if (it == _object_schema_map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string VariantSchema::to_string() const {
    std::string object_schema = "null";
    if (_object_schema.has_value()) {
        object_schema = "[";
        for (size_t i = 0; i < _object_schema->size(); ++i) {
            const ObjectField& field = (*_object_schema)[i];
            if (i > 0) object_schema.append(", ");
            object_schema.append(fmt::format("ObjectField{{field_name={}, schema={}}}", field.field_name,
                                             field.schema->to_string()));
        }
        object_schema.append("]");
    }
    return fmt::format(
            "VariantSchema{{typed_idx={}, value_idx={}, top_level_metadata_idx={}, num_fields={}, scalar_schema={}, "
            "object_schema={}, array_schema={}}}",
            _typed_idx, _value_idx, _top_level_metadata_idx, _num_fields,
            _scalar_schema.has_value() ? scalar_type_to_string(*_scalar_schema) : "null", object_schema,
            _array_schema != nullptr ? _array_schema->to_string() : "null");
}

} // namespace vshred
