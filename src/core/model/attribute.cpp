#include "attribute.hpp"
#include "identity.hpp"
#include "json_fields.hpp"
#include "polygraph/error.hpp"
#include <algorithm>

namespace polygraph::model {

bool Attribute::add_morph(const std::string& morph_id) {
    if (std::find(morph_ids.begin(), morph_ids.end(), morph_id) != morph_ids.end()) {
        return false;
    }
    morph_ids.push_back(morph_id);
    return true;
}

bool Attribute::operator==(const Attribute& other) const {
    return id == other.id &&
           source_id == other.source_id &&
           name == other.name &&
           value == other.value &&
           adverb == other.adverb &&
           unit == other.unit &&
           modality == other.modality &&
           morph_ids == other.morph_ids &&
           deleted == other.deleted &&
           kind == other.kind &&
           function == other.function;
}

Attribute create_attribute(const std::string& source_id,
                           const std::string& name,
                           const std::string& value,
                           const AttributeOptions& options) {
    if (is_blank(name)) {
        throw InvalidNameError("Attribute name must not be empty");
    }

    Attribute attribute;
    attribute.id = options.id && !options.id->empty()
        ? *options.id
        : derive_attribute_id(source_id, name, value);
    attribute.source_id = source_id;
    attribute.name = name;
    attribute.value = value;
    attribute.adverb = options.adverb;
    attribute.unit = options.unit;
    attribute.modality = options.modality;
    return attribute;
}

Attribute create_function_attribute(const std::string& source_id,
                                    const std::string& name,
                                    const std::string& value,
                                    const std::string& expression,
                                    const AttributeOptions& options) {
    Attribute attribute = create_attribute(source_id, name, value, options);
    attribute.kind = AttributeKind::FUNCTION;
    attribute.function = FunctionPayload{expression, true};
    return attribute;
}

const char* attribute_kind_to_string(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::ATTRIBUTE: return "attribute";
        case AttributeKind::FUNCTION: return "function";
    }
    return "attribute";
}

void to_json(nlohmann::json& j, const Attribute& attribute) {
    j = nlohmann::json::object();
    j["id"] = attribute.id;
    j["kind"] = attribute_kind_to_string(attribute.kind);
    j["source_id"] = attribute.source_id;
    j["name"] = attribute.name;
    j["value"] = attribute.value;
    detail::put_optional(j, "adverb", attribute.adverb);
    detail::put_optional(j, "unit", attribute.unit);
    detail::put_optional(j, "modality", attribute.modality);
    j["morph_ids"] = attribute.morph_ids;
    j["deleted"] = attribute.deleted;
    if (attribute.function) {
        j["expression"] = attribute.function->expression;
        j["is_derived"] = attribute.function->is_derived;
    }
}

void from_json(const nlohmann::json& j, Attribute& attribute) {
    if (!j.is_object()) {
        throw PolygraphException(ErrorCode::DeserializationFailed, "Attribute record is not an object");
    }
    attribute.id = detail::get_string(j, "id");
    attribute.source_id = detail::get_string(j, "source_id");
    attribute.name = detail::get_string(j, "name");
    attribute.value = detail::get_string(j, "value");
    attribute.adverb = detail::get_optional(j, "adverb");
    attribute.unit = detail::get_optional(j, "unit");
    attribute.modality = detail::get_optional(j, "modality");
    attribute.morph_ids = detail::get_string_list(j, "morph_ids");
    attribute.deleted = detail::get_bool(j, "deleted");

    bool has_expression = j.contains("expression") && j["expression"].is_string();
    if (detail::get_string(j, "kind") == "function" || has_expression) {
        attribute.kind = AttributeKind::FUNCTION;
        FunctionPayload payload;
        payload.expression = detail::get_string(j, "expression");
        auto derived_it = j.find("is_derived");
        payload.is_derived = derived_it == j.end() || !derived_it->is_boolean() || derived_it->get<bool>();
        attribute.function = payload;
    } else {
        attribute.kind = AttributeKind::ATTRIBUTE;
        attribute.function.reset();
    }
}

} // namespace polygraph::model
