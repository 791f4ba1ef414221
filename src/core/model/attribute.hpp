#pragma once

#include "polygraph/common.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::model {

// Discriminator of the attribute record
enum class AttributeKind : uint8_t {
    ATTRIBUTE = 0,  // Authored value
    FUNCTION = 1    // Value computed from an expression
};

// Extra fields carried by FUNCTION attributes
struct FunctionPayload {
    std::string expression;
    bool is_derived = true;

    bool operator==(const FunctionPayload& other) const {
        return expression == other.expression && is_derived == other.is_derived;
    }
};

struct AttributeOptions {
    std::optional<std::string> id;
    std::optional<std::string> adverb;
    std::optional<std::string> unit;
    std::optional<std::string> modality;
};

/**
 * Attribute - Named value attached to a source node.
 *
 * Plain attributes and functions share this one record; `kind` tells them
 * apart and `function` is set exactly when kind == FUNCTION. The id hashes
 * the value, so equal (source, name, value) triples are the same record and
 * different values for one name never collide.
 */
struct Attribute {
    std::string id;
    std::string source_id;
    std::string name;
    std::string value;
    std::optional<std::string> adverb;
    std::optional<std::string> unit;
    std::optional<std::string> modality;
    std::vector<std::string> morph_ids;
    bool deleted = false;
    AttributeKind kind = AttributeKind::ATTRIBUTE;
    std::optional<FunctionPayload> function;

    bool is_function() const { return kind == AttributeKind::FUNCTION; }
    bool add_morph(const std::string& morph_id);

    bool operator==(const Attribute& other) const;
    bool operator!=(const Attribute& other) const { return !(*this == other); }
};

/**
 * @throws InvalidNameError if the attribute name is blank
 */
Attribute create_attribute(const std::string& source_id,
                           const std::string& name,
                           const std::string& value,
                           const AttributeOptions& options = {});

/**
 * Attribute of kind FUNCTION recording the expression that produced `value`.
 * @throws InvalidNameError if the attribute name is blank
 */
Attribute create_function_attribute(const std::string& source_id,
                                    const std::string& name,
                                    const std::string& value,
                                    const std::string& expression,
                                    const AttributeOptions& options = {});

const char* attribute_kind_to_string(AttributeKind kind);

void to_json(nlohmann::json& j, const Attribute& attribute);
void from_json(const nlohmann::json& j, Attribute& attribute);

} // namespace polygraph::model
