#pragma once
/**
 * @file Attribute.h
 * @brief Flattened device attribute and its tagged value.
 */
#include <map>
#include <stdint.h>
#include <string>
#include <vector>

/** @brief One tag per JSON value shape. */
enum class AttributeKind : uint8_t { Absent, Bool, Number, Text, List, Map };

/**
 * @brief Tagged attribute value.
 *
 * `json` always holds the canonical encoding (sorted keys, no whitespace) and is
 * what change detection compares. Only the member matching `kind` is meaningful.
 */
struct AttributeValue {
    AttributeKind kind = AttributeKind::Absent;
    bool boolean = false;
    double number = 0.0;
    bool integral = false;           ///< Number parsed without fraction/exponent
    std::string text;
    std::vector<std::string> items;  ///< List: text items in order (non-text items skipped)
    std::string json = "null";

    bool isScalar() const {
        return kind == AttributeKind::Bool || kind == AttributeKind::Number || kind == AttributeKind::Text;
    }
    bool isComposite() const { return kind == AttributeKind::List || kind == AttributeKind::Map; }
};

struct Attribute {
    std::string component;
    std::string capability;
    std::string attribute;
    AttributeValue value;
    std::string unit;                ///< empty when the source omits it

    /** @brief `component.capability.attribute` */
    std::string key() const { return component + "." + capability + "." + attribute; }
};

/** @brief Keyed by `component.capability.attribute`; ordered so iteration is canonical. */
using AttributeMap = std::map<std::string, Attribute>;
