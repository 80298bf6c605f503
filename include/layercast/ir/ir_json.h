#pragma once

#include <optional>
#include <string>
#include <vector>

#include "layercast/ir/node.h"
#include "layercast/json/json.h"

namespace layercast::ir {

json::Value paint_to_json(const style::Paint& paint);
json::Value effect_to_json(const style::Effect& effect);
json::Value node_to_json(const Node& node);
json::Value document_to_json(const Document& document);

// Indented by default; the document is meant to be read by people too.
std::string serialize_document(const Document& document, int indent = 2);

struct DocumentParseResult {
    bool ok = false;
    Document document;
    std::string error;
    // Recoverable problems: unknown node types, malformed paints, children
    // on leaf nodes.
    std::vector<std::string> warnings;
};

DocumentParseResult document_from_json(const json::Value& value);
DocumentParseResult parse_document(const std::string& text);

std::optional<style::Paint> paint_from_json(const json::Value& value, std::string& error);
std::optional<style::Effect> effect_from_json(const json::Value& value, std::string& error);

}  // namespace layercast::ir
