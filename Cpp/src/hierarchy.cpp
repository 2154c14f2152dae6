#include "droidbridge/hierarchy.hpp"
#include "droidbridge/errors.hpp"

#include <tinyxml2.h>

namespace droidbridge {

namespace {

ViewNode convert_element(const tinyxml2::XMLElement* element) {
    ViewNode node;
    node.tag = element->Name();

    for (const auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        node.attributes.emplace_back(attr->Name(), attr->Value());
    }

    if (const char* text = element->GetText()) {
        node.text = text;
    }

    for (const auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        node.children.push_back(convert_element(child));
    }
    return node;
}

void collect(const ViewNode& node, const std::string& name, const std::string& value,
             std::vector<const ViewNode*>& found) {
    const std::string* actual = node.attribute(name);
    if (actual != nullptr && *actual == value) {
        found.push_back(&node);
    }
    for (const auto& child : node.children) {
        collect(child, name, value, found);
    }
}

std::string escape_xml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': escaped += "&amp;"; break;
        case '<': escaped += "&lt;"; break;
        case '>': escaped += "&gt;"; break;
        case '"': escaped += "&quot;"; break;
        default: escaped += c; break;
        }
    }
    return escaped;
}

void format_node(const ViewNode& node, int indent, int depth, std::string& out) {
    std::string pad(static_cast<size_t>(indent * depth), ' ');

    out += pad + "<" + node.tag;
    for (const auto& [name, value] : node.attributes) {
        out += " " + name + "=\"" + escape_xml(normalize_whitespace(value)) + "\"";
    }

    std::string text = normalize_whitespace(node.text);
    if (node.children.empty() && text.empty()) {
        out += " />\n";
        return;
    }

    out += ">";
    if (node.children.empty()) {
        out += escape_xml(text) + "</" + node.tag + ">\n";
        return;
    }

    out += "\n";
    if (!text.empty()) {
        out += std::string(static_cast<size_t>(indent * (depth + 1)), ' ') + escape_xml(text) + "\n";
    }
    for (const auto& child : node.children) {
        format_node(child, indent, depth + 1, out);
    }
    out += pad + "</" + node.tag + ">\n";
}

} // namespace

const std::string* ViewNode::attribute(const std::string& name) const {
    for (const auto& [key, value] : attributes) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

std::vector<const ViewNode*> ViewNode::find_all(const std::string& name, const std::string& value) const {
    std::vector<const ViewNode*> found;
    collect(*this, name, value, found);
    return found;
}

json ViewNode::to_json() const {
    json j;
    j["tag"] = tag;
    j["attributes"] = json::object();
    for (const auto& [name, value] : attributes) {
        j["attributes"][name] = value;
    }
    if (!text.empty()) {
        j["text"] = text;
    }
    j["children"] = json::array();
    for (const auto& child : children) {
        j["children"].push_back(child.to_json());
    }
    return j;
}

ViewNode parse_hierarchy(const std::string& xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw MalformedHierarchyError(std::string("Failed to parse view hierarchy: ") + doc.ErrorStr());
    }

    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr) {
        throw MalformedHierarchyError("View hierarchy has no root element");
    }
    return convert_element(root);
}

std::string normalize_whitespace(const std::string& text) {
    std::string normalized;
    bool pending_space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized += ' ';
            pending_space = false;
        }
        normalized += c;
    }
    return normalized;
}

std::string format_hierarchy(const ViewNode& node, int indent) {
    std::string out;
    format_node(node, indent, 0, out);
    return out;
}

} // namespace droidbridge
