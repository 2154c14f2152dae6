#ifndef DROIDBRIDGE_HIERARCHY_HPP
#define DROIDBRIDGE_HIERARCHY_HPP

#include <string>
#include <utility>
#include <vector>
#include "droidbridge/models.hpp"

namespace droidbridge {

// One element of a uiautomator window dump
struct ViewNode {
    std::string tag;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string text;
    std::vector<ViewNode> children;

    // nullptr if the attribute is absent
    const std::string* attribute(const std::string& name) const;

    // Depth-first search for nodes whose attribute `name` equals `value`
    std::vector<const ViewNode*> find_all(const std::string& name, const std::string& value) const;

    json to_json() const;
};

/**
 * Parse a window dump into a node tree.
 * Throws MalformedHierarchyError if the markup does not parse or has no root.
 */
ViewNode parse_hierarchy(const std::string& xml);

// Collapse runs of whitespace into single spaces and trim the ends
std::string normalize_whitespace(const std::string& text);

// Render a tree as indented XML with whitespace-normalized values
std::string format_hierarchy(const ViewNode& node, int indent = 2);

} // namespace droidbridge

#endif // DROIDBRIDGE_HIERARCHY_HPP
