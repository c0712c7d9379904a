#include "converter.hpp"
#include <gumbo.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "html2md.h"

namespace Trawl {
namespace Utils {
namespace Text {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using Document = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

Document parse(const std::string& html) {
    return Document(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

const GumboVector& children_of(const GumboNode* node) {
    return node->v.element.children;
}

const GumboNode* child_at(const GumboVector& children, unsigned int i) {
    return static_cast<const GumboNode*>(children.data[i]);
}

void collect_links(const GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        if (const GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href"))
            links.emplace_back(href->value);
    }

    const GumboVector& children = children_of(node);
    for (unsigned int i = 0; i < children.length; ++i)
        collect_links(child_at(children, i), links);
}

// Depth-first, so the <title> in <head> is found before any inline SVG one.
const GumboNode* find_title(const GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return nullptr;
    if (node->v.element.tag == GUMBO_TAG_TITLE)
        return node;

    const GumboVector& children = children_of(node);
    for (unsigned int i = 0; i < children.length; ++i) {
        if (const GumboNode* found = find_title(child_at(children, i)))
            return found;
    }
    return nullptr;
}

std::string collapse_whitespace(const std::string& text) {
    std::istringstream stream(text);
    std::string        word;
    std::string        result;
    while (stream >> word) {
        if (!result.empty())
            result += ' ';
        result += word;
    }
    return result;
}

}  // namespace

std::string Converter::to_markdown(const std::string& html) {
    return html2md::Convert(html);
}

std::vector<std::string> Converter::extract_links(const std::string& html) {
    std::vector<std::string> links;
    if (html.empty())
        return links;

    Document document = parse(html);
    collect_links(document->root, links);
    return links;
}

std::string Converter::extract_title(const std::string& html) {
    if (html.empty())
        return "";

    Document         document = parse(html);
    const GumboNode* node     = find_title(document->root);
    if (!node)
        return "";

    std::string        title;
    const GumboVector& children = children_of(node);
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = child_at(children, i);
        if (child->type == GUMBO_NODE_TEXT)
            title += child->v.text.text;
    }
    return collapse_whitespace(title);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
