#include "html_document.hpp"
#include "tracker/data_structures/tracker_errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <climits>
#include <mutex>
#include <sstream>

namespace FtseTracker {
namespace Core {

namespace {

std::once_flag parser_initialization_flag;

const xmlChar* to_xml_chars(const std::string& text) {
    return reinterpret_cast<const xmlChar*>(text.c_str());
}

std::string take_xml_string(xmlChar* owned_text) {
    if (!owned_text) {
        return std::string();
    }
    std::string result(reinterpret_cast<const char*>(owned_text));
    xmlFree(owned_text);
    return result;
}

std::optional<HtmlElement> search_children(xmlNodePtr parent, const std::function<bool(const HtmlElement&)>& predicate) {
    for (xmlNodePtr child = parent->children; child != nullptr; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }
        HtmlElement candidate(child);
        if (predicate(candidate)) {
            return candidate;
        }
        std::optional<HtmlElement> nested = search_children(child, predicate);
        if (nested) {
            return nested;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::string HtmlElement::get_tag_name() const {
    return node->name ? std::string(reinterpret_cast<const char*>(node->name)) : std::string();
}

std::string HtmlElement::get_text() const {
    return take_xml_string(xmlNodeGetContent(node));
}

std::optional<std::string> HtmlElement::get_attribute(const std::string& attribute_name) const {
    xmlChar* attribute_value = xmlGetProp(node, to_xml_chars(attribute_name));
    if (!attribute_value) {
        return std::nullopt;
    }
    return take_xml_string(attribute_value);
}

std::vector<std::string> HtmlElement::get_classes() const {
    std::vector<std::string> classes;
    std::optional<std::string> class_attribute = get_attribute("class");
    if (!class_attribute) {
        return classes;
    }
    std::istringstream class_stream(*class_attribute);
    std::string class_name;
    while (class_stream >> class_name) {
        classes.push_back(class_name);
    }
    return classes;
}

bool HtmlElement::has_class(const std::string& class_name) const {
    for (const std::string& element_class : get_classes()) {
        if (element_class == class_name) {
            return true;
        }
    }
    return false;
}

std::optional<HtmlElement> HtmlElement::find_descendant(const std::function<bool(const HtmlElement&)>& predicate) const {
    return search_children(node, predicate);
}

std::optional<HtmlElement> HtmlElement::find_descendant_with_class(const std::string& tag_name, const std::string& class_name) const {
    return find_descendant([&](const HtmlElement& candidate) {
        return candidate.get_tag_name() == tag_name && candidate.has_class(class_name);
    });
}

std::optional<HtmlElement> HtmlElement::find_descendant_with_id(const std::string& tag_name, const std::string& element_id) const {
    return find_descendant([&](const HtmlElement& candidate) {
        if (candidate.get_tag_name() != tag_name) {
            return false;
        }
        std::optional<std::string> candidate_id = candidate.get_attribute("id");
        return candidate_id && *candidate_id == element_id;
    });
}

HtmlDocument HtmlDocument::parse(const std::string& html_text) {
    std::call_once(parser_initialization_flag, []() { xmlInitParser(); });

    if (html_text.size() > static_cast<size_t>(INT_MAX)) {
        throw PageParseError("Page too large to parse (" + std::to_string(html_text.size()) + " bytes)");
    }

    int parser_options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;
    htmlDocPtr parsed_document = htmlReadMemory(html_text.data(), static_cast<int>(html_text.size()),
                                                nullptr, "UTF-8", parser_options);
    if (!parsed_document) {
        throw PageParseError("Page could not be parsed as HTML");
    }

    HtmlDocument html_document(parsed_document);
    if (!xmlDocGetRootElement(parsed_document)) {
        throw PageParseError("Page has no root element");
    }
    return html_document;
}

HtmlElement HtmlDocument::get_root() const {
    return HtmlElement(xmlDocGetRootElement(document.get()));
}

std::optional<HtmlElement> HtmlDocument::find_first_with_class(const std::string& tag_name, const std::string& class_name) const {
    HtmlElement root = get_root();
    if (root.get_tag_name() == tag_name && root.has_class(class_name)) {
        return root;
    }
    return root.find_descendant_with_class(tag_name, class_name);
}

} // namespace Core
} // namespace FtseTracker
