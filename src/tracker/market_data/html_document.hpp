#ifndef HTML_DOCUMENT_HPP
#define HTML_DOCUMENT_HPP

#include <libxml/HTMLparser.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace FtseTracker {
namespace Core {

/**
 * Non-owning view of an element inside an HtmlDocument.
 * Valid only while the owning document is alive.
 */
class HtmlElement {
public:
    explicit HtmlElement(xmlNodePtr element_node) : node(element_node) {}

    std::string get_tag_name() const;
    std::string get_text() const;
    std::optional<std::string> get_attribute(const std::string& attribute_name) const;
    std::vector<std::string> get_classes() const;
    bool has_class(const std::string& class_name) const;

    // Depth-first, document order, the element itself excluded
    std::optional<HtmlElement> find_descendant(const std::function<bool(const HtmlElement&)>& predicate) const;
    std::optional<HtmlElement> find_descendant_with_class(const std::string& tag_name, const std::string& class_name) const;
    std::optional<HtmlElement> find_descendant_with_id(const std::string& tag_name, const std::string& element_id) const;

private:
    xmlNodePtr node;
};

/**
 * Parsed HTML page. Owns the libxml2 tree.
 * Parsing is lenient (recovering from malformed markup); only a page that
 * yields no tree at all is rejected.
 */
class HtmlDocument {
public:
    // Throws PageParseError when no document can be built
    static HtmlDocument parse(const std::string& html_text);

    HtmlElement get_root() const;
    std::optional<HtmlElement> find_first_with_class(const std::string& tag_name, const std::string& class_name) const;

private:
    struct DocumentDeleter {
        void operator()(xmlDoc* document) const { xmlFreeDoc(document); }
    };

    explicit HtmlDocument(xmlDoc* parsed_document) : document(parsed_document) {}

    std::unique_ptr<xmlDoc, DocumentDeleter> document;
};

} // namespace Core
} // namespace FtseTracker

#endif // HTML_DOCUMENT_HPP
