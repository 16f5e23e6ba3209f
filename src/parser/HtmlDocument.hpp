#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>

struct lxb_dom_node;

namespace MangaHarvest {

namespace detail { struct DocumentState; }

// A node of a parsed HtmlDocument. Holds a reference on the document, so
// nodes stay valid after the HtmlDocument object itself goes away.
class HtmlNode {
public:
    // Text content with leading and trailing whitespace removed.
    std::string Text() const;
    // std::nullopt when the attribute is absent (or this is not an element).
    std::optional<std::string> Attr(const std::string& name) const;

    // Descendants matching a CSS selector, in document order.
    std::vector<HtmlNode> Select(const std::string& selector) const;
    std::optional<HtmlNode> First(const std::string& selector) const;

    // Optional-value accessors for the first descendant matching `selector`.
    std::optional<std::string> GetText(const std::string& selector) const;
    std::optional<std::string> GetAttr(const std::string& selector, const std::string& name) const;

private:
    friend class HtmlDocument;
    HtmlNode(lxb_dom_node* node, std::shared_ptr<detail::DocumentState> state);

    lxb_dom_node* node_;
    std::shared_ptr<detail::DocumentState> state_;
};

class HtmlDocument {
public:
    // Throws std::runtime_error if lexbor cannot build a document.
    static HtmlDocument Parse(const std::string& html);

    HtmlNode Root() const;
    std::vector<HtmlNode> Select(const std::string& selector) const { return Root().Select(selector); }
    std::optional<HtmlNode> First(const std::string& selector) const { return Root().First(selector); }
    std::optional<std::string> GetText(const std::string& selector) const { return Root().GetText(selector); }
    std::optional<std::string> GetAttr(const std::string& selector, const std::string& name) const {
        return Root().GetAttr(selector, name);
    }

private:
    explicit HtmlDocument(std::shared_ptr<detail::DocumentState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::DocumentState> state_;
};

}
