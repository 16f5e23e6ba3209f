#include "HtmlDocument.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <lexbor/css/css.h>
#include <lexbor/selectors/selectors.h>
#include <cstring>
#include <stdexcept>
#include <unordered_map>

namespace MangaHarvest {
namespace detail {

// Owns the lexbor document plus the CSS machinery used to query it.
// Parsed selector lists are kept per selector string for the document's lifetime.
struct DocumentState {
    lxb_html_document_t* document = nullptr;
    lxb_css_parser_t* css_parser = nullptr;
    lxb_selectors_t* selectors = nullptr;
    std::unordered_map<std::string, lxb_css_selector_list_t*> compiled;

    DocumentState() = default;
    DocumentState(const DocumentState&) = delete;
    DocumentState& operator=(const DocumentState&) = delete;

    ~DocumentState() {
        for (auto& entry : compiled) {
            lxb_css_selector_list_destroy_memory(entry.second);
        }
        if (selectors) lxb_selectors_destroy(selectors, true);
        if (css_parser) lxb_css_parser_destroy(css_parser, true);
        if (document) lxb_html_document_destroy(document);
    }

    lxb_css_selector_list_t* Compile(const std::string& selector) {
        auto it = compiled.find(selector);
        if (it != compiled.end()) return it->second;

        lxb_css_selector_list_t* list = lxb_css_selectors_parse(css_parser,
            reinterpret_cast<const lxb_char_t*>(selector.data()), selector.size());
        if (list == nullptr || css_parser->status != LXB_STATUS_OK) {
            if (list) lxb_css_selector_list_destroy_memory(list);
            throw std::invalid_argument("Invalid CSS selector: " + selector);
        }
        compiled.emplace(selector, list);
        return list;
    }
};

}

namespace {

// Helper to convert lxb_char_t* to std::string
std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string trim(const std::string& s) {
    static const char* ws = " \t\n\r\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

lxb_status_t CollectNode(lxb_dom_node_t* node, lxb_css_selector_specificity_t, void* ctx) {
    static_cast<std::vector<lxb_dom_node_t*>*>(ctx)->push_back(node);
    return LXB_STATUS_OK;
}

} // anonymous namespace

HtmlDocument HtmlDocument::Parse(const std::string& html) {
    auto state = std::make_shared<detail::DocumentState>();

    state->document = lxb_html_document_create();
    if (!state->document) throw std::runtime_error("Failed to create HTML document");

    lxb_status_t status = lxb_html_document_parse(state->document,
        reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
    if (status != LXB_STATUS_OK) {
        throw std::runtime_error("Failed to parse HTML document (lexbor status " + std::to_string(status) + ")");
    }

    state->css_parser = lxb_css_parser_create();
    if (!state->css_parser || lxb_css_parser_init(state->css_parser, nullptr) != LXB_STATUS_OK) {
        throw std::runtime_error("Failed to initialize CSS parser");
    }

    state->selectors = lxb_selectors_create();
    if (!state->selectors || lxb_selectors_init(state->selectors) != LXB_STATUS_OK) {
        throw std::runtime_error("Failed to initialize CSS selectors engine");
    }
    // Report each node once even when several selectors of a list match it.
    lxb_selectors_opt_set(state->selectors, LXB_SELECTORS_OPT_MATCH_FIRST);

    return HtmlDocument(std::move(state));
}

HtmlNode HtmlDocument::Root() const {
    return HtmlNode(lxb_dom_interface_node(state_->document), state_);
}

HtmlNode::HtmlNode(lxb_dom_node* node, std::shared_ptr<detail::DocumentState> state)
    : node_(node), state_(std::move(state)) {}

std::string HtmlNode::Text() const {
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node_, &len);
    if (!text) return "";
    std::string out = to_std_string(text, len);
    lxb_dom_document_destroy_text(lxb_dom_interface_document(state_->document), text);
    return trim(out);
}

std::optional<std::string> HtmlNode::Attr(const std::string& name) const {
    if (node_->type != LXB_DOM_NODE_TYPE_ELEMENT) return std::nullopt;
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(lxb_dom_interface_element(node_),
        reinterpret_cast<const lxb_char_t*>(name.data()), name.size(), &len);
    if (!value) return std::nullopt;
    return to_std_string(value, len);
}

std::vector<HtmlNode> HtmlNode::Select(const std::string& selector) const {
    lxb_css_selector_list_t* list = state_->Compile(selector);

    std::vector<lxb_dom_node_t*> found;
    lxb_status_t status = lxb_selectors_find(state_->selectors, node_, list, CollectNode, &found);
    if (status != LXB_STATUS_OK) {
        throw std::runtime_error("CSS selector search failed for: " + selector);
    }

    std::vector<HtmlNode> nodes;
    nodes.reserve(found.size());
    for (auto* n : found) nodes.push_back(HtmlNode(n, state_));
    return nodes;
}

std::optional<HtmlNode> HtmlNode::First(const std::string& selector) const {
    auto nodes = Select(selector);
    if (nodes.empty()) return std::nullopt;
    return nodes.front();
}

std::optional<std::string> HtmlNode::GetText(const std::string& selector) const {
    auto node = First(selector);
    if (!node) return std::nullopt;
    return node->Text();
}

std::optional<std::string> HtmlNode::GetAttr(const std::string& selector, const std::string& name) const {
    auto node = First(selector);
    if (!node) return std::nullopt;
    return node->Attr(name);
}

}
