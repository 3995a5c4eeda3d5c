#include "STS/XmlDocument.hpp"
#include "STS/Helpers.h"
#include <spdlog/spdlog.h>
#include <libxml/parser.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace STS {

namespace {

std::once_flag g_xmlInitFlag;

struct XPathContextDeleter {
    void operator()(xmlXPathContext* ctx) const { xmlXPathFreeContext(ctx); }
};

struct XPathObjectDeleter {
    void operator()(xmlXPathObject* obj) const { xmlXPathFreeObject(obj); }
};

// Element names are spliced into an XPath expression, so only NCName characters are accepted.
bool isSafeLocalName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string directText(const xmlNode* node) {
    std::string text;
    for (const xmlNode* child = node->children; child; child = child->next) {
        if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content) {
            text += reinterpret_cast<const char*>(child->content);
        }
    }
    return text;
}

} // namespace

void XmlDocument::DocDeleter::operator()(xmlDoc* doc) const {
    xmlFreeDoc(doc);
}

XmlDocument::XmlDocument(xmlDoc* doc)
    : doc_(doc)
{
}

std::expected<XmlDocument, DiscoveryError> XmlDocument::parse(std::string_view xml) {
    std::call_once(g_xmlInitFlag, [] { xmlInitParser(); });

    if (xml.empty()) {
        return std::unexpected(DiscoveryError::MalformedXml);
    }

    const int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    xmlDoc* doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr, options);
    if (!doc) {
        spdlog::debug("XmlDocument: Document did not parse ({} bytes)", xml.size());
        return std::unexpected(DiscoveryError::MalformedXml);
    }
    XmlDocument document(doc);
    if (!xmlDocGetRootElement(doc)) {
        return std::unexpected(DiscoveryError::MalformedXml);
    }
    return document;
}

std::string XmlDocument::rootName() const {
    const xmlNode* root = xmlDocGetRootElement(doc_.get());
    if (!root || !root->name) {
        return {};
    }
    return reinterpret_cast<const char*>(root->name);
}

std::optional<std::string> XmlDocument::rootNamespace() const {
    const xmlNode* root = xmlDocGetRootElement(doc_.get());
    if (!root || !root->ns || !root->ns->href) {
        return std::nullopt;
    }
    std::string uri = reinterpret_cast<const char*>(root->ns->href);
    if (uri.empty()) {
        return std::nullopt;
    }
    return uri;
}

std::optional<std::string> XmlDocument::findText(std::string_view localName) const {
    if (!isSafeLocalName(localName)) {
        spdlog::warn("XmlDocument: Refusing lookup for invalid element name '{}'", localName);
        return std::nullopt;
    }
    const std::string name(localName);

    if (auto ns = rootNamespace()) {
        if (auto text = firstText("//ns:" + name, &*ns)) {
            return text;
        }
    }
    return firstText("//" + name, nullptr);
}

std::optional<std::string> XmlDocument::rootAttribute(std::string_view name) const {
    const xmlNode* root = xmlDocGetRootElement(doc_.get());
    if (!root) {
        return std::nullopt;
    }
    const std::string attrName(name);
    xmlChar* value = xmlGetProp(root, reinterpret_cast<const xmlChar*>(attrName.c_str()));
    if (!value) {
        return std::nullopt;
    }
    std::string text = Helpers::trim(reinterpret_cast<const char*>(value));
    xmlFree(value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<std::string> XmlDocument::firstText(const std::string& xpath, const std::string* namespaceUri) const {
    std::unique_ptr<xmlXPathContext, XPathContextDeleter> ctx(xmlXPathNewContext(doc_.get()));
    if (!ctx) {
        spdlog::error("XmlDocument: xmlXPathNewContext failed");
        return std::nullopt;
    }
    if (namespaceUri) {
        if (xmlXPathRegisterNs(ctx.get(),
                               reinterpret_cast<const xmlChar*>("ns"),
                               reinterpret_cast<const xmlChar*>(namespaceUri->c_str())) != 0) {
            spdlog::debug("XmlDocument: Could not register namespace '{}'", *namespaceUri);
            return std::nullopt;
        }
    }

    std::unique_ptr<xmlXPathObject, XPathObjectDeleter> result(
        xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), ctx.get()));
    if (!result || !result->nodesetval || result->nodesetval->nodeNr == 0) {
        return std::nullopt;
    }

    std::string text = Helpers::trim(directText(result->nodesetval->nodeTab[0]));
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

} // namespace STS
