#pragma once

#include "STS/Error.h"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <libxml/tree.h>

namespace STS {

/**
 * @brief Read-only parsed XML document (libxml2)
 *
 * Parsing never touches the network and never substitutes entities.
 */
class XmlDocument {
public:
    /**
     * @brief Parse an XML document held in memory
     * @return The document, or DiscoveryError::MalformedXml
     */
    static std::expected<XmlDocument, DiscoveryError> parse(std::string_view xml);

    XmlDocument(XmlDocument&&) noexcept = default;
    XmlDocument& operator=(XmlDocument&&) noexcept = default;
    XmlDocument(const XmlDocument&) = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;
    ~XmlDocument() = default;

    /// Local name of the root element.
    std::string rootName() const;

    /// Default namespace URI declared on the root element, if any.
    std::optional<std::string> rootNamespace() const;

    /**
     * @brief Namespace-agnostic lookup of the first element with a given local name
     *
     * If the root element carries a namespace, "//ns:<localName>" is tried with
     * that namespace bound to "ns". If that finds nothing (or the root has no
     * namespace) the plain "//<localName>" query is used. Returns the trimmed
     * text of the first match; a missing element and a blank element both
     * yield std::nullopt.
     */
    std::optional<std::string> findText(std::string_view localName) const;

    /// Attribute of the root element, trimmed; std::nullopt if absent or blank.
    std::optional<std::string> rootAttribute(std::string_view name) const;

private:
    struct DocDeleter {
        void operator()(xmlDoc* doc) const;
    };

    explicit XmlDocument(xmlDoc* doc);

    std::optional<std::string> firstText(const std::string& xpath, const std::string* namespaceUri) const;

    std::unique_ptr<xmlDoc, DocDeleter> doc_;
};

} // namespace STS
