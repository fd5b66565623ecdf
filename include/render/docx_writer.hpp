#pragma once

#include "render/document_model.hpp"
#include <string>
#include <vector>

namespace medscribe {
namespace render {

/**
 * WordprocessingML package writer. Title uses the "Title" style, headings map
 * to Heading1/Heading2, emphasis to a bold run.
 */
class DocxWriter {
public:
    std::vector<uint8_t> write(const DocumentContent& content) const;

    std::string buildDocumentXml(const DocumentContent& content) const;
    std::string buildStylesXml() const;
    std::string buildCorePropertiesXml(const DocumentContent& content) const;

    // XML character escaping; drops characters XML 1.0 does not allow
    static std::string escapeXml(const std::string& text);
};

} // namespace render
} // namespace medscribe
