#include "render/document_renderer.hpp"
#include "render/markup_parser.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace medscribe {
namespace render {

std::string encodingToString(DocumentEncoding encoding) {
    switch (encoding) {
        case DocumentEncoding::PDF: return "pdf";
        case DocumentEncoding::DOCX: return "docx";
    }
    return "unknown";
}

std::string fileExtension(DocumentEncoding encoding) {
    return "." + encodingToString(encoding);
}

std::string DocumentRenderer::generatedAtLabel(std::chrono::system_clock::time_point timestamp) {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << "Gerado em: " << std::put_time(&local, "%d/%m/%Y às %H:%M");
    return oss.str();
}

DocumentEncoding DocumentRenderer::parseEncoding(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "pdf") {
        return DocumentEncoding::PDF;
    }
    if (lower == "docx") {
        return DocumentEncoding::DOCX;
    }
    throw utils::RenderException("Unsupported export format: " + name, name);
}

DocumentContent DocumentRenderer::buildContent(const std::string& markup,
                                               const std::string& title,
                                               std::chrono::system_clock::time_point timestamp) const {
    DocumentContent content;
    content.title = title;
    content.dateLine = generatedAtLabel(timestamp);
    content.blocks = parseMarkup(markup);
    content.generatedAt = timestamp;
    return content;
}

ExportedDocument DocumentRenderer::render(const std::string& markup,
                                          const std::string& title,
                                          DocumentEncoding encoding,
                                          std::chrono::system_clock::time_point timestamp) const {
    ExportedDocument document;
    document.encoding = encoding;
    document.content = buildContent(markup, title, timestamp);

    try {
        if (encoding == DocumentEncoding::PDF) {
            document.bytes = pdfWriter_.write(document.content);
        } else {
            document.bytes = docxWriter_.write(document.content);
        }
    } catch (const utils::RenderException&) {
        throw;
    } catch (const std::exception& e) {
        throw utils::RenderException(std::string("Document encoding failed: ") + e.what(),
                                     encodingToString(encoding));
    }

    utils::Logger::debug("Rendered " + encodingToString(encoding) + " document with " +
                         std::to_string(document.content.blocks.size()) + " blocks (" +
                         std::to_string(document.bytes.size()) + " bytes)");
    return document;
}

} // namespace render
} // namespace medscribe
