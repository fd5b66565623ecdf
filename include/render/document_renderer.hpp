#pragma once

#include "render/document_model.hpp"
#include "render/docx_writer.hpp"
#include "render/pdf_writer.hpp"
#include <chrono>
#include <string>

namespace medscribe {
namespace render {

/**
 * Turns summary markup into a downloadable PDF or DOCX document.
 *
 * The document starts with the title and a "Gerado em: dd/mm/YYYY às HH:MM"
 * line, followed by the parsed markup blocks in order. Rendering the same
 * markup with the same title and timestamp produces identical bytes.
 */
class DocumentRenderer {
public:
    ExportedDocument render(const std::string& markup,
                            const std::string& title,
                            DocumentEncoding encoding,
                            std::chrono::system_clock::time_point timestamp =
                                std::chrono::system_clock::now()) const;

    DocumentContent buildContent(const std::string& markup,
                                 const std::string& title,
                                 std::chrono::system_clock::time_point timestamp) const;

    static std::string generatedAtLabel(std::chrono::system_clock::time_point timestamp);

    // "pdf" / "docx", case-insensitive
    static DocumentEncoding parseEncoding(const std::string& name);

private:
    PdfWriter pdfWriter_;
    DocxWriter docxWriter_;
};

} // namespace render
} // namespace medscribe
