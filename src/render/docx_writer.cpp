#include "render/docx_writer.hpp"
#include "render/utf8.hpp"
#include "render/zip_archive.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace medscribe {
namespace render {

namespace {

const char* const kXmlDeclaration = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
const char* const kWordNamespace = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

const char* const kContentTypes =
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "<Override PartName=\"/word/styles.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>"
    "<Override PartName=\"/docProps/core.xml\" "
    "ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>"
    "</Types>";

const char* const kPackageRels =
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"word/document.xml\"/>"
    "<Relationship Id=\"rId2\" "
    "Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" "
    "Target=\"docProps/core.xml\"/>"
    "</Relationships>";

const char* const kDocumentRels =
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
    "Target=\"styles.xml\"/>"
    "</Relationships>";

std::string run(const std::string& text, bool bold = false) {
    std::string xml = "<w:r>";
    if (bold) {
        xml += "<w:rPr><w:b/></w:rPr>";
    }
    xml += "<w:t xml:space=\"preserve\">" + DocxWriter::escapeXml(text) + "</w:t></w:r>";
    return xml;
}

std::string paragraph(const std::string& properties, const std::string& runs) {
    std::string xml = "<w:p>";
    if (!properties.empty()) {
        xml += "<w:pPr>" + properties + "</w:pPr>";
    }
    return xml + runs + "</w:p>";
}

std::string styleDefinition(const std::string& id, const std::string& name,
                            const std::string& pPr, const std::string& rPr) {
    return "<w:style w:type=\"paragraph\" w:styleId=\"" + id + "\">"
           "<w:name w:val=\"" + name + "\"/><w:basedOn w:val=\"Normal\"/><w:next w:val=\"Normal\"/>"
           "<w:qFormat/><w:pPr>" + pPr + "</w:pPr><w:rPr>" + rPr + "</w:rPr></w:style>";
}

} // namespace

std::string DocxWriter::escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t begin = pos;
        uint32_t codepoint = 0;
        // Word refuses a package whose XML holds invalid UTF-8
        if (!utf8::decodeNext(text, pos, codepoint) || !utf8::isXmlChar(codepoint)) {
            continue;
        }

        switch (codepoint) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                out.append(text, begin, pos - begin);
        }
    }
    return out;
}

std::string DocxWriter::buildStylesXml() const {
    std::ostringstream xml;
    xml << kXmlDeclaration
        << "<w:styles xmlns:w=\"" << kWordNamespace << "\">"
        << "<w:docDefaults><w:rPrDefault><w:rPr>"
        << "<w:rFonts w:ascii=\"Calibri\" w:hAnsi=\"Calibri\" w:cs=\"Calibri\"/>"
        << "<w:sz w:val=\"22\"/><w:szCs w:val=\"22\"/><w:lang w:val=\"pt-BR\"/>"
        << "</w:rPr></w:rPrDefault>"
        << "<w:pPrDefault><w:pPr><w:spacing w:after=\"160\" w:line=\"276\" w:lineRule=\"auto\"/></w:pPr>"
        << "</w:pPrDefault></w:docDefaults>"
        << "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\">"
        << "<w:name w:val=\"Normal\"/><w:qFormat/></w:style>"
        << styleDefinition("Title", "Title",
                           "<w:jc w:val=\"center\"/><w:spacing w:after=\"600\"/>",
                           "<w:b/><w:color w:val=\"1565C0\"/><w:sz w:val=\"36\"/><w:szCs w:val=\"36\"/>")
        << styleDefinition("Heading1", "heading 1",
                           "<w:keepNext/><w:spacing w:before=\"400\" w:after=\"240\"/><w:outlineLvl w:val=\"0\"/>",
                           "<w:b/><w:color w:val=\"2196F3\"/><w:sz w:val=\"28\"/><w:szCs w:val=\"28\"/>")
        << styleDefinition("Heading2", "heading 2",
                           "<w:keepNext/><w:spacing w:before=\"300\" w:after=\"160\"/><w:outlineLvl w:val=\"1\"/>",
                           "<w:b/><w:color w:val=\"42A5F5\"/><w:sz w:val=\"24\"/><w:szCs w:val=\"24\"/>")
        << "</w:styles>";
    return xml.str();
}

std::string DocxWriter::buildDocumentXml(const DocumentContent& content) const {
    std::ostringstream body;
    body << paragraph("<w:pStyle w:val=\"Title\"/><w:jc w:val=\"center\"/>", run(content.title));
    body << paragraph("<w:jc w:val=\"right\"/>", run(content.dateLine));
    body << paragraph("", "");

    for (const auto& block : content.blocks) {
        switch (block.type) {
            case BlockType::HEADING:
                body << paragraph("<w:pStyle w:val=\"Heading1\"/>", run(block.text));
                break;
            case BlockType::SUBHEADING:
                body << paragraph("<w:pStyle w:val=\"Heading2\"/>", run(block.text));
                break;
            case BlockType::EMPHASIS:
                body << paragraph("", run(block.text, true));
                break;
            case BlockType::PARAGRAPH:
                body << paragraph("", run(block.text));
                break;
            case BlockType::SPACER:
                body << paragraph("", "");
                break;
        }
    }

    std::ostringstream xml;
    xml << kXmlDeclaration
        << "<w:document xmlns:w=\"" << kWordNamespace << "\"><w:body>"
        << body.str()
        // A4 with 1 inch margins, in twentieths of a point
        << "<w:sectPr><w:pgSz w:w=\"11906\" w:h=\"16838\"/>"
        << "<w:pgMar w:top=\"1440\" w:right=\"1440\" w:bottom=\"1440\" w:left=\"1440\" "
        << "w:header=\"708\" w:footer=\"708\" w:gutter=\"0\"/></w:sectPr>"
        << "</w:body></w:document>";
    return xml.str();
}

std::string DocxWriter::buildCorePropertiesXml(const DocumentContent& content) const {
    std::time_t t = std::chrono::system_clock::to_time_t(content.generatedAt);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream created;
    created << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");

    std::ostringstream xml;
    xml << kXmlDeclaration
        << "<cp:coreProperties "
        << "xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
        << "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
        << "xmlns:dcterms=\"http://purl.org/dc/terms/\" "
        << "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
        << "<dc:title>" << escapeXml(content.title) << "</dc:title>"
        << "<dc:creator>MedScribe</dc:creator>"
        << "<dc:language>pt-BR</dc:language>"
        << "<dcterms:created xsi:type=\"dcterms:W3CDTF\">" << created.str() << "</dcterms:created>"
        << "<dcterms:modified xsi:type=\"dcterms:W3CDTF\">" << created.str() << "</dcterms:modified>"
        << "</cp:coreProperties>";
    return xml.str();
}

std::vector<uint8_t> DocxWriter::write(const DocumentContent& content) const {
    ZipArchive archive(content.generatedAt);
    archive.addFile("[Content_Types].xml", std::string(kXmlDeclaration) + kContentTypes);
    archive.addFile("_rels/.rels", std::string(kXmlDeclaration) + kPackageRels);
    archive.addFile("word/_rels/document.xml.rels", std::string(kXmlDeclaration) + kDocumentRels);
    archive.addFile("word/document.xml", buildDocumentXml(content));
    archive.addFile("word/styles.xml", buildStylesXml());
    archive.addFile("docProps/core.xml", buildCorePropertiesXml(content));
    return archive.finish();
}

} // namespace render
} // namespace medscribe
