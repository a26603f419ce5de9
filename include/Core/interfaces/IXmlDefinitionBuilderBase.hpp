#pragma once

#include <pugixml.hpp>
#include <string>

/**
 * @brief Abstract base class for libvirt XML definition builders
 *
 * Owns the document; derived builders only describe the element tree in
 * buildDocument(), which runs on an empty document for every build.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;

    virtual void buildDocument() = 0;

public:
    IXmlBuilderBase() = default;
    virtual ~IXmlBuilderBase() = default;

    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    /**
     * @brief Serializes the definition
     *
     * @param indent Two-space indentation for logs; libvirt gets the compact form
     */
    [[nodiscard]] std::string build(bool indent = false) {
        doc.reset();
        buildDocument();

        struct StringWriter : pugi::xml_writer {
            std::string out;
            void write(const void* data, size_t size) override {
                out.append(static_cast<const char*>(data), size);
            }
        } writer;

        doc.save(writer, "  ", pugi::format_no_declaration | (indent ? pugi::format_indent : pugi::format_raw));
        return writer.out;
    }

    // embeds a copy of the root element under parent (a NIC inside <devices>)
    pugi::xml_node appendTo(pugi::xml_node parent) {
        doc.reset();
        buildDocument();
        return parent.append_copy(doc.document_element());
    }
};
