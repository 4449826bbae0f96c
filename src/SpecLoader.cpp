// SpecLoader.cpp – Parses the CAT62 UAP XML into a UapTable.
// Parsed with pugixml; any schema or table violation surfaces as SpecLoadError.
//
// Schema:
//   <Category cat="62" name="..." edition="...">
//     <DataItems>
//       <DataItem id="I062/010" frn="1" name="...">
//         <Fixed bytes="2">
//           <Element name="sac" bytes="1" encoding="raw"/>
//           <Spare bytes="1"/>
//           <Element name="lat" bytes="4" encoding="signed_quantity" scale="5.364e-6"/>
//         </Fixed>
//       </DataItem>
//       <DataItem id="I062/380" frn="10"><Compound psf_bytes="2"/></DataItem>
//       <DataItem id="spare" frn="11"><Spare/></DataItem>
//     </DataItems>
//   </Category>

#include "Cat62Codec/SpecLoader.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace cat62 {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static uint64_t parseU64(const char* s, const char* ctx) {
    uint64_t v = 0;
    const char* end = s + std::strlen(s);
    int base = 10;
    if (std::strncmp(s, "0x", 2) == 0 || std::strncmp(s, "0X", 2) == 0) {
        s += 2;
        base = 16;
    }
    auto [ptr, ec] = std::from_chars(s, end, v, base);
    if (ec != std::errc{} || ptr != end || s == end)
        throw SpecLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

static double parseDouble(const char* s, const char* ctx) {
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0')
        throw SpecLoadError(std::string(ctx) + ": cannot parse double '" + s + "'");
    return v;
}

// Scales may be written as a ratio, e.g. "180/33554432" or "1/128".
static double parseScale(const char* s) {
    if (const char* slash = std::strchr(s, '/')) {
        const std::string num(s, slash);
        const double n = parseDouble(num.c_str(), "scale");
        const double d = parseDouble(slash + 1, "scale");
        if (d == 0.0)
            throw SpecLoadError(std::string("scale: zero denominator in '") + s + "'");
        return n / d;
    }
    return parseDouble(s, "scale");
}

static Encoding parseEncoding(const char* s) {
    if (!s || *s == '\0')                    return Encoding::Raw;
    if (strcmp(s, "raw")               == 0) return Encoding::Raw;
    if (strcmp(s, "unsigned_quantity") == 0) return Encoding::UnsignedQuantity;
    if (strcmp(s, "signed_quantity")   == 0) return Encoding::SignedQuantity;
    throw SpecLoadError(std::string("Unknown encoding: '") + s + "'");
}

static uint8_t parseWidth(pugi::xml_node node, const char* ctx) {
    const uint64_t bytes = parseU64(node.attribute("bytes").as_string("0"), ctx);
    if (bytes < 1 || bytes > 4)
        throw SpecLoadError(std::string(ctx) + " must be 1–4 bytes, got " + std::to_string(bytes));
    return static_cast<uint8_t>(bytes);
}

// ─── Parse a single <Element> or <Spare> node into an ElementDef ──────────────

static ElementDef parseElementNode(pugi::xml_node node) {
    ElementDef e;

    if (strcmp(node.name(), "Spare") == 0) {
        e.encoding = Encoding::Spare;
        e.bytes    = parseWidth(node, "Spare.bytes");
        return e;
    }

    // <Element>
    e.name     = node.attribute("name").as_string("");
    e.bytes    = parseWidth(node, "Element.bytes");
    e.encoding = parseEncoding(node.attribute("encoding").as_string("raw"));

    if (e.name.empty())
        throw SpecLoadError("<Element> missing 'name' attribute");

    if (auto a = node.attribute("scale"); a) e.scale = parseScale(a.as_string());
    if (auto a = node.attribute("mask");  a) e.mask  = parseU64(a.as_string(), "mask");

    if (e.encoding != Encoding::Raw && e.scale == 0.0)
        throw SpecLoadError("Element '" + e.name + "' has zero scale");

    return e;
}

// ─── Parse one <DataItem> node ────────────────────────────────────────────────

static DataItemDef parseDataItem(pugi::xml_node node) {
    DataItemDef item;
    item.id   = node.attribute("id").as_string("");
    item.name = node.attribute("name").as_string("");

    if (item.id.empty())
        throw SpecLoadError("<DataItem> missing 'id' attribute");

    const std::string ctx = "DataItem '" + item.id + "' frn";
    item.frn = static_cast<unsigned>(parseU64(node.attribute("frn").as_string("0"), ctx.c_str()));
    if (item.frn == 0)
        throw SpecLoadError("DataItem '" + item.id + "' has missing or zero 'frn'");

    if (auto fixed = node.child("Fixed")) {
        item.type = ItemType::Fixed;
        uint32_t total = 0;
        for (auto child : fixed.children()) {
            if (strcmp(child.name(), "Element") == 0 || strcmp(child.name(), "Spare") == 0) {
                ElementDef e = parseElementNode(child);
                total       += e.bytes;
                item.elements.push_back(std::move(e));
            }
        }
        // <Fixed bytes="N"/> without elements declares a skip-only item.
        if (auto a = fixed.attribute("bytes"); a)
            item.fixed_bytes = static_cast<uint16_t>(parseU64(a.as_string(), "Fixed.bytes"));
        else
            item.fixed_bytes = static_cast<uint16_t>(total);

        if (item.fixed_bytes == 0)
            throw SpecLoadError("Fixed item '" + item.id + "' has zero length");
        if (!item.elements.empty() && total != item.fixed_bytes)
            throw SpecLoadError("Fixed item '" + item.id + "' elements span " +
                                std::to_string(total) + " byte(s), declared " +
                                std::to_string(item.fixed_bytes));
    } else if (auto compound = node.child("Compound")) {
        item.type        = ItemType::Compound;
        item.fixed_bytes = static_cast<uint16_t>(
            parseU64(compound.attribute("psf_bytes").as_string("0"), "Compound.psf_bytes"));
        if (item.fixed_bytes == 0)
            throw SpecLoadError("Compound item '" + item.id + "' has no primary subfield width");
    } else if (node.child("Spare")) {
        item.type = ItemType::Spare;
    } else {
        throw SpecLoadError("DataItem '" + item.id + "' has no recognised type element");
    }

    return item;
}

// ─── Build the table from a parsed document ───────────────────────────────────

static UapTable buildTable(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("Category");
    if (!root)
        throw SpecLoadError("XML root element must be <Category>");

    const uint64_t cat = parseU64(root.attribute("cat").as_string("0"), "Category.cat");
    if (cat != kCategory)
        throw SpecLoadError("<Category cat=\"" + std::to_string(cat) +
                            "\"> is not supported; only CAT62");

    std::vector<DataItemDef> items;
    for (auto item_node : root.child("DataItems").children("DataItem"))
        items.push_back(parseDataItem(item_node));

    if (items.empty())
        throw SpecLoadError("Category 62 has no <DataItem> definitions");

    try {
        return UapTable{std::move(items)};
    } catch (const std::invalid_argument& ex) {
        throw SpecLoadError(ex.what());
    }
}

// ─── Public entry points ──────────────────────────────────────────────────────

UapTable loadSpec(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw SpecLoadError("Failed to parse XML '" + xml_path.string() +
                            "': " + result.description());
    return buildTable(doc);
}

UapTable loadSpecFromString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result)
        throw SpecLoadError(std::string("Failed to parse XML: ") + result.description());
    return buildTable(doc);
}

} // namespace cat62
