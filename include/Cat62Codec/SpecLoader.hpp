#pragma once
// SpecLoader.hpp – Parses a CAT62 UAP XML file into a UapTable.

#include "Uap.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace cat62 {

// Thrown when the XML is structurally invalid or violates the schema rules.
class SpecLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Loads the UAP definition from the given XML file path.
// Throws SpecLoadError on any parse or validation failure.
UapTable loadSpec(const std::filesystem::path& xml_path);

// Same, from an in-memory XML document.
UapTable loadSpecFromString(const std::string& xml);

} // namespace cat62
