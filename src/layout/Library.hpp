#pragma once

#include <string>
#include <vector>

#include "layout/Element.hpp"

struct LibraryUnits {
    double user_units_per_database_unit = 0.001;
    double meters_per_database_unit = 1e-9;
};

struct Structure {
    std::string name;
    std::vector<Element> elements;
};

// Decoded layout library. Read-only once built; structures are looked up by name.
struct Library {
    std::string name;
    LibraryUnits units;
    std::vector<Structure> structures;

    // nullptr when no structure carries that name.
    [[nodiscard]] const Structure* FindStructure(const std::string& structure_name) const;
    [[nodiscard]] size_t GetElementCount() const;
};
