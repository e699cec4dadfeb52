#pragma once

#include "layout/Library.hpp"

namespace demo_library
{

// Synthetic library exercising every element kind: a via cell placed by single references
// inside a standard cell, the cell replicated by a grid reference, and a top structure placing
// the grid twice (once rotated and magnified) next to a die outline.
Library CreateDemoLibrary(int columns = 10, int rows = 6);

}  // namespace demo_library
