#pragma once
#include <string>
#include "../types/Type.hpp"

namespace gcl {

struct Symbol {
    std::string name;
    TypePtr type;
    int slot = -1;   // index into the translated state list
    int depth = 0;   // block nesting depth of the declaration, root = 0
    int line = 0;
    int column = 0;
};

} // namespace gcl
