#include <cassert>
#include <iostream>

#include "domain/structure/StructurePath.hpp"

using treeshaper::domain::structure::StructurePath;

int main() {
    std::cout << "[Test] Starting StructurePath Test..." << std::endl;

    auto segments = StructurePath::Split("a//b/");
    assert(segments.size() == 2);
    assert(segments[0] == "a" && segments[1] == "b");

    assert(StructurePath::Split("").empty());
    assert(StructurePath::Split("///").empty());
    assert(StructurePath::Split("/src/lib/util.go").size() == 3);

    assert(StructurePath::Canonicalize("/src//main.py/") == "src/main.py");
    assert(StructurePath::Join({}) == "");

    assert(StructurePath::Child("", "README.md") == "README.md");
    assert(StructurePath::Child("src", "main.py") == "src/main.py");

    assert(StructurePath::IsSameOrDescendant({"a"}, {"a"}));
    assert(StructurePath::IsSameOrDescendant({"a"}, {"a", "b"}));
    assert(!StructurePath::IsSameOrDescendant({"a"}, {"ab"}));
    assert(!StructurePath::IsSameOrDescendant({"a", "b"}, {"a"}));
    assert(StructurePath::IsSameOrDescendant({}, {"x"}));

    std::cout << "[PASS] StructurePath Test." << std::endl;
    return 0;
}
