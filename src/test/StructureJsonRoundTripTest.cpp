#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "application/StructureEditorService.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/StructureJson.hpp"
#include "infrastructure/StructureRepositoryFs.hpp"

using namespace treeshaper::infrastructure;
using treeshaper::application::StructureEditorService;
using treeshaper::domain::structure::DirectoryNode;
using treeshaper::domain::structure::EntryKind;

namespace {

void TestEncodeOmitsRootName() {
    DirectoryNode root;
    root.folders = {DirectoryNode{"src", {}, {"main.py"}}};
    root.files = {"README.md"};

    nlohmann::json j = StructureJson::ToJson(root);
    assert(!j.contains("name"));
    assert(j["files"] == nlohmann::json::array({"README.md"}));
    assert(j["folders"][0]["name"] == "src");
    assert(j["folders"][0]["folders"].is_array() && j["folders"][0]["folders"].empty());
    assert(j["folders"][0]["files"][0] == "main.py");
}

void TestDecodeGeneratorOutput() {
    // Shape produced by the structure generator, including its "path" key
    const char* text = R"({
        "path": "./",
        "folders": [
            {"name": "src", "folders": [], "files": ["main.py"]},
            {"name": "docs"},
            {"folders": [], "files": ["orphan.txt"]}
        ],
        "files": ["README.md"]
    })";

    auto structure = StructureJson::ParseStructure(text);
    assert(structure);
    assert(structure->name.empty());
    assert(structure->files.size() == 1);
    assert(structure->folders.size() == 2);
    assert(structure->folders[0].files[0] == "main.py");
    assert(structure->folders[1].name == "docs");
    assert(structure->folders[1].isEmpty());
}

void TestRejectsMalformedDocuments() {
    assert(!StructureJson::ParseStructure("{ not json"));
    assert(!StructureJson::ParseStructure("[]"));
    assert(!StructureJson::ParseStructure(R"({"files": "README.md"})"));
    assert(!StructureJson::ParseStructure(R"({"folders": {"name": "src"}})"));
    assert(!StructureJson::ParseStructure(R"({"files": [1, 2]})"));

    auto empty = StructureJson::ParseStructure("{}");
    assert(empty && empty->isEmpty());
}

void TestRoundTripPreservesStoredOrder() {
    DirectoryNode root;
    root.folders = {DirectoryNode{"zeta", {}, {"b.txt", "a.txt"}}, DirectoryNode{"Alpha", {}, {}}};
    root.files = {"z.md", "A.md"};

    auto decoded = StructureJson::ParseStructure(StructureJson::Serialize(root));
    assert(decoded);
    assert(*decoded == root);

    StructureEditorService editor;
    editor.setStructure(*decoded);
    assert(StructureJson::ToJson(editor.getStructure()) == StructureJson::ToJson(root));
}

void TestRepositorySaveAndLoad() {
    std::string testRoot = "test_project_root_structure";
    std::filesystem::remove_all(testRoot);
    std::string file = testRoot + "/nested/structure.json";

    auto persistence = std::make_shared<PersistenceService>();
    StructureRepositoryFs repository(persistence);

    assert(!repository.load(file));

    StructureEditorService editor([&](const DirectoryNode& structure) {
        repository.save(file, structure);
    });
    assert(editor.addPath("src/app/main.cpp", EntryKind::File));
    assert(editor.addPath("CMakeLists.txt", EntryKind::File));
    assert(editor.addPath("docs", EntryKind::Directory));

    persistence->flush();
    auto loaded = repository.load(file);
    assert(loaded);
    assert(*loaded == editor.getStructure());

    assert(editor.deletePath("docs", EntryKind::Directory));
    assert(repository.saveNow(file, editor.getStructure()));
    loaded = repository.load(file);
    assert(loaded && loaded->folders.size() == 1);

    {
        std::ofstream broken(file);
        broken << "{\"folders\": 3}";
    }
    assert(!repository.load(file));

    persistence->stop();
    std::filesystem::remove_all(testRoot);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Structure JSON Round-Trip Test..." << std::endl;

    TestEncodeOmitsRootName();
    TestDecodeGeneratorOutput();
    TestRejectsMalformedDocuments();
    TestRoundTripPreservesStoredOrder();
    TestRepositorySaveAndLoad();

    std::cout << "[PASS] Structure JSON Round-Trip Test." << std::endl;
    return 0;
}
