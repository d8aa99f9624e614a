#include <cassert>
#include <iostream>

#include "application/StructureEditorService.hpp"

using namespace treeshaper::application;
using treeshaper::domain::structure::EntryKind;

namespace {

DirectoryNode SampleStructure() {
    DirectoryNode root;
    root.files = {"README.md", "setup.py"};
    DirectoryNode src{"src", {}, {"main.py"}};
    DirectoryNode tests{"tests", {}, {"test_main.py"}};
    root.folders = {src, tests};
    return root;
}

void TestAddCreatesIntermediates() {
    StructureEditorService editor;
    assert(editor.addPath("src/lib/util.go", EntryKind::File));

    const auto& root = editor.getStructure();
    assert(root.folders.size() == 1);
    assert(root.folders[0].name == "src");
    assert(root.folders[0].folders.size() == 1);
    assert(root.folders[0].folders[0].name == "lib");
    assert(root.folders[0].folders[0].files.size() == 1);
    assert(root.folders[0].folders[0].files[0] == "util.go");
    assert(root.files.empty());
}

void TestAddRejectsDuplicate() {
    StructureEditorService editor;
    assert(editor.addPath("a.txt", EntryKind::File));
    assert(!editor.addPath("a.txt", EntryKind::File));
    assert(editor.getStructure().files.size() == 1);

    // Files and directories are checked independently
    assert(editor.addPath("a.txt", EntryKind::Directory));
    assert(!editor.addPath("/a.txt/", EntryKind::Directory));
    assert(editor.getStructure().folders.size() == 1);

    assert(!editor.addPath("", EntryKind::File));
    assert(!editor.addPath("//", EntryKind::Directory));
}

void TestDeleteRemovesSubtree() {
    DirectoryNode root;
    root.folders.push_back(DirectoryNode{"x", {}, {"y.txt"}});

    StructureEditorService editor;
    editor.setStructure(root);
    assert(editor.deletePath("x", EntryKind::Directory));
    assert(editor.getStructure().folders.empty());

    assert(editor.addPath("x/y.txt", EntryKind::File));
    const auto& x = editor.getStructure().folders.at(0);
    assert(x.name == "x");
    assert(x.files.size() == 1 && x.folders.empty());

    assert(!editor.deletePath("x/missing.txt", EntryKind::File));
    assert(!editor.deletePath("x/y.txt", EntryKind::Directory));
    assert(editor.deletePath("x/y.txt", EntryKind::File));
    assert(editor.getStructure().folders.at(0).isEmpty());
}

void TestRenameMissingIsNoOp() {
    StructureEditorService editor;
    editor.setStructure(SampleStructure());
    DirectoryNode before = editor.getStructure();

    assert(!editor.renamePath("missing/file.txt", "new.txt", EntryKind::File));
    assert(!editor.renamePath("src/absent.py", "new.py", EntryKind::File));
    assert(!editor.renamePath("src", "lib", EntryKind::File));
    assert(editor.getStructure() == before);
}

void TestRenameInPlace() {
    StructureEditorService editor;
    editor.setStructure(SampleStructure());

    assert(editor.renamePath("README.md", "README.rst", EntryKind::File));
    assert(editor.getStructure().files[0] == "README.rst");

    assert(editor.renamePath("src", "app", EntryKind::Directory));
    assert(editor.getStructure().folders[0].name == "app");
    assert(editor.exists("app/main.py", EntryKind::File));
    assert(!editor.exists("src/main.py", EntryKind::File));
}

void TestRenameCollisionRejected() {
    StructureEditorService editor;
    editor.setStructure(SampleStructure());
    DirectoryNode before = editor.getStructure();

    assert(!editor.renamePath("README.md", "setup.py", EntryKind::File));
    assert(!editor.renamePath("src", "tests", EntryKind::Directory));
    assert(!editor.renamePath("src", "src", EntryKind::Directory));
    assert(!editor.renamePath("src", "", EntryKind::Directory));
    assert(!editor.renamePath("src", "a/b", EntryKind::Directory));
    assert(editor.getStructure() == before);

    // A directory may share its name with a file
    assert(editor.renamePath("src", "setup.py", EntryKind::Directory));
}

void TestNotificationCount() {
    int notifications = 0;
    const DirectoryNode* lastSeen = nullptr;
    StructureEditorService editor([&](const DirectoryNode& structure) {
        ++notifications;
        lastSeen = &structure;
    });

    editor.setStructure(SampleStructure());
    assert(notifications == 0);

    assert(editor.addPath("docs/index.md", EntryKind::File));
    assert(editor.renamePath("docs/index.md", "intro.md", EntryKind::File));
    assert(editor.deletePath("setup.py", EntryKind::File));
    assert(!editor.deletePath("setup.py", EntryKind::File));

    assert(notifications == 3);
    assert(lastSeen == &editor.getStructure());
}

void TestNotificationSeesCommittedTree() {
    StructureEditorService* self = nullptr;
    bool sawFile = false;
    int notifications = 0;
    StructureEditorService editor([&](const DirectoryNode&) {
        ++notifications;
        sawFile = self->exists("pkg/__init__.py", EntryKind::File);
        // Edits issued from the callback are independent commits
        if (notifications == 1) {
            assert(self->addPath("pkg/module.py", EntryKind::File));
        }
    });
    self = &editor;

    assert(editor.addPath("pkg/__init__.py", EntryKind::File));
    assert(sawFile);
    assert(notifications == 2);
    assert(editor.exists("pkg/module.py", EntryKind::File));
}

void TestSetStructureRoundTrip() {
    DirectoryNode original = SampleStructure();
    original.files = {"z.txt", "a.txt"};

    StructureEditorService editor;
    editor.setStructure(original);
    assert(editor.getStructure() == original);
    assert(editor.getStructure().files[0] == "z.txt");

    // Deep copy: later edits do not reach the caller's tree
    assert(editor.addPath("src/extra.py", EntryKind::File));
    assert(original.folders[0].files.size() == 1);
    assert(editor.getStructure() != original);
}

} // namespace

int main() {
    std::cout << "[Test] Starting StructureEditorService Test..." << std::endl;

    TestAddCreatesIntermediates();
    TestAddRejectsDuplicate();
    TestDeleteRemovesSubtree();
    TestRenameMissingIsNoOp();
    TestRenameInPlace();
    TestRenameCollisionRejected();
    TestNotificationCount();
    TestNotificationSeesCommittedTree();
    TestSetStructureRoundTrip();

    std::cout << "[PASS] StructureEditorService Test." << std::endl;
    return 0;
}
