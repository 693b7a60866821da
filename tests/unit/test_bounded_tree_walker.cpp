#include <catch2/catch_test_macros.hpp>
#include "BoundedTreeWalker.hpp"
#include "PathBoundaryValidator.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

std::vector<WalkEntry> collect(BoundedTreeWalker& walker) {
    std::vector<WalkEntry> entries;
    for (const auto& entry : walker) {
        entries.push_back(entry);
    }
    return entries;
}

std::vector<fs::path> directories_of(const std::vector<WalkEntry>& entries) {
    std::vector<fs::path> directories;
    for (const auto& entry : entries) {
        directories.push_back(entry.directory);
    }
    return directories;
}

}

TEST_CASE("walker yields every directory in pre-order with sorted names") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "b" / "inner" / "deep.txt");
    write_file(root / "b" / "b.txt");
    write_file(root / "a" / "a.txt");
    write_file(root / "top.txt");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk(root);
    const auto entries = collect(walker);

    CHECK(directories_of(entries) == std::vector<fs::path>{root, root / "a", root / "b", root / "b" / "inner"});
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].subdirectories == std::vector<std::string>{"a", "b"});
    CHECK(entries[0].files == std::vector<std::string>{"top.txt"});
    CHECK(entries[2].subdirectories == std::vector<std::string>{"inner"});
    CHECK(entries[2].files == std::vector<std::string>{"b.txt"});
    CHECK(entries[3].files == std::vector<std::string>{"deep.txt"});
    CHECK(walker.inaccessible_count() == 0);
}

TEST_CASE("walker never reports anything outside the project root") {
    TempDir temp_dir;
    TempDir outside;
    const fs::path root = temp_dir.path();
    write_file(root / "safe" / "file.txt");
    write_file(root / ".env", "API_KEY=secret\n");
    write_file(root / ".ssh" / "id_rsa", "PRIVATE KEY\n");
    write_file(outside.path() / "secret.txt");
    fs::create_symlink(outside.path() / "secret.txt", root / "evil");
    fs::create_symlink(outside.path(), root / "evil_dir");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk(root);
    const auto entries = collect(walker);

    for (const auto& entry : entries) {
        CHECK(validator.is_within_root(entry.directory));
        for (const auto& name : entry.files) {
            CHECK(name != "evil");
            CHECK(validator.is_within_root(entry.directory / name));
        }
        for (const auto& name : entry.subdirectories) {
            CHECK(name != "evil_dir");
        }
    }
    REQUIRE_FALSE(entries.empty());
    CHECK(entries.front().files == std::vector<std::string>{".env"});
    CHECK(entries.front().subdirectories == std::vector<std::string>{".ssh", "safe"});
    CHECK(walker.inaccessible_count() == 2);
    for (const auto& failure : walker.inaccessible()) {
        CHECK(failure.code == Code::SYMLINK_OUTSIDE_ROOT);
    }
}

TEST_CASE("walker honours the depth limit") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "level1" / "level2" / "level3" / "file.txt");
    PathBoundaryValidator validator(root);

    SECTION("depth zero lists only the start directory") {
        auto walker = validator.safe_walk(root, 0);
        const auto entries = collect(walker);
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].directory == root);
        CHECK(entries[0].subdirectories == std::vector<std::string>{"level1"});
    }

    SECTION("depth two stops below level2") {
        auto walker = validator.safe_walk(root, 2);
        CHECK(directories_of(collect(walker)) ==
              std::vector<fs::path>{root, root / "level1", root / "level1" / "level2"});
    }

    SECTION("no limit reaches the bottom") {
        auto walker = validator.safe_walk(root);
        CHECK(collect(walker).size() == 4);
    }
}

TEST_CASE("walker ignores broken symlinks") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "real.txt");
    fs::create_symlink(root / "gone.txt", root / "dangling");
    fs::create_symlink("/nonexistent/target", root / "dangling_outside");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk(root);
    const auto entries = collect(walker);

    REQUIRE(entries.size() == 1);
    CHECK(entries[0].files == std::vector<std::string>{"real.txt"});
    CHECK(entries[0].subdirectories.empty());
}

TEST_CASE("walker follows in-root directory symlinks without looping") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "real" / "file.txt");
    fs::create_symlink(root / "real", root / "alias");
    fs::create_symlink(root, root / "real" / "back_to_root");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk(root);
    const auto entries = collect(walker);

    CHECK(directories_of(entries) == std::vector<fs::path>{root, root / "real"});
    REQUIRE_FALSE(entries.empty());
    CHECK(entries[0].subdirectories == std::vector<std::string>{"alias", "real"});
}

TEST_CASE("walker skips unreadable subtrees and keeps going") {
    if (!permissions_are_enforced()) {
        SUCCEED("running as root; permission bits are not enforced");
        return;
    }
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "a_before" / "one.txt");
    write_file(root / "m_locked" / "hidden.txt");
    write_file(root / "z_after" / "two.txt");

    PathBoundaryValidator validator(root);
    LockedDirectory lock(root / "m_locked");
    auto walker = validator.safe_walk(root);
    const auto entries = collect(walker);

    CHECK(directories_of(entries) == std::vector<fs::path>{root, root / "a_before", root / "z_after"});
    CHECK(walker.inaccessible_count() == 1);
    REQUIRE_FALSE(walker.inaccessible().empty());
    CHECK(walker.inaccessible().front().code == Code::PERMISSION_DENIED);
}

TEST_CASE("walker is lazy and can be abandoned early") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "first" / "file.txt");
    write_file(root / "second" / "file.txt");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk(root);

    const auto first = walker.next();
    REQUIRE(first.has_value());
    CHECK(first->directory == root);

    // Removing a directory that was not visited yet is only noticed when reached
    fs::remove_all(root / "second");
    const auto second = walker.next();
    REQUIRE(second.has_value());
    CHECK(second->directory == root / "first");
    CHECK_FALSE(walker.next().has_value());
    CHECK(walker.inaccessible_count() == 1);
    CHECK_FALSE(walker.next().has_value());
}

TEST_CASE("walker rejects invalid start directories") {
    TempDir temp_dir;
    TempDir outside;
    const fs::path root = temp_dir.path();
    write_file(root / "file.txt");
    PathBoundaryValidator validator(root);

    CHECK(capture_error_code([&] { validator.safe_walk(outside.path()); }) == Code::PATH_OUTSIDE_ROOT);
    CHECK(capture_error_code([&] { validator.safe_walk(root / "file.txt"); }) == Code::NOT_A_DIRECTORY);
    CHECK(capture_error_code([&] { validator.safe_walk(root / "missing"); }) == Code::PATH_NOT_FOUND);
}

TEST_CASE("walker can start from a subdirectory") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "src" / "lib" / "code.cpp");
    write_file(root / "docs" / "readme.md");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk("src");
    CHECK(directories_of(collect(walker)) == std::vector<fs::path>{root / "src", root / "src" / "lib"});
}

TEST_CASE("walker skips a directory that vanishes before it is listed") {
    TempDir temp_dir;
    const fs::path root = temp_dir.path();
    write_file(root / "a" / "one.txt");
    write_file(root / "b" / "two.txt");
    write_file(root / "c" / "three.txt");

    PathBoundaryValidator validator(root);
    auto walker = validator.safe_walk(root);

    const auto top = walker.next();
    REQUIRE(top.has_value());
    CHECK(top->subdirectories == std::vector<std::string>{"a", "b", "c"});

    fs::remove_all(root / "b");
    std::vector<fs::path> rest;
    while (auto entry = walker.next()) {
        rest.push_back(entry->directory);
    }

    CHECK(rest == std::vector<fs::path>{root / "a", root / "c"});
    REQUIRE(walker.inaccessible_count() == 1);
    CHECK(walker.inaccessible().front().code == ErrorCodes::Code::PATH_NOT_FOUND);
    CHECK(walker.inaccessible().front().kind() == BoundaryErrorKind::Inaccessible);
}
