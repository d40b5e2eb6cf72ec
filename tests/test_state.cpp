#include "polyp/errors.h"
#include "polyp/state.h"
#include "polyp/utils.h"
#include "temp_dir.h"

#include <gtest/gtest.h>

namespace {

OperationMetadata sample_metadata(const std::string& target = "feature-2") {
    Stack stack = {
        {"c1", {"feature-1"}, "Add auth\n\nWith \"details\"\n"},
        {"c2", {"feature-2"}, "Add settings \xe2\x9c\x93"},
    };
    return make_metadata("main", "base0", target, stack, "feature-2");
}

}

TEST(StateStoreTest, LoadWithoutSaveIsNotFound) {
    TempDir dir;
    StateStore store(dir.path().string());

    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(store.load().has_value());
}

TEST(StateStoreTest, SaveThenLoadReproducesRecord) {
    TempDir dir;
    StateStore store(dir.path().string());
    OperationMetadata metadata = sample_metadata();

    store.save(metadata);

    ASSERT_TRUE(store.exists());
    std::optional<OperationMetadata> loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->base_branch, metadata.base_branch);
    EXPECT_EQ(loaded->target_branch, metadata.target_branch);
    EXPECT_EQ(loaded->original_branch, metadata.original_branch);
    EXPECT_EQ(loaded->merge_base, metadata.merge_base);
    EXPECT_EQ(loaded->timestamp, metadata.timestamp);
    EXPECT_EQ(loaded->stack, metadata.stack);
    EXPECT_FALSE(file_exists(store.path() + ".lock"));
}

TEST(StateStoreTest, SaveOverwritesPreviousRecord) {
    TempDir dir;
    StateStore store(dir.path().string());

    store.save(sample_metadata("first"));
    store.save(sample_metadata("second"));

    EXPECT_EQ(store.load()->target_branch, "second");
}

TEST(StateStoreTest, RemoveIsIdempotent) {
    TempDir dir;
    StateStore store(dir.path().string());
    store.save(sample_metadata());

    store.remove();
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(store.load().has_value());
    EXPECT_NO_THROW(store.remove());
}

TEST(StateStoreTest, CorruptRecordIsNotNotFound) {
    TempDir dir;
    StateStore store(dir.path().string());
    write_file(store.path(), "garbage\n");

    EXPECT_TRUE(store.exists());
    try {
        store.load();
        FAIL() << "expected MetadataError";
    } catch (const MetadataError& e) {
        EXPECT_EQ(e.kind(), MetadataErrorKind::InvalidStructure);
    }
}

TEST(StateStoreTest, StoresAreScopedToTheirGitDir) {
    TempDir first_dir;
    TempDir second_dir;
    StateStore first(first_dir.path().string());
    StateStore second(second_dir.path().string());

    first.save(sample_metadata("first"));

    EXPECT_TRUE(first.exists());
    EXPECT_FALSE(second.exists());
    EXPECT_NE(first.path(), second.path());
    EXPECT_EQ(std::filesystem::path(first.path()).filename().string(), METADATA_FILENAME);
}
