#include "gtest/gtest.h"
#include "FolderResolver.h"
#include "FakeDocumentStore.h"

class FolderResolverTest : public ::testing::Test {
protected:
    FakeDocumentStore store;
    std::vector<std::string> logs;
    FolderResolver resolver{store, [this](const std::string& msg) { logs.push_back(msg); }};
};

TEST_F(FolderResolverTest, EmptyPathIsRoot) {
    ASSERT_FALSE(resolver.resolveFolderPath("").has_value());
    ASSERT_FALSE(resolver.resolveFolderPath("///").has_value());
    ASSERT_TRUE(store.calls.empty());
}

TEST_F(FolderResolverTest, SplitPathIgnoresEmptySegments) {
    auto segments = FolderResolver::splitPath("/A//B/");
    ASSERT_EQ(segments.size(), 2u);
    ASSERT_EQ(segments[0], "A");
    ASSERT_EQ(segments[1], "B");
}

TEST_F(FolderResolverTest, CreatesMissingSegments) {
    FolderHandle b = resolver.resolveFolderPath("A/B");

    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(b->title, "B");
    ASSERT_EQ(store.countCalls("createFolder:A@root"), 1);
    ASSERT_EQ(store.countCalls("createFolder:B@A"), 1);

    auto a = store.live("A", DocumentKind::Folder);
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(a[0].parentId, "");
    ASSERT_EQ(store.live("B", DocumentKind::Folder)[0].parentId, a[0].id);
}

TEST_F(FolderResolverTest, ResolutionIsIdempotent) {
    FolderHandle first = resolver.resolveFolderPath("A/B");
    FolderHandle second = resolver.resolveFolderPath("A/B");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first->id, second->id);
    ASSERT_EQ(store.countCalls("createFolder:"), 2);
    ASSERT_EQ(store.live("A", DocumentKind::Folder).size(), 1u);
    ASSERT_EQ(store.live("B", DocumentKind::Folder).size(), 1u);
}

TEST_F(FolderResolverTest, ReusesExistingFolderByExactTitle) {
    std::string existing = store.addFolder("Reports");
    store.addFolder("reports");

    FolderHandle handle = resolver.resolveFolderPath("Reports");
    ASSERT_TRUE(handle.has_value());
    ASSERT_EQ(handle->id, existing);
    ASSERT_EQ(store.countCalls("createFolder:"), 0);
}

TEST_F(FolderResolverTest, SameTitleUnderOtherParentIsNotReused) {
    std::string other = store.addFolder("Other");
    store.addFolder("B", other);

    FolderHandle b = resolver.resolveFolderPath("A/B");
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(store.countCalls("createFolder:B@A"), 1);
}

TEST_F(FolderResolverTest, CreationFailureStopsAtDeepestResolvedAncestor) {
    store.failFolderCreation.insert("B");

    FolderHandle handle = resolver.resolveFolderPath("A/B/C");

    ASSERT_TRUE(handle.has_value());
    ASSERT_EQ(handle->title, "A");
    ASSERT_EQ(store.countCalls("createFolder:C"), 0);
    ASSERT_FALSE(logs.empty());
}

TEST_F(FolderResolverTest, CreationFailureAtFirstSegmentFallsBackToRoot) {
    store.failFolderCreation.insert("A");
    ASSERT_FALSE(resolver.resolveFolderPath("A/B").has_value());
}

TEST_F(FolderResolverTest, FindOrCreateReportsCreationFailure) {
    store.failFolderCreation.insert("X");
    auto result = resolver.findOrCreate("X", std::nullopt, {});
    ASSERT_FALSE(result.ok());
    ASSERT_EQ(result.error.kind, RemoteErrorKind::CreationFailure);
}
