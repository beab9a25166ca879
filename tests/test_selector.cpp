#include <gtest/gtest.h>
#include "bk_selector.h"
#include "test_util.h"
#include <climits>

static std::vector<std::string> paths_in_view(const SelectorState& s) {
    std::vector<std::string> paths;
    for (size_t idx : s.filtered) {
        paths.push_back(s.bookmarks[idx].path);
    }
    return paths;
}

static void type_text(SelectorState& s, const std::string& text) {
    for (char c : text) {
        step(s, KeyEvent::character(c));
    }
}

static std::vector<Bookmark> work_and_play() {
    return {make_bookmark("/home/u/work", "work", 0), make_bookmark("/tmp/play", "", 0)};
}

TEST(SelectorTest, SessionSortsByUsageKeepingTies) {
    auto s = make_session({
        make_bookmark("/A", "", 3),
        make_bookmark("/B", "", 1),
        make_bookmark("/C", "", 3),
        make_bookmark("/D", "", 2),
    });

    std::vector<std::string> expected = {"/A", "/C", "/D", "/B"};
    EXPECT_EQ(paths_in_view(s), expected);
    EXPECT_EQ(s.cursor, 0u);
    EXPECT_FALSE(s.editing);
    EXPECT_TRUE(s.filter.empty());
}

TEST(SelectorTest, FilterMatchesNameOrPathIgnoringCase) {
    auto bookmarks = work_and_play();

    EXPECT_EQ(filter_bookmarks(bookmarks, "wo"), std::vector<size_t>({0}));
    EXPECT_EQ(filter_bookmarks(bookmarks, "/tmp"), std::vector<size_t>({1}));
    EXPECT_EQ(filter_bookmarks(bookmarks, ""), std::vector<size_t>({0, 1}));
    EXPECT_EQ(filter_bookmarks(bookmarks, "WORK"), std::vector<size_t>({0}));
    EXPECT_TRUE(filter_bookmarks(bookmarks, "nothing").empty());
}

TEST(SelectorTest, TypingBuildsFilterAndResetsCursor) {
    auto s = make_session(work_and_play());
    step(s, KeyEvent::of(KeyType::Down));
    ASSERT_EQ(s.cursor, 1u);

    type_text(s, "/tmp");
    EXPECT_EQ(s.filter, "/tmp");
    EXPECT_EQ(s.cursor, 0u);
    EXPECT_EQ(paths_in_view(s), std::vector<std::string>({"/tmp/play"}));
}

TEST(SelectorTest, CommandLettersFilterOnceFilterIsActive) {
    auto s = make_session(work_and_play());
    type_text(s, "pq");
    EXPECT_EQ(s.filter, "pq");

    // j/k/d/e are filter text too
    auto t = make_session(work_and_play());
    type_text(t, "wdjke");
    EXPECT_EQ(t.filter, "wdjke");
    EXPECT_FALSE(t.editing);
    EXPECT_EQ(t.bookmarks.size(), 2u);
}

TEST(SelectorTest, BackspaceShortensFilter) {
    auto s = make_session(work_and_play());
    type_text(s, "/tmpx");
    EXPECT_TRUE(s.filtered.empty());

    step(s, KeyEvent::of(KeyType::Backspace));
    EXPECT_EQ(s.filter, "/tmp");
    EXPECT_EQ(s.filtered.size(), 1u);

    // Empty filter: no-op
    auto t = make_session(work_and_play());
    StepResult r = step(t, KeyEvent::of(KeyType::Backspace));
    EXPECT_TRUE(r.running);
    EXPECT_EQ(t.filtered.size(), 2u);
}

TEST(SelectorTest, EscapeClearsFilterBeforeQuitting) {
    auto s = make_session(work_and_play());
    type_text(s, "wo");

    StepResult r = step(s, KeyEvent::of(KeyType::Escape));
    EXPECT_TRUE(r.running);
    EXPECT_TRUE(s.filter.empty());
    EXPECT_EQ(s.filtered.size(), 2u);
    EXPECT_EQ(s.cursor, 0u);

    r = step(s, KeyEvent::of(KeyType::Escape));
    EXPECT_FALSE(r.running);
    EXPECT_FALSE(s.result.has_value());
}

TEST(SelectorTest, QuitWithoutResult) {
    auto s = make_session(work_and_play());
    StepResult r = step(s, KeyEvent::character('q'));
    EXPECT_FALSE(r.running);
    EXPECT_FALSE(r.persist);
    EXPECT_FALSE(s.result.has_value());
}

TEST(SelectorTest, InterruptQuitsEvenWhileFiltering) {
    auto s = make_session(work_and_play());
    type_text(s, "wo");
    StepResult r = step(s, KeyEvent::of(KeyType::Interrupt));
    EXPECT_FALSE(r.running);
    EXPECT_FALSE(s.result.has_value());
}

TEST(SelectorTest, CursorIsClampedAtBothEnds) {
    auto s = make_session(work_and_play());

    step(s, KeyEvent::of(KeyType::Up));
    EXPECT_EQ(s.cursor, 0u);

    step(s, KeyEvent::character('j'));
    EXPECT_EQ(s.cursor, 1u);
    step(s, KeyEvent::of(KeyType::Down));
    EXPECT_EQ(s.cursor, 1u);

    step(s, KeyEvent::character('k'));
    EXPECT_EQ(s.cursor, 0u);
}

TEST(SelectorTest, SpaceIsIgnoredWhileBrowsing) {
    auto s = make_session(work_and_play());
    StepResult r = step(s, KeyEvent::character(' '));
    EXPECT_TRUE(r.running);
    EXPECT_TRUE(s.filter.empty());
}

TEST(SelectorTest, OtherKeysAreIgnored) {
    auto s = make_session(work_and_play());
    StepResult r = step(s, KeyEvent::of(KeyType::Other));
    EXPECT_TRUE(r.running);
    EXPECT_FALSE(r.persist);
    EXPECT_EQ(s.filtered.size(), 2u);
}

TEST(SelectorTest, EnterSelectsAndCountsUsage) {
    auto s = make_session({make_bookmark("/a", "", 5), make_bookmark("/b", "", 1)});
    step(s, KeyEvent::of(KeyType::Down));

    StepResult r = step(s, KeyEvent::of(KeyType::Enter));
    EXPECT_FALSE(r.running);
    EXPECT_TRUE(r.persist);
    ASSERT_TRUE(s.result.has_value());
    EXPECT_EQ(*s.result, "/b");
    EXPECT_EQ(s.bookmarks[0].count, 5);
    EXPECT_EQ(s.bookmarks[1].count, 2);
}

TEST(SelectorTest, EnterWithNoMatchesDoesNothing) {
    auto s = make_session(work_and_play());
    type_text(s, "zzz");
    StepResult r = step(s, KeyEvent::of(KeyType::Enter));
    EXPECT_TRUE(r.running);
    EXPECT_FALSE(r.persist);
    EXPECT_FALSE(s.result.has_value());
}

TEST(SelectorTest, EditCancelLeavesNameUnchanged) {
    auto s = make_session(work_and_play());
    step(s, KeyEvent::character('e'));
    ASSERT_TRUE(s.editing);
    EXPECT_EQ(s.edit_buffer, "work");

    // clear the seeded name
    for (int i = 0; i < 4; i++) {
        step(s, KeyEvent::of(KeyType::Backspace));
    }
    type_text(s, "xy");
    StepResult r = step(s, KeyEvent::of(KeyType::Escape));
    EXPECT_TRUE(r.running);
    EXPECT_FALSE(r.persist);
    EXPECT_FALSE(s.editing);
    EXPECT_TRUE(s.edit_buffer.empty());
    EXPECT_EQ(s.bookmarks[0].name, "work");
}

TEST(SelectorTest, EditConfirmRenames) {
    auto s = make_session(work_and_play());
    step(s, KeyEvent::of(KeyType::Down));
    step(s, KeyEvent::character('e'));
    ASSERT_TRUE(s.editing);
    EXPECT_TRUE(s.edit_buffer.empty());

    type_text(s, "x y");
    StepResult r = step(s, KeyEvent::of(KeyType::Enter));
    EXPECT_TRUE(r.running);
    EXPECT_TRUE(r.persist);
    EXPECT_FALSE(s.editing);
    EXPECT_EQ(s.bookmarks[1].name, "x y");
    EXPECT_FALSE(s.result.has_value());
}

TEST(SelectorTest, EditModeSwallowsCommandKeys) {
    auto s = make_session(work_and_play());
    step(s, KeyEvent::character('e'));
    type_text(s, "qdjk");
    EXPECT_TRUE(s.editing);
    EXPECT_EQ(s.edit_buffer, "workqdjk");
    EXPECT_EQ(s.bookmarks.size(), 2u);
    EXPECT_EQ(s.cursor, 0u);
    EXPECT_TRUE(s.filter.empty());
}

TEST(SelectorTest, EditNotAvailableWithoutBookmarks) {
    auto s = make_session({});
    step(s, KeyEvent::character('e'));
    EXPECT_FALSE(s.editing);
    EXPECT_TRUE(s.filter.empty());
}

TEST(SelectorTest, DeleteRecomputesViewFromRemainingList) {
    auto s = make_session({make_bookmark("/a"), make_bookmark("/b"), make_bookmark("/c")});
    step(s, KeyEvent::of(KeyType::Down));

    StepResult r = step(s, KeyEvent::character('d'));
    EXPECT_TRUE(r.running);
    EXPECT_TRUE(r.persist);
    EXPECT_EQ(paths_in_view(s), std::vector<std::string>({"/a", "/c"}));
    EXPECT_EQ(s.cursor, 1u);
}

TEST(SelectorTest, DeleteLastRowMovesCursorUp) {
    auto s = make_session({make_bookmark("/a"), make_bookmark("/b")});
    step(s, KeyEvent::of(KeyType::Down));
    step(s, KeyEvent::character('d'));
    EXPECT_EQ(paths_in_view(s), std::vector<std::string>({"/a"}));
    EXPECT_EQ(s.cursor, 0u);
}

TEST(SelectorTest, DeleteOnlyRowLeavesCursorAtZero) {
    auto s = make_session({make_bookmark("/only")});
    step(s, KeyEvent::character('d'));
    EXPECT_TRUE(s.bookmarks.empty());
    EXPECT_TRUE(s.filtered.empty());
    EXPECT_EQ(s.cursor, 0u);

    // Nothing left to delete or select
    StepResult r = step(s, KeyEvent::character('d'));
    EXPECT_FALSE(r.persist);
    r = step(s, KeyEvent::of(KeyType::Enter));
    EXPECT_TRUE(r.running);
}

TEST(SelectorTest, Utf8InputIsEditedPerCharacter) {
    auto s = make_session({make_bookmark("/home/u/caf\xc3\xa9")});
    type_text(s, "caf\xc3\xa9");
    EXPECT_EQ(s.filtered.size(), 1u);

    step(s, KeyEvent::of(KeyType::Backspace));
    EXPECT_EQ(s.filter, "caf");
}

TEST(SelectorTest, RenderShowsEmptyState) {
    auto s = make_session({});
    auto lines = render_view(s);

    bool found = false;
    for (const auto& line : lines) {
        EXPECT_FALSE(line.is_cursor);
        if (line.text().find("bk add") != std::string::npos) found = true;
    }
    EXPECT_TRUE(found);
}

TEST(SelectorTest, RenderMarksCursorRowAndDimsPath) {
    auto s = make_session(work_and_play());
    auto lines = render_view(s);

    std::vector<const ViewLine*> rows;
    for (const auto& line : lines) {
        std::string text = line.text();
        if (text.find("/home/u/work") != std::string::npos || text.find("/tmp/play") != std::string::npos) {
            rows.push_back(&line);
        }
    }
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_TRUE(rows[0]->is_cursor);
    EXPECT_EQ(rows[0]->text(), "  > work /home/u/work");
    ASSERT_EQ(rows[0]->spans.size(), 3u);
    EXPECT_EQ(rows[0]->spans[1].style, ViewStyle::Selected);
    EXPECT_EQ(rows[0]->spans[2].style, ViewStyle::Dim);

    EXPECT_FALSE(rows[1]->is_cursor);
    EXPECT_EQ(rows[1]->text(), "    /tmp/play");

    EXPECT_NE(lines.back().text().find("q quit"), std::string::npos);
}

TEST(SelectorTest, RenderShowsFilterEditPromptAndNoMatches) {
    auto s = make_session(work_and_play());
    step(s, KeyEvent::character('e'));
    auto lines = render_view(s);
    bool has_prompt = false;
    for (const auto& line : lines) {
        if (line.text() == "  Rename bookmark: work") has_prompt = true;
    }
    EXPECT_TRUE(has_prompt);

    auto t = make_session(work_and_play());
    type_text(t, "zzz");
    lines = render_view(t);
    bool has_filter = false;
    bool has_no_matches = false;
    for (const auto& line : lines) {
        if (line.text() == "  filter: zzz") has_filter = true;
        if (line.text() == "  No matches") has_no_matches = true;
    }
    EXPECT_TRUE(has_filter);
    EXPECT_TRUE(has_no_matches);
}

class SelectorStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path store_path() const { return tmp.path() / "bk" / "bookmarks.json"; }
};

TEST_F(SelectorStoreTest, SelectionIsPersisted) {
    BookmarkStore store(store_path());
    std::string error;
    ASSERT_TRUE(store.save({make_bookmark("/x", "", 1), make_bookmark("/y", "why", 5)}, error));

    Selector selector(store);
    EXPECT_FALSE(selector.dispatch(KeyEvent::of(KeyType::Enter)));
    ASSERT_TRUE(selector.result().has_value());
    EXPECT_EQ(*selector.result(), "/y");
    EXPECT_TRUE(selector.save_error().empty());

    auto saved = store.load();
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved[0], make_bookmark("/y", "why", 6));
    EXPECT_EQ(saved[1], make_bookmark("/x", "", 1));
}

TEST_F(SelectorStoreTest, RenameAndDeleteArePersisted) {
    BookmarkStore store(store_path());
    Selector selector(store, {make_bookmark("/a"), make_bookmark("/b")});

    selector.dispatch(KeyEvent::character('e'));
    selector.dispatch(KeyEvent::character('z'));
    selector.dispatch(KeyEvent::of(KeyType::Enter));
    EXPECT_EQ(store.load()[0].name, "z");

    selector.dispatch(KeyEvent::character('j'));
    EXPECT_TRUE(selector.dispatch(KeyEvent::character('d')));
    EXPECT_EQ(store.load(), std::vector<Bookmark>({make_bookmark("/a", "z", 0)}));
}

TEST_F(SelectorStoreTest, NavigationDoesNotWrite) {
    BookmarkStore store(store_path());
    Selector selector(store, {make_bookmark("/a"), make_bookmark("/b")});

    selector.dispatch(KeyEvent::of(KeyType::Down));
    selector.dispatch(KeyEvent::character('a'));
    selector.dispatch(KeyEvent::of(KeyType::Escape));
    EXPECT_FALSE(fs::exists(store_path()));
}

TEST_F(SelectorStoreTest, SaveFailureIsReported) {
    write_file(tmp.path() / "blocker", "x");
    BookmarkStore store(tmp.path() / "blocker" / "bookmarks.json");
    Selector selector(store, {make_bookmark("/a"), make_bookmark("/b")});

    EXPECT_TRUE(selector.dispatch(KeyEvent::character('d')));
    EXPECT_FALSE(selector.save_error().empty());
    EXPECT_NE(selector.session().status.find("Failed to save"), std::string::npos);
    EXPECT_EQ(selector.session().bookmarks.size(), 1u);

    auto lines = render_view(selector.session());
    EXPECT_EQ(lines.back().spans.back().style, ViewStyle::Error);

    // Status clears on the next key
    selector.dispatch(KeyEvent::of(KeyType::Down));
    EXPECT_TRUE(selector.session().status.empty());
}

TEST(SelectorTest, SelectionCountSaturates) {
    auto s = make_session({make_bookmark("/max", "", INT_MAX)});
    step(s, KeyEvent::of(KeyType::Enter));
    EXPECT_EQ(s.bookmarks[0].count, INT_MAX);
    ASSERT_TRUE(s.result.has_value());
}

TEST_F(SelectorStoreTest, RenameWithHighByteIsSaved) {
    BookmarkStore store(store_path());
    Selector selector(store, {make_bookmark("/a")});

    selector.dispatch(KeyEvent::character('e'));
    selector.dispatch(KeyEvent::character(static_cast<char>(0xE9)));
    EXPECT_TRUE(selector.dispatch(KeyEvent::of(KeyType::Enter)));
    EXPECT_TRUE(selector.save_error().empty());

    auto saved = store.load();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0].name, "\xef\xbf\xbd");
}

TEST_F(SelectorStoreTest, SaveErrorClearsAfterLaterSuccess) {
    fs::path blocker = tmp.path() / "blocker";
    write_file(blocker, "x");
    BookmarkStore store(blocker / "bookmarks.json");
    Selector selector(store, {make_bookmark("/a"), make_bookmark("/b")});

    selector.dispatch(KeyEvent::character('d'));
    ASSERT_FALSE(selector.save_error().empty());

    fs::remove(blocker);
    EXPECT_FALSE(selector.dispatch(KeyEvent::of(KeyType::Enter)));
    EXPECT_TRUE(selector.save_error().empty());
    EXPECT_EQ(store.load(), std::vector<Bookmark>({make_bookmark(*selector.result(), "", 1)}));
}
