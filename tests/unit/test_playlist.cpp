#include "../framework/SimpleTest.hpp"
#include "backend/PlaylistStore.hpp"
#include <algorithm>
#include <vector>

using namespace turntable::backend;
using turntable::model::RepeatMode;

namespace {

PlaylistStore make_store(const std::vector<std::string>& tracks, int current = -1) {
    PlaylistStore store(42);
    store.add_tracks(tracks);
    store.set_current_index(current);
    return store;
}

const std::vector<std::string> ABCD = {"/m/A.mp3", "/m/B.ogg", "/m/C.flac", "/m/D.wav"};

}  // namespace

// ========== ADDING ==========

TEST_CASE(test_add_tracks_filters_extensions) {
    PlaylistStore store(1);
    size_t added = store.add_tracks({"/m/a.mp3", "/m/b.txt", "/m/c.FLAC", "/m/d", "/m/e.S3M"});

    ASSERT_EQ(added, 3u);
    ASSERT_EQ(store.size(), 3u);
    ASSERT_EQ(store.tracks()[1], "/m/c.FLAC");
    ASSERT_EQ(store.current_index(), -1);
}

TEST_CASE(test_add_tracks_allows_duplicates) {
    PlaylistStore store(1);
    store.add_tracks({"/m/a.mp3", "/m/a.mp3"});
    ASSERT_EQ(store.size(), 2u);
}

TEST_CASE(test_add_tracks_updates_original_order) {
    auto store = make_store({"/m/A.mp3"});
    store.add_tracks({"/m/B.mp3"});
    ASSERT_TRUE(store.original_order() == store.tracks());
}

// ========== NAVIGATION ==========

TEST_CASE(test_next_index_wraps_full_cycle) {
    auto store = make_store(ABCD, 0);
    std::vector<int> seen;
    for (int i = 0; i < 4; ++i) {
        int next = store.next_index();
        seen.push_back(next);
        store.set_current_index(next);
    }
    ASSERT_TRUE((seen == std::vector<int>{1, 2, 3, 0}));
}

TEST_CASE(test_prev_index_wraps_full_cycle) {
    auto store = make_store(ABCD, 0);
    std::vector<int> seen;
    for (int i = 0; i < 4; ++i) {
        int prev = store.prev_index();
        seen.push_back(prev);
        store.set_current_index(prev);
    }
    ASSERT_TRUE((seen == std::vector<int>{3, 2, 1, 0}));
}

TEST_CASE(test_navigation_from_unset_cursor) {
    auto store = make_store({"/m/A.mp3", "/m/B.mp3", "/m/C.mp3"});
    ASSERT_EQ(store.next_index(), 0);
    ASSERT_EQ(store.prev_index(), 1);
}

TEST_CASE(test_navigation_empty_playlist) {
    PlaylistStore store(1);
    ASSERT_EQ(store.next_index(), -1);
    ASSERT_EQ(store.prev_index(), -1);
}

TEST_CASE(test_repeat_one_pins_navigation) {
    auto store = make_store(ABCD, 2);
    store.toggle_repeat();
    ASSERT_EQ(store.repeat_mode(), RepeatMode::One);
    ASSERT_EQ(store.next_index(), 2);
    ASSERT_EQ(store.prev_index(), 2);

    store.toggle_repeat();
    ASSERT_EQ(store.repeat_mode(), RepeatMode::Off);
    ASSERT_EQ(store.next_index(), 3);
}

TEST_CASE(test_set_current_index_rejects_out_of_range) {
    auto store = make_store(ABCD, 1);
    ASSERT_FALSE(store.set_current_index(4));
    ASSERT_FALSE(store.set_current_index(-2));
    ASSERT_EQ(store.current_index(), 1);
    ASSERT_TRUE(store.set_current_index(-1));
    ASSERT_FALSE(store.current_track().has_value());
}

// ========== REMOVAL ==========

TEST_CASE(test_remove_before_current_shifts_cursor) {
    auto store = make_store({"/m/A.mp3", "/m/B.mp3", "/m/C.mp3"}, 1);
    store.remove_items({0});

    ASSERT_EQ(store.size(), 2u);
    ASSERT_EQ(store.tracks()[0], "/m/B.mp3");
    ASSERT_EQ(store.current_index(), 0);
}

TEST_CASE(test_remove_current_clears_cursor) {
    auto store = make_store({"/m/A.mp3", "/m/B.mp3", "/m/C.mp3"}, 1);
    store.remove_items({1});
    ASSERT_EQ(store.current_index(), -1);
}

TEST_CASE(test_remove_after_current_keeps_cursor) {
    auto store = make_store({"/m/A.mp3", "/m/B.mp3", "/m/C.mp3"}, 1);
    store.remove_items({2});
    ASSERT_EQ(store.current_index(), 1);
    ASSERT_EQ(*store.current_track(), "/m/B.mp3");
}

TEST_CASE(test_remove_multiple_unsorted_with_duplicates) {
    auto store = make_store(ABCD, 3);
    store.remove_items({0, 2, 0, 9, -1});

    ASSERT_EQ(store.size(), 2u);
    ASSERT_EQ(store.tracks()[0], "/m/B.ogg");
    ASSERT_EQ(store.tracks()[1], "/m/D.wav");
    ASSERT_EQ(store.current_index(), 1);
    ASSERT_TRUE(store.original_order() == store.tracks());
}

TEST_CASE(test_remove_everything) {
    auto store = make_store(ABCD, 2);
    store.remove_items({0, 1, 2, 3});
    ASSERT_TRUE(store.empty());
    ASSERT_EQ(store.current_index(), -1);
}

TEST_CASE(test_clear_resets_cursor) {
    auto store = make_store(ABCD, 2);
    store.clear();
    ASSERT_TRUE(store.empty());
    ASSERT_TRUE(store.original_order().empty());
    ASSERT_EQ(store.current_index(), -1);
}

// ========== SHUFFLE ==========

TEST_CASE(test_shuffle_moves_current_to_front) {
    auto store = make_store(ABCD, 2);
    store.toggle_shuffle();

    ASSERT_TRUE(store.shuffle_enabled());
    ASSERT_EQ(store.current_index(), 0);
    ASSERT_EQ(store.tracks()[0], "/m/C.flac");
    ASSERT_EQ(store.size(), 4u);

    auto sorted = store.tracks();
    std::sort(sorted.begin(), sorted.end());
    auto expected = ABCD;
    std::sort(expected.begin(), expected.end());
    ASSERT_TRUE(sorted == expected);
}

TEST_CASE(test_unshuffle_restores_order_and_cursor) {
    auto store = make_store(ABCD, 2);
    store.toggle_shuffle();
    store.toggle_shuffle();

    ASSERT_FALSE(store.shuffle_enabled());
    ASSERT_TRUE(store.tracks() == ABCD);
    ASSERT_EQ(store.current_index(), 2);
}

TEST_CASE(test_unshuffle_follows_cursor_moved_while_shuffled) {
    auto store = make_store(ABCD, 0);
    store.toggle_shuffle();
    store.set_current_index(3);
    std::string playing = *store.current_track();

    store.toggle_shuffle();
    ASSERT_TRUE(store.tracks() == ABCD);
    ASSERT_EQ(*store.current_track(), playing);
}

TEST_CASE(test_shuffle_without_cursor) {
    auto store = make_store(ABCD);
    store.toggle_shuffle();
    ASSERT_EQ(store.current_index(), -1);
    store.toggle_shuffle();
    ASSERT_TRUE(store.tracks() == ABCD);
    ASSERT_EQ(store.current_index(), -1);
}

TEST_CASE(test_shuffle_empty_is_noop) {
    PlaylistStore store(3);
    store.toggle_shuffle();
    ASSERT_TRUE(store.empty());
    store.toggle_shuffle();
    ASSERT_TRUE(store.empty());
}

TEST_CASE(test_same_seed_same_shuffle) {
    std::vector<std::string> many;
    for (int i = 0; i < 20; ++i) many.push_back("/m/t" + std::to_string(i) + ".mp3");

    PlaylistStore a(7), b(7);
    a.add_tracks(many);
    b.add_tracks(many);
    a.toggle_shuffle();
    b.toggle_shuffle();
    ASSERT_TRUE(a.tracks() == b.tracks());
}

// ========== FILTER ==========

TEST_CASE(test_filter_matches_file_name_case_insensitive) {
    auto store = make_store({"/music/rock/Thunder.mp3", "/music/thunder/calm.ogg", "/music/THUNDERSTRUCK.flac"});
    auto hits = store.filter("thunder");

    ASSERT_EQ(hits.size(), 2u);
    ASSERT_EQ(hits[0], 0u);
    ASSERT_EQ(hits[1], 2u);
}

TEST_CASE(test_filter_ignores_accents) {
    auto store = make_store({"/m/Beyoncé - Halo.mp3", "/m/Other.mp3"});
    auto hits = store.filter("beyonce");
    ASSERT_EQ(hits.size(), 1u);
    ASSERT_EQ(hits[0], 0u);
}

TEST_CASE(test_filter_empty_query_returns_all) {
    auto store = make_store(ABCD);
    ASSERT_EQ(store.filter("").size(), 4u);
    ASSERT_TRUE(store.filter("zzz").empty());
}

int main() {
    return turntable::test::TestRunner::instance().run_all();
}
