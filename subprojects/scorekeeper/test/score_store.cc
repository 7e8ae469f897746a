#include <fstream>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <scorekeeper/errors.hh>
#include <scorekeeper/score_store.hh>
#include <sklib/sqlite.hh>
#include <sklib/temporary_directory.hh>
#include <thread>

using scorekeeper::PersistenceError;
using scorekeeper::ScoreStore;
using ::testing::HasSubstr;

namespace {

constexpr const char APP_VERSION[] = "test-1.0";

std::vector<std::string> audit_tags(ScoreStore& store) {
    std::vector<std::string> tags;
    for (const auto& entry : store.load_audit_entries()) {
        tags.emplace_back(entry.tag);
    }
    return tags;
}

std::tm make_date(int year, int month, int day) {
    std::tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    return t;
}

void touch(const std::string& path) { std::ofstream{path}.put('\n'); }

} // namespace

// NOLINTNEXTLINE
TEST(ScoreStore, create_then_reopen) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    auto db_path = tmp_dir.path() + "event.db";
    {
        ScoreStore store(db_path, APP_VERSION);
        EXPECT_TRUE(store.was_created());
        EXPECT_EQ(store.get_meta("app_version"), APP_VERSION);
        auto entries = store.load_audit_entries();
        ASSERT_EQ(entries.size(), 1U);
        EXPECT_EQ(entries[0].tag, "db_created");
        EXPECT_THAT(entries[0].data, HasSubstr(R"("app_version":"test-1.0")"));
        EXPECT_THAT(entries[0].data, HasSubstr(R"("tag":"db_created")"));
        EXPECT_THAT(entries[0].data, HasSubstr(R"("timestamp":)"));
        store.close();
        EXPECT_FALSE(store.is_open());
    }
    {
        ScoreStore store(db_path, APP_VERSION);
        EXPECT_FALSE(store.was_created());
        EXPECT_EQ(
            audit_tags(store),
            (std::vector<std::string>{"db_created", "db_closed", "db_opened"})
        );
    } // Destructor closes the store

    sqlite::Connection db(db_path, SQLITE_OPEN_READONLY);
    EXPECT_EQ(db.query_int64("PRAGMA user_version"), ScoreStore::SCHEMA_VERSION);
    EXPECT_EQ(db.query_int64("PRAGMA application_id"), ScoreStore::APPLICATION_ID);
    EXPECT_EQ(db.query_int64("SELECT COUNT(*) FROM audit WHERE tag = 'db_closed'"), 2);
}

// NOLINTNEXTLINE
TEST(ScoreStore, schema_version_mismatch) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    auto db_path = tmp_dir.path() + "event.db";
    {
        sqlite::Connection db(db_path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        db.execute("CREATE TABLE teams (teamnumber INTEGER); PRAGMA user_version = 2");
    }
    EXPECT_THROW((void)ScoreStore(db_path, APP_VERSION), PersistenceError);
}

// NOLINTNEXTLINE
TEST(ScoreStore, cannot_open) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    EXPECT_THROW(
        (void)ScoreStore(tmp_dir.path() + "missing/dir/event.db", APP_VERSION), PersistenceError
    );
}

// NOLINTNEXTLINE
TEST(ScoreStore, upsert_team_audits_add_then_update) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);

    EXPECT_TRUE(store.upsert_team(101, "Falcons", 0));
    EXPECT_FALSE(store.upsert_team(101, "Fast Falcons", 4));

    auto teams = store.load_teams();
    ASSERT_EQ(teams.size(), 1U);
    EXPECT_EQ(teams[0].number, 101);
    EXPECT_EQ(teams[0].name, "Fast Falcons");
    EXPECT_EQ(teams[0].pit, 4);

    auto entries = store.load_audit_entries();
    ASSERT_EQ(entries.size(), 3U);
    EXPECT_EQ(entries[1].tag, "team_add");
    EXPECT_THAT(entries[1].data, HasSubstr(R"("teamnumber":101,"name":"Falcons","pit":0)"));
    EXPECT_EQ(entries[2].tag, "team_update");
    EXPECT_THAT(
        entries[2].data,
        HasSubstr(
            R"("teamnumber":101,"old_name":"Falcons","new_name":"Fast Falcons","old_pit":0,"new_pit":4)"
        )
    );
}

// NOLINTNEXTLINE
TEST(ScoreStore, upsert_score_records_old_and_new) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    store.upsert_team(101, "Falcons", 0);

    EXPECT_EQ(store.upsert_score(101, 1, 45), std::nullopt);
    EXPECT_EQ(store.upsert_score(101, 1, 50, "re-scored"), 45);

    auto scores = store.load_scores();
    ASSERT_EQ(scores.size(), 1U);
    EXPECT_EQ(scores[0].teamnumber, 101);
    EXPECT_EQ(scores[0].round, 1);
    EXPECT_EQ(scores[0].score, 50);
    EXPECT_EQ(scores[0].comments, "re-scored");

    auto entries = store.load_audit_entries();
    ASSERT_EQ(entries.size(), 4U); // db_created, team_add and one per upsert
    EXPECT_EQ(entries[2].tag, "score_update");
    EXPECT_THAT(
        entries[2].data, HasSubstr(R"("teamnumber":101,"round":1,"old_score":null,"new_score":45)")
    );
    EXPECT_EQ(entries[3].tag, "score_update");
    EXPECT_THAT(
        entries[3].data, HasSubstr(R"("teamnumber":101,"round":1,"old_score":45,"new_score":50)")
    );
}

// NOLINTNEXTLINE
TEST(ScoreStore, scoresheets_round_trip) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    store.upsert_team(7, "Seven", 0);

    EXPECT_EQ(store.upsert_scoresheet(7, 2, R"({"m01":true})"), std::nullopt);
    EXPECT_EQ(store.upsert_scoresheet(7, 2, R"({"m01":false})"), R"({"m01":true})");

    auto sheets = store.load_scoresheets();
    ASSERT_EQ(sheets.size(), 1U);
    EXPECT_EQ(sheets[0].teamnumber, 7);
    EXPECT_EQ(sheets[0].round, 2);
    EXPECT_EQ(sheets[0].scoresheet, R"({"m01":false})");
    EXPECT_EQ(audit_tags(store).back(), "scoresheet_update");
}

// NOLINTNEXTLINE
TEST(ScoreStore, delete_team_cascades_and_audits_each_removal) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    store.upsert_team(101, "Falcons", 0);
    store.upsert_team(102, "Hawks", 0);
    store.upsert_score(101, 1, 45);
    store.upsert_score(101, 3, 12);
    store.upsert_score(102, 1, 60);
    store.upsert_scoresheet(101, 1, "sheet");
    auto entries_before = store.load_audit_entries().size();

    EXPECT_TRUE(store.delete_team(101));

    auto entries = store.load_audit_entries();
    ASSERT_EQ(entries.size(), entries_before + 4);
    EXPECT_EQ(entries[entries_before].tag, "team_delete");
    EXPECT_EQ(entries[entries_before + 1].tag, "score_delete");
    EXPECT_THAT(
        entries[entries_before + 1].data,
        HasSubstr(R"("teamnumber":101,"round":1,"old_score":45,"new_score":null)")
    );
    EXPECT_EQ(entries[entries_before + 2].tag, "score_delete");
    EXPECT_THAT(entries[entries_before + 2].data, HasSubstr(R"("round":3,"old_score":12)"));
    EXPECT_EQ(entries[entries_before + 3].tag, "scoresheet_delete");

    ASSERT_EQ(store.load_teams().size(), 1U);
    EXPECT_EQ(store.load_teams()[0].number, 102);
    ASSERT_EQ(store.load_scores().size(), 1U);
    EXPECT_EQ(store.load_scores()[0].teamnumber, 102);
    EXPECT_TRUE(store.load_scoresheets().empty());

    // Unknown team: nothing happens
    EXPECT_FALSE(store.delete_team(101));
    EXPECT_EQ(store.load_audit_entries().size(), entries.size());
}

// NOLINTNEXTLINE
TEST(ScoreStore, failed_delete_is_rolled_back_as_a_whole) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    auto db_path = tmp_dir.path() + "event.db";
    ScoreStore store(db_path, APP_VERSION);
    store.upsert_team(101, "Falcons", 0);
    store.upsert_score(101, 1, 45);
    store.upsert_score(101, 2, 30);
    auto entries_before = store.load_audit_entries().size();

    {
        // Removal of the team row is the last step of the cascade
        sqlite::Connection db(db_path, SQLITE_OPEN_READWRITE);
        db.execute("CREATE TRIGGER block_team_delete BEFORE DELETE ON teams "
                   "BEGIN SELECT RAISE(ABORT, 'blocked'); END");
    }

    EXPECT_THROW(store.delete_team(101), PersistenceError);
    EXPECT_EQ(store.load_teams().size(), 1U);
    EXPECT_EQ(store.load_scores().size(), 2U);
    EXPECT_EQ(store.load_audit_entries().size(), entries_before);
}

// NOLINTNEXTLINE
TEST(ScoreStore, score_with_scoresheet_is_atomic) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    auto db_path = tmp_dir.path() + "event.db";
    ScoreStore store(db_path, APP_VERSION);
    store.upsert_team(7, "Seven", 0);

    EXPECT_EQ(store.upsert_score_with_scoresheet(7, 2, 40, "first"), std::nullopt);
    EXPECT_EQ(store.upsert_score_with_scoresheet(7, 2, 55, "second"), 40);
    auto sheets = store.load_scoresheets();
    ASSERT_EQ(sheets.size(), 1U);
    EXPECT_EQ(sheets[0].scoresheet, "second");
    auto tags = audit_tags(store);
    ASSERT_GE(tags.size(), 2U);
    EXPECT_EQ(tags[tags.size() - 2], "scoresheet_update");
    EXPECT_EQ(tags.back(), "score_update");

    {
        sqlite::Connection db(db_path, SQLITE_OPEN_READWRITE);
        db.execute("CREATE TRIGGER block_scores BEFORE INSERT ON scores "
                   "BEGIN SELECT RAISE(ABORT, 'blocked'); END");
    }
    auto entries_before = store.load_audit_entries().size();
    EXPECT_THROW((void)store.upsert_score_with_scoresheet(7, 3, 10, "third"), PersistenceError);
    EXPECT_EQ(store.load_scoresheets().size(), 1U);
    EXPECT_EQ(store.load_audit_entries().size(), entries_before);
}

// NOLINTNEXTLINE
TEST(ScoreStore, match_start_times) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    EXPECT_TRUE(store.query_match_start_times().empty());

    store.write_log_entry(scorekeeper::MATCH_START_LOG_TAG, "2");
    store.write_log_entry(scorekeeper::MATCH_START_LOG_TAG, "10");
    store.write_log_entry("other", "3");
    store.write_log_entry(scorekeeper::MATCH_START_LOG_TAG, "1");
    store.write_log_entry(scorekeeper::MATCH_START_LOG_TAG, "2"); // Restarted

    auto starts = store.query_match_start_times();
    ASSERT_EQ(starts.size(), 3U);
    EXPECT_EQ(starts[0].match, 1);
    EXPECT_EQ(starts[1].match, 2);
    EXPECT_EQ(starts[2].match, 10);
    // The latest start of match 2 is the last entry written
    EXPECT_GE(starts[1].timestamp, starts[0].timestamp);
    EXPECT_GE(starts[1].timestamp, starts[2].timestamp);
}

// NOLINTNEXTLINE
TEST(ScoreStore, meta) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    EXPECT_EQ(store.get_meta("missing"), std::nullopt);
    store.set_meta("event_name", "Regional");
    store.set_meta("event_name", "State");
    EXPECT_EQ(store.get_meta("event_name"), "State");
}

// NOLINTNEXTLINE
TEST(ScoreStore, no_operations_after_close) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    store.close();
    store.close(); // No-op
    EXPECT_THROW(store.upsert_team(1, "One", 0), PersistenceError);
    EXPECT_THROW(store.load_teams(), PersistenceError);
}

// NOLINTNEXTLINE
TEST(ScoreStore, single_writer_thread) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    ScoreStore store(tmp_dir.path() + "event.db", APP_VERSION);
    bool rejected = false;
    std::thread other([&] {
        try {
            store.upsert_team(1, "One", 0);
        } catch (const PersistenceError&) {
            rejected = true;
        }
    });
    other.join();
    EXPECT_TRUE(rejected);
    EXPECT_TRUE(store.load_teams().empty());
}

// NOLINTNEXTLINE
TEST(ScoreStore, resolve_event_database) {
    TemporaryDirectory tmp_dir("/tmp/scorekeeper-test.XXXXXX");
    const auto& dir = tmp_dir.path();
    auto today = make_date(2025, 1, 3);

    EXPECT_EQ(ScoreStore::resolve_event_database(dir, today), dir + "20250103-event.db");

    touch(dir + "OLD-20240101.db");
    touch(dir + "BAD-20250230.db");
    touch(dir + "1NUM-20250104.db");
    touch(dir + "LATER-20250110.db");
    touch(dir + "SOON-20250105.db");
    touch(dir + "SOON-20250105.db-journal");
    EXPECT_EQ(ScoreStore::resolve_event_database(dir, today), dir + "SOON-20250105.db");

    touch(dir + "TODAY-20250103.db");
    EXPECT_EQ(ScoreStore::resolve_event_database(dir, today), dir + "TODAY-20250103.db");

    EXPECT_EQ(
        ScoreStore::resolve_event_database(dir, make_date(2025, 2, 1)), dir + "20250201-event.db"
    );
    EXPECT_THROW(
        (void)ScoreStore::resolve_event_database(dir + "missing", today), PersistenceError
    );
}
