#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <scorekeeper/audit_event.hh>
#include <sklib/sqlite.hh>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace scorekeeper {

struct TeamRecord {
    int64_t number;
    std::string name;
    int64_t pit;
};

struct ScoreRecord {
    int64_t teamnumber;
    int round;
    int score;
    std::string comments;
};

struct ScoresheetRecord {
    int64_t teamnumber;
    int round;
    std::string scoresheet;
};

struct AuditRecord {
    double timestamp;
    std::string tag;
    std::string data; // JSON object
};

struct MatchStart {
    int64_t match;
    double timestamp; // latest start of the match, seconds since the epoch
};

// Tag of the operational log entries written when a match starts
constexpr std::string_view MATCH_START_LOG_TAG = "match_start";

/**
 * @brief Audit-logged persistence of the event: teams, scores, scoresheets
 * @details Every mutating operation runs in a single transaction together
 *   with its audit entries, so either all of them are visible or none.
 *   The store may be used only from the thread that opened it. All failures
 *   are reported as PersistenceError.
 */
class ScoreStore {
public:
    static constexpr int64_t SCHEMA_VERSION = 3;
    static constexpr int64_t APPLICATION_ID = 0;

private:
    sqlite::Connection db_;
    std::string path_;
    std::thread::id owner_;
    bool created_ = false;

    void check_usable(std::string_view operation) const;

    void create_schema(const std::string& app_version);

    void append_audit(const audit::Event& event);

    // Both need an open transaction
    std::optional<int>
    write_score(int64_t number, int round, int score, const std::string& comments);

    std::optional<std::string>
    write_scoresheet(int64_t number, int round, const std::string& scoresheet);

    template <class Func>
    auto run(std::string_view operation, Func&& func);

public:
    /**
     * @brief Opens (or creates) the event database at @p db_path
     * @details A new database gets the schema and a db_created audit entry,
     *   an existing one a db_opened audit entry.
     *
     * @errors Throws PersistenceError if the file cannot be opened or its
     *   schema version differs from SCHEMA_VERSION
     */
    explicit ScoreStore(std::string db_path, const std::string& app_version);

    ScoreStore(const ScoreStore&) = delete;
    ScoreStore(ScoreStore&&) = delete;
    ScoreStore& operator=(const ScoreStore&) = delete;
    ScoreStore& operator=(ScoreStore&&) = delete;

    // Closes the store if close() was not called, errors are logged
    ~ScoreStore();

    /**
     * @brief Picks the database file of the event held today
     * @details Files named "EVENTCODE-YYYYMMDD.db" in @p data_dir are
     *   pre-provisioned event databases; the one with the earliest date not
     *   before @p today is chosen. Without one, "YYYYMMDD-event.db" for
     *   @p today is returned (it may not exist yet).
     *
     * @errors Throws PersistenceError if @p data_dir cannot be listed
     */
    static std::string resolve_event_database(const std::string& data_dir, const std::tm& today);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] bool is_open() const noexcept { return db_.is_open(); }

    // True iff the database was created by the constructor
    [[nodiscard]] bool was_created() const noexcept { return created_; }

    // Writes the db_closed audit entry and releases the database. No other
    // operation is valid afterwards.
    void close();

    // Returns true iff the team was added, false iff an existing one was
    // updated
    bool upsert_team(int64_t number, const std::string& name, int64_t pit);

    // Returns the score replaced by @p score, if there was one
    std::optional<int>
    upsert_score(int64_t number, int round, int score, const std::string& comments = "");

    std::optional<std::string>
    upsert_scoresheet(int64_t number, int round, const std::string& scoresheet);

    // Stores the scoresheet and its score in one transaction (audited as
    // scoresheet_update then score_update). Returns the replaced score.
    std::optional<int> upsert_score_with_scoresheet(
        int64_t number, int round, int score, const std::string& scoresheet
    );

    // Removes the team together with its scores and scoresheets. Returns
    // false iff no such team exists.
    bool delete_team(int64_t number);

    std::vector<TeamRecord> load_teams();

    std::vector<ScoreRecord> load_scores();

    std::vector<ScoresheetRecord> load_scoresheets();

    // In insertion order
    std::vector<AuditRecord> load_audit_entries();

    void write_log_entry(std::string_view tag, std::string_view message);

    // Latest start of every match, ordered by match number
    std::vector<MatchStart> query_match_start_times();

    std::optional<std::string> get_meta(const std::string& key);

    void set_meta(const std::string& key, const std::string& value);
};

} // namespace scorekeeper
