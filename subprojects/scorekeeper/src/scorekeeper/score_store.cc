#include <algorithm>
#include <filesystem>
#include <regex>
#include <scorekeeper/errors.hh>
#include <scorekeeper/score_store.hh>
#include <sklib/debug.hh>
#include <sklib/time.hh>
#include <utility>

namespace {

constexpr const char SCHEMA_SQL[] = "CREATE TABLE teams ("
                                    "teamnumber INTEGER UNIQUE NOT NULL,"
                                    "name TEXT NOT NULL,"
                                    "pit INTEGER NOT NULL DEFAULT 0"
                                    ");"
                                    "CREATE TABLE scores ("
                                    "slug TEXT UNIQUE NOT NULL,"
                                    "teamnumber INTEGER NOT NULL,"
                                    "round INTEGER NOT NULL,"
                                    "score INTEGER NOT NULL,"
                                    "comments TEXT NOT NULL DEFAULT ''"
                                    ");"
                                    "CREATE TABLE audit ("
                                    "timestamp REAL NOT NULL,"
                                    "tag TEXT NOT NULL,"
                                    "data TEXT NOT NULL"
                                    ");"
                                    "CREATE TABLE log ("
                                    "timestamp REAL NOT NULL,"
                                    "tag TEXT NOT NULL,"
                                    "message TEXT NOT NULL"
                                    ");"
                                    "CREATE TABLE scoresheets ("
                                    "slug TEXT UNIQUE NOT NULL,"
                                    "teamnumber INTEGER NOT NULL,"
                                    "round INTEGER NOT NULL,"
                                    "scoresheet TEXT NOT NULL"
                                    ");"
                                    "CREATE TABLE meta ("
                                    "key TEXT UNIQUE NOT NULL,"
                                    "value TEXT"
                                    ");";

std::string slug_of(int64_t number, int round) { return concat_tostr(number, '-', round); }

// YYYYMMDD as a number, so that dates compare like integers
int compact_date_value(const std::tm& t) noexcept {
    return (t.tm_year + 1900) * 10000 + (t.tm_mon + 1) * 100 + t.tm_mday;
}

} // namespace

namespace scorekeeper {

template <class Func>
auto ScoreStore::run(std::string_view operation, Func&& func) {
    check_usable(operation);
    try {
        return std::forward<Func>(func)();
    } catch (const sqlite::Error& e) {
        throw PersistenceError(operation, ": ", e.what());
    }
}

void ScoreStore::check_usable(std::string_view operation) const {
    if (not db_.is_open()) {
        throw PersistenceError(operation, ": the store is closed");
    }
    if (std::this_thread::get_id() != owner_) {
        throw PersistenceError(operation, ": the store is owned by another thread");
    }
}

void ScoreStore::append_audit(const audit::Event& event) {
    double timestamp = unix_time_seconds();
    auto tag = audit::tag_of(event);
    db_.prepare("INSERT INTO audit (timestamp, tag, data) VALUES (?, ?, ?)")
        .bind_all(timestamp, tag, audit::to_json(event, timestamp))
        .step();
}

void ScoreStore::create_schema(const std::string& app_version) {
    auto transaction = db_.start_transaction();
    db_.execute(SCHEMA_SQL);
    db_.execute(concat_tostr("PRAGMA application_id = ", APPLICATION_ID));
    db_.execute(concat_tostr("PRAGMA user_version = ", SCHEMA_VERSION));
    db_.prepare("INSERT INTO meta (key, value) VALUES ('app_version', ?)")
        .bind_all(app_version)
        .step();
    append_audit(audit::StoreCreated{.app_version = app_version});
    transaction.commit();
}

ScoreStore::ScoreStore(std::string db_path, const std::string& app_version)
: path_(std::move(db_path))
, owner_(std::this_thread::get_id()) {
    try {
        db_ = sqlite::Connection(path_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        db_.execute("PRAGMA busy_timeout = 2000");

        auto tables_num =
            db_.query_int64("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table'");
        if (tables_num == 0) {
            create_schema(app_version);
            created_ = true;
            stdlog("Created event database ", path_);
            return;
        }

        auto user_version = db_.query_int64("PRAGMA user_version");
        if (user_version != SCHEMA_VERSION) {
            db_.close();
            throw PersistenceError(
                "Cannot open ",
                path_,
                ": schema version ",
                user_version,
                " is not supported (expected ",
                SCHEMA_VERSION,
                ')'
            );
        }

        auto transaction = db_.start_transaction();
        append_audit(audit::StoreOpened{.app_version = app_version});
        transaction.commit();
        stdlog("Opened event database ", path_);
    } catch (const sqlite::Error& e) {
        db_.close();
        throw PersistenceError("Cannot open ", path_, ": ", e.what());
    }
}

ScoreStore::~ScoreStore() {
    if (db_.is_open()) {
        try {
            close();
        } catch (const std::exception& e) {
            ERRLOG_CATCH(e);
        }
    }
}

std::string ScoreStore::resolve_event_database(const std::string& data_dir, const std::tm& today) {
    static const std::regex provisioned_name{R"(^([a-zA-Z][a-zA-Z0-9]+)-(\d{8})\.db$)"};
    const int today_value = compact_date_value(today);

    std::optional<std::pair<int, std::string>> best; // (date, file name)
    try {
        for (const auto& entry : std::filesystem::directory_iterator(data_dir)) {
            if (not entry.is_regular_file()) {
                continue;
            }

            auto name = entry.path().filename().string();
            std::smatch match;
            if (not std::regex_match(name, match, provisioned_name)) {
                continue;
            }

            auto date = parse_compact_date(match[2].str());
            if (not date) {
                continue;
            }

            auto candidate = std::pair{compact_date_value(*date), std::move(name)};
            if (candidate.first >= today_value and (not best or candidate < *best)) {
                best = std::move(candidate);
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw PersistenceError("Cannot list event databases in ", data_dir, ": ", e.what());
    }

    if (best) {
        return (std::filesystem::path(data_dir) / best->second).string();
    }

    char today_str[16];
    (void)std::strftime(today_str, sizeof(today_str), "%Y%m%d", &today);
    return (std::filesystem::path(data_dir) / concat_tostr(today_str, "-event.db")).string();
}

void ScoreStore::close() {
    if (not db_.is_open()) {
        return;
    }
    if (std::this_thread::get_id() != owner_) {
        throw PersistenceError("close: the store is owned by another thread");
    }

    try {
        auto transaction = db_.start_transaction();
        append_audit(audit::StoreClosed{});
        transaction.commit();
    } catch (const sqlite::Error& e) {
        db_.close();
        throw PersistenceError("close: ", e.what());
    }
    db_.close();
    stdlog("Closed event database ", path_);
}

bool ScoreStore::upsert_team(int64_t number, const std::string& name, int64_t pit) {
    return run("upsert_team", [&] {
        auto transaction = db_.start_transaction();

        auto stmt = db_.prepare("SELECT name, pit FROM teams WHERE teamnumber = ?");
        stmt.bind_all(number);
        bool added = false;
        if (stmt.next()) {
            auto old_name = stmt.get_str(0);
            auto old_pit = stmt.get_int64(1);
            db_.prepare("UPDATE teams SET name = ?, pit = ? WHERE teamnumber = ?")
                .bind_all(name, pit, number)
                .step();
            append_audit(audit::TeamUpdated{
                .teamnumber = number,
                .old_name = std::move(old_name),
                .new_name = name,
                .old_pit = old_pit,
                .new_pit = pit,
            });
        } else {
            db_.prepare("INSERT INTO teams (teamnumber, name, pit) VALUES (?, ?, ?)")
                .bind_all(number, name, pit)
                .step();
            append_audit(audit::TeamAdded{.teamnumber = number, .name = name, .pit = pit});
            added = true;
        }

        transaction.commit();
        return added;
    });
}

std::optional<int>
ScoreStore::write_score(int64_t number, int round, int score, const std::string& comments) {
    auto slug = slug_of(number, round);

    std::optional<int> old_score;
    auto stmt = db_.prepare("SELECT score FROM scores WHERE slug = ?");
    stmt.bind_all(slug);
    if (stmt.next()) {
        old_score = stmt.get_int(0);
    }

    db_.prepare("INSERT OR REPLACE INTO scores (slug, teamnumber, round, score, comments) "
                "VALUES (?, ?, ?, ?, ?)")
        .bind_all(slug, number, round, score, comments)
        .step();
    append_audit(audit::ScoreUpdated{
        .teamnumber = number,
        .round = round,
        .old_score = old_score,
        .new_score = score,
    });
    return old_score;
}

std::optional<std::string>
ScoreStore::write_scoresheet(int64_t number, int round, const std::string& scoresheet) {
    auto slug = slug_of(number, round);

    std::optional<std::string> old_scoresheet;
    auto stmt = db_.prepare("SELECT scoresheet FROM scoresheets WHERE slug = ?");
    stmt.bind_all(slug);
    if (stmt.next()) {
        old_scoresheet = stmt.get_str(0);
    }

    db_.prepare("INSERT OR REPLACE INTO scoresheets (slug, teamnumber, round, scoresheet) "
                "VALUES (?, ?, ?, ?)")
        .bind_all(slug, number, round, scoresheet)
        .step();
    append_audit(audit::ScoresheetUpdated{
        .teamnumber = number,
        .round = round,
        .old_scoresheet = old_scoresheet,
        .new_scoresheet = scoresheet,
    });
    return old_scoresheet;
}

std::optional<int>
ScoreStore::upsert_score(int64_t number, int round, int score, const std::string& comments) {
    return run("upsert_score", [&] {
        auto transaction = db_.start_transaction();
        auto old_score = write_score(number, round, score, comments);
        transaction.commit();
        return old_score;
    });
}

std::optional<std::string>
ScoreStore::upsert_scoresheet(int64_t number, int round, const std::string& scoresheet) {
    return run("upsert_scoresheet", [&] {
        auto transaction = db_.start_transaction();
        auto old_scoresheet = write_scoresheet(number, round, scoresheet);
        transaction.commit();
        return old_scoresheet;
    });
}

std::optional<int> ScoreStore::upsert_score_with_scoresheet(
    int64_t number, int round, int score, const std::string& scoresheet
) {
    return run("upsert_score_with_scoresheet", [&] {
        auto transaction = db_.start_transaction();
        (void)write_scoresheet(number, round, scoresheet);
        auto old_score = write_score(number, round, score, "");
        transaction.commit();
        return old_score;
    });
}

bool ScoreStore::delete_team(int64_t number) {
    return run("delete_team", [&] {
        auto transaction = db_.start_transaction();

        auto team_stmt = db_.prepare("SELECT 1 FROM teams WHERE teamnumber = ?");
        team_stmt.bind_all(number);
        if (not team_stmt.next()) {
            return false;
        }
        append_audit(audit::TeamDeleted{.teamnumber = number});

        std::vector<std::pair<int, int>> scores; // (round, score)
        auto scores_stmt =
            db_.prepare("SELECT round, score FROM scores WHERE teamnumber = ? ORDER BY round");
        scores_stmt.bind_all(number);
        while (scores_stmt.next()) {
            scores.emplace_back(scores_stmt.get_int(0), scores_stmt.get_int(1));
        }
        for (auto [round, score] : scores) {
            append_audit(audit::ScoreDeleted{
                .teamnumber = number,
                .round = round,
                .old_score = score,
            });
            db_.prepare("DELETE FROM scores WHERE slug = ?").bind_all(slug_of(number, round)).step();
        }

        std::vector<std::pair<int, std::string>> scoresheets; // (round, scoresheet)
        auto sheets_stmt = db_.prepare(
            "SELECT round, scoresheet FROM scoresheets WHERE teamnumber = ? ORDER BY round"
        );
        sheets_stmt.bind_all(number);
        while (sheets_stmt.next()) {
            scoresheets.emplace_back(sheets_stmt.get_int(0), sheets_stmt.get_str(1));
        }
        for (auto& [round, scoresheet] : scoresheets) {
            append_audit(audit::ScoresheetDeleted{
                .teamnumber = number,
                .round = round,
                .old_scoresheet = std::move(scoresheet),
            });
            db_.prepare("DELETE FROM scoresheets WHERE slug = ?")
                .bind_all(slug_of(number, round))
                .step();
        }

        db_.prepare("DELETE FROM teams WHERE teamnumber = ?").bind_all(number).step();
        transaction.commit();
        return true;
    });
}

std::vector<TeamRecord> ScoreStore::load_teams() {
    return run("load_teams", [&] {
        std::vector<TeamRecord> res;
        auto stmt = db_.prepare("SELECT teamnumber, name, pit FROM teams ORDER BY teamnumber");
        while (stmt.next()) {
            res.push_back({
                .number = stmt.get_int64(0),
                .name = stmt.get_str(1),
                .pit = stmt.get_int64(2),
            });
        }
        return res;
    });
}

std::vector<ScoreRecord> ScoreStore::load_scores() {
    return run("load_scores", [&] {
        std::vector<ScoreRecord> res;
        auto stmt = db_.prepare(
            "SELECT teamnumber, round, score, comments FROM scores ORDER BY teamnumber, round"
        );
        while (stmt.next()) {
            res.push_back({
                .teamnumber = stmt.get_int64(0),
                .round = stmt.get_int(1),
                .score = stmt.get_int(2),
                .comments = stmt.get_str(3),
            });
        }
        return res;
    });
}

std::vector<ScoresheetRecord> ScoreStore::load_scoresheets() {
    return run("load_scoresheets", [&] {
        std::vector<ScoresheetRecord> res;
        auto stmt = db_.prepare(
            "SELECT teamnumber, round, scoresheet FROM scoresheets ORDER BY teamnumber, round"
        );
        while (stmt.next()) {
            res.push_back({
                .teamnumber = stmt.get_int64(0),
                .round = stmt.get_int(1),
                .scoresheet = stmt.get_str(2),
            });
        }
        return res;
    });
}

std::vector<AuditRecord> ScoreStore::load_audit_entries() {
    return run("load_audit_entries", [&] {
        std::vector<AuditRecord> res;
        auto stmt = db_.prepare("SELECT timestamp, tag, data FROM audit ORDER BY rowid");
        while (stmt.next()) {
            res.push_back({
                .timestamp = stmt.get_double(0),
                .tag = stmt.get_str(1),
                .data = stmt.get_str(2),
            });
        }
        return res;
    });
}

void ScoreStore::write_log_entry(std::string_view tag, std::string_view message) {
    run("write_log_entry", [&] {
        db_.prepare("INSERT INTO log (timestamp, tag, message) VALUES (?, ?, ?)")
            .bind_all(unix_time_seconds(), tag, message)
            .step();
    });
}

std::vector<MatchStart> ScoreStore::query_match_start_times() {
    return run("query_match_start_times", [&] {
        std::vector<MatchStart> res;
        auto stmt = db_.prepare("SELECT CAST(message AS INTEGER), MAX(timestamp) FROM log "
                                "WHERE tag = ? GROUP BY message "
                                "ORDER BY CAST(message AS INTEGER)");
        stmt.bind_all(MATCH_START_LOG_TAG);
        while (stmt.next()) {
            res.push_back({.match = stmt.get_int64(0), .timestamp = stmt.get_double(1)});
        }
        return res;
    });
}

std::optional<std::string> ScoreStore::get_meta(const std::string& key) {
    return run("get_meta", [&]() -> std::optional<std::string> {
        auto stmt = db_.prepare("SELECT value FROM meta WHERE key = ?");
        stmt.bind_all(key);
        if (not stmt.next() or stmt.is_null(0)) {
            return std::nullopt;
        }
        return stmt.get_str(0);
    });
}

void ScoreStore::set_meta(const std::string& key, const std::string& value) {
    run("set_meta", [&] {
        db_.prepare("INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)")
            .bind_all(key, value)
            .step();
    });
}

} // namespace scorekeeper
