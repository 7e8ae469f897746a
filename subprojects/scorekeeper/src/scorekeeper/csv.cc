#include <algorithm>
#include <array>
#include <charconv>
#include <iterator>
#include <optional>
#include <scorekeeper/csv.hh>
#include <scorekeeper/errors.hh>
#include <sklib/concat_tostr.hh>
#include <string>
#include <string_view>

namespace scorekeeper {

namespace {

struct CsvRecord {
    size_t line; // line the record starts at
    std::vector<std::string> fields;
};

// RFC 4180: fields separated by ',', optionally quoted with '"' ("" escapes a
// quote inside a quoted field, which may span lines)
std::vector<CsvRecord> split_records(std::string_view data) {
    std::vector<CsvRecord> records;
    size_t line = 1;
    size_t i = 0;
    while (i < data.size()) {
        CsvRecord record{.line = line, .fields = {}};
        std::string field;
        bool in_quotes = false;
        bool record_ended = false;
        for (; i < data.size() and not record_ended; ++i) {
            char c = data[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < data.size() and data[i + 1] == '"') {
                        field += '"';
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    if (c == '\n') {
                        ++line;
                    }
                    field += c;
                }
                continue;
            }

            switch (c) {
            case '"': in_quotes = true; break;
            case ',':
                record.fields.emplace_back(std::move(field));
                field.clear();
                break;
            case '\r': break;
            case '\n':
                ++line;
                record_ended = true;
                break;
            default: field += c;
            }
        }
        if (in_quotes) {
            throw ValidationError("line ", record.line, ": unterminated quoted field");
        }
        record.fields.emplace_back(std::move(field));
        records.emplace_back(std::move(record));
    }
    return records;
}

std::string_view trim(std::string_view str) noexcept {
    constexpr std::string_view ws = " \t";
    auto beg = str.find_first_not_of(ws);
    if (beg == std::string_view::npos) {
        return {};
    }
    return str.substr(beg, str.find_last_not_of(ws) - beg + 1);
}

template <class T>
std::optional<T> parse_number(std::string_view str) noexcept {
    str = trim(str);
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (str.empty() or ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

std::optional<size_t> find_column(const std::vector<std::string>& header, std::string_view name) {
    auto it = std::find_if(header.begin(), header.end(), [&](const std::string& col) {
        return trim(col) == name;
    });
    if (it == header.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - header.begin());
}

bool is_blank(const CsvRecord& record) {
    return std::all_of(record.fields.begin(), record.fields.end(), [](const std::string& field) {
        return trim(field).empty();
    });
}

std::string quote_if_needed(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string res = "\"";
    for (char c : field) {
        if (c == '"') {
            res += '"';
        }
        res += c;
    }
    res += '"';
    return res;
}

} // namespace

std::vector<Team> parse_teams_csv(std::istream& in, bool with_scores) {
    std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw ValidationError("Failed to read the CSV input");
    }

    constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";
    if (std::string_view{data}.substr(0, utf8_bom.size()) == utf8_bom) {
        data.erase(0, utf8_bom.size());
    }

    auto records = split_records(data);
    if (records.empty()) {
        throw ValidationError("The CSV input has no header row");
    }

    const auto& header = records.front().fields;
    auto name_col = find_column(header, "Team Name");
    auto number_col = find_column(header, "Team Number");
    if (not name_col or not number_col) {
        throw ValidationError("line 1: missing \"Team Name\" or \"Team Number\" column");
    }
    auto pit_col = find_column(header, "Pit #");
    std::array<std::optional<size_t>, ROUNDS_NUM> round_cols;
    if (with_scores) {
        for (int round = 1; round <= ROUNDS_NUM; ++round) {
            round_cols[round - 1] = find_column(header, concat_tostr("Round ", round, " Score"));
        }
    }

    std::vector<Team> teams;
    for (auto it = std::next(records.begin()); it != records.end(); ++it) {
        const auto& record = *it;
        if (is_blank(record)) {
            continue;
        }

        auto field = [&](std::optional<size_t> col) -> std::string_view {
            if (not col or *col >= record.fields.size()) {
                return {};
            }
            return trim(record.fields[*col]);
        };

        auto name = field(name_col);
        if (name.empty()) {
            throw ValidationError("line ", record.line, ": empty team name");
        }
        auto number = parse_number<int64_t>(field(number_col));
        if (not number or *number <= 0) {
            throw ValidationError(
                "line ", record.line, ": invalid team number \"", field(number_col), '"'
            );
        }
        int64_t pit = 0;
        if (auto pit_str = field(pit_col); not pit_str.empty()) {
            auto parsed = parse_number<int64_t>(pit_str);
            if (not parsed or *parsed < 0) {
                throw ValidationError("line ", record.line, ": invalid pit \"", pit_str, '"');
            }
            pit = *parsed;
        }

        Team team{*number, std::string{name}, pit};
        for (int round = 1; round <= ROUNDS_NUM and with_scores; ++round) {
            auto score = parse_number<int>(field(round_cols[round - 1]));
            if (not score or *score <= 0) {
                continue; // Not played
            }
            if (*score > MAX_SCORE) {
                throw ValidationError(
                    "line ", record.line, ": round ", round, " score ", *score, " is out of range"
                );
            }
            team.set_score(round, *score);
        }
        teams.emplace_back(std::move(team));
    }
    return teams;
}

void write_teams_csv(std::ostream& out, std::vector<Team> teams) {
    std::stable_sort(teams.begin(), teams.end(), [](const Team& a, const Team& b) {
        auto key = [](const Team& t) { return std::pair{t.pit != 0 ? t.pit : t.number, t.number}; };
        return key(a) < key(b);
    });

    out << "Pit #,Team Name,Team Number,Round 1 Score,Round 2 Score,Round 3 Score\n";
    for (const auto& team : teams) {
        out << team.pit << ',' << quote_if_needed(team.name) << ',' << team.number;
        for (int score : team.scores) {
            out << ',' << score;
        }
        out << '\n';
    }
}

} // namespace scorekeeper
