#include <scorekeeper/audit_event.hh>
#include <sklib/json_str/json_str.hh>
#include <type_traits>

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

namespace scorekeeper::audit {

std::string_view tag_of(const Event& event) noexcept {
    return std::visit(
        Overloaded{
            [](const StoreCreated&) { return std::string_view{"db_created"}; },
            [](const StoreOpened&) { return std::string_view{"db_opened"}; },
            [](const StoreClosed&) { return std::string_view{"db_closed"}; },
            [](const TeamAdded&) { return std::string_view{"team_add"}; },
            [](const TeamUpdated&) { return std::string_view{"team_update"}; },
            [](const TeamDeleted&) { return std::string_view{"team_delete"}; },
            [](const ScoreUpdated&) { return std::string_view{"score_update"}; },
            [](const ScoreDeleted&) { return std::string_view{"score_delete"}; },
            [](const ScoresheetUpdated&) { return std::string_view{"scoresheet_update"}; },
            [](const ScoresheetDeleted&) { return std::string_view{"scoresheet_delete"}; },
        },
        event
    );
}

std::string to_json(const Event& event, double timestamp) {
    json_str::Object obj;
    std::visit(
        Overloaded{
            [&](const StoreCreated& e) { obj.prop("app_version", e.app_version); },
            [&](const StoreOpened& e) { obj.prop("app_version", e.app_version); },
            [&](const StoreClosed&) {},
            [&](const TeamAdded& e) {
                obj.prop("teamnumber", e.teamnumber);
                obj.prop("name", e.name);
                obj.prop("pit", e.pit);
            },
            [&](const TeamUpdated& e) {
                obj.prop("teamnumber", e.teamnumber);
                obj.prop("old_name", e.old_name);
                obj.prop("new_name", e.new_name);
                obj.prop("old_pit", e.old_pit);
                obj.prop("new_pit", e.new_pit);
            },
            [&](const TeamDeleted& e) { obj.prop("teamnumber", e.teamnumber); },
            [&](const ScoreUpdated& e) {
                obj.prop("teamnumber", e.teamnumber);
                obj.prop("round", e.round);
                obj.prop("old_score", e.old_score);
                obj.prop("new_score", e.new_score);
            },
            [&](const ScoreDeleted& e) {
                obj.prop("teamnumber", e.teamnumber);
                obj.prop("round", e.round);
                obj.prop("old_score", e.old_score);
                obj.prop("new_score", nullptr);
            },
            [&](const ScoresheetUpdated& e) {
                obj.prop("teamnumber", e.teamnumber);
                obj.prop("round", e.round);
                obj.prop("old_scoresheet", e.old_scoresheet);
                obj.prop("new_scoresheet", e.new_scoresheet);
            },
            [&](const ScoresheetDeleted& e) {
                obj.prop("teamnumber", e.teamnumber);
                obj.prop("round", e.round);
                obj.prop("old_scoresheet", e.old_scoresheet);
                obj.prop("new_scoresheet", nullptr);
            },
        },
        event
    );
    obj.prop("timestamp", timestamp);
    obj.prop("tag", tag_of(event));
    return std::move(obj).into_str();
}

} // namespace scorekeeper::audit
