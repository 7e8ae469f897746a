#pragma once

#include "../session.hh"

#include <sklib/argv_parser.hh>

namespace commands {

void add_team(Session& session, ArgvParser args);

void update_team(Session& session, ArgvParser args);

void delete_team(Session& session, ArgvParser args);

void set_score(Session& session, ArgvParser args);

void rankings(Session& session, ArgvParser args);

void import_csv(Session& session, ArgvParser args);

void export_csv(Session& session, ArgvParser args);

void start_match(Session& session, ArgvParser args);

void abort_match(Session& session, ArgvParser args);

void complete_match(Session& session, ArgvParser args);

void force_sync(Session& session, ArgvParser args);

void cycle_times(Session& session, ArgvParser args);

void audit(Session& session, ArgvParser args);

// Displays help
void help(const char* program_name);

void version();

} // namespace commands
