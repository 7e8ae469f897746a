#include "commands.hh"

#include <cstdio>
#include <scorekeeper/version.hh>

namespace commands {

void help(const char* program_name) {
    if (program_name == nullptr) {
        program_name = "scorekeeper";
    }

    printf("Usage: %s [options] <command> [<command args>]\n", program_name);
    puts(R"==(Scorekeeper records teams and round scores of a timed competition event,
ranks the teams and relays the event state to the reflector

Commands:
  add-team <number> <name> [pit]
                        Add a team
  update-team <number> <name> [pit]
                        Rename a team and/or change its pit (pit stays the same
                          if not given)
  delete-team <number>  Delete a team together with its scores
  set-score <number> <round> <score> [comments]
                        Set the score of round <round> (1-3) of a team. Score
                          -1 marks the round as not played
  rankings              Print the teams in rank order
  import-csv <file> [--with-scores]
                        Add teams from a CSV file with "Team Name" and
                          "Team Number" columns, with --with-scores also
                          "Round N Score" columns
  export-csv <file>     Write all teams with their scores to a CSV file
  start-match <n>       Record the start of match <n> and relay "running"
  abort-match <n>       Relay "aborted" for match <n>
  complete-match <n>    Relay "queueing" for the match after <n>
  force-sync <match> [status]
                        Send the whole event state to the reflector right away
                          (status defaults to "queueing")
  cycle-times           Print the time between consecutive match starts
  audit                 Print the audit trail
  help                  Display this information
  version               Display version

Options:
  -c <file>             Use configuration file <file> instead of
                          ./scorekeeper.conf
  -C <directory>        Change working directory to <directory> before doing
                          anything
  -h, --help            Display this information
  -V, --version         Display version

Options have to precede <command>, "--" ends them.)==");
}

void version() { printf("scorekeeper %s\n", scorekeeper::VERSION); }

} // namespace commands
