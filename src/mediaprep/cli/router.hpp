#pragma once

namespace mediaprep::cli {

// Routes `mediaprep` subcommands and returns process exit codes with a stable
// contract for scripts and supervisors:
//   0  => success
//   1  => command failed after valid invocation (including a failed `call`)
//   2  => usage error (unknown command / invalid args)
//   10 => configuration or operation table rejected at startup
//   20 => socket could not be bound
int Dispatch(int argc, char** argv);

} // namespace mediaprep::cli
