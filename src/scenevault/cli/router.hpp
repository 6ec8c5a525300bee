#pragma once

namespace scenevault::cli {

// Routes `scenevault` subcommands and returns process exit codes with a stable
// contract for scripts and the HTTP passthrough layer:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   40 => project not found
//   41 => project already terminal (checkpoint rejected)
//   42 => checkpoint out of order
//   43 => invalid request payload
//   50 => checkpoint store unavailable
int Dispatch(int argc, char** argv);

} // namespace scenevault::cli
