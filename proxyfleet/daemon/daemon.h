#pragma once

// Runs the manager daemon in the foreground until SIGINT/SIGTERM/SIGHUP.
// argv[1] is "daemon"; accepts --log-level and --config.
int daemon_start(int argc, char** argv);

// SIGINT/SIGTERM/SIGHUP write one byte to `signal_write_fd` instead of
// terminating; SIGPIPE is ignored
void install_signal_handlers(int signal_write_fd);
