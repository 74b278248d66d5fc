#pragma once

#ifndef PROXYFLEET_VERSION
#define PROXYFLEET_VERSION "0.1.0"
#endif

int cli_dispatch(int argc, char** argv);
int cli_forward(int argc, char** argv);
int cli_daemon(int argc, char** argv);
void cli_usage();
