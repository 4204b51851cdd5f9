#ifndef PDFSHRINK_RUN_CLI_HPP
#define PDFSHRINK_RUN_CLI_HPP

/**
 * @brief Entire command-line program: parse, resolve, compress, report.
 *
 * Status lines and the completion summary go to stdout; the progress bar
 * and errors go to stderr. Installs the log sinks selected on the command
 * line, replacing any already registered.
 *
 * @return 0 on success, help or version; 1 on any parse, validation or
 * engine failure.
 */
int run_cli(int argc, const char* const argv[]);

#endif //PDFSHRINK_RUN_CLI_HPP
