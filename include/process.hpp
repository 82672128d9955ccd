#pragma once
#include "clipwire_common.hpp"

#include <string>
#include <vector>

// -------- Child process helpers (fork + execvp) --------
// All helpers return true only when the child exited with status 0.
// With `quiet` set, the child's stderr (and stdout, where it is not
// captured) goes to /dev/null.

// Feed `input` on the child's stdin
bool run_with_input(const std::vector<std::string>& argv,
    const Bytes& input,
    bool quiet);

// Reads `fd` to EOF. false on a read error, or with errno == EFBIG once more
// than `max_size` bytes arrive; `out` is untouched on failure.
bool read_fd_capped(int fd, Bytes& out, size_t max_size);

// Capture the child's stdout into `out`; stdin is /dev/null.
// Output larger than `max_size` is a failure, never a truncation.
bool run_capture(const std::vector<std::string>& argv,
    Bytes& out,
    bool quiet,
    size_t max_size = MAX_CLIPBOARD_SIZE);

// Feed `input` on stdin and capture stdout at the same time; stderr is
// inherited. `out` is untouched on failure.
bool run_filter(const std::vector<std::string>& argv,
    const Bytes& input,
    Bytes& out,
    size_t max_size = MAX_CLIPBOARD_SIZE);

// Run with inherited stdout/stderr and stdin from /dev/null
bool run_command(const std::vector<std::string>& argv);

// True if `name` resolves to an executable (absolute path or via $PATH)
bool find_in_path(const std::string& name);
