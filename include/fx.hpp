#pragma once
#include "clipwire_common.hpp"
#include "config.hpp"

#include <ostream>
#include <string>
#include <vector>

// -------- Clipboard transforms --------
// Runs the named transforms in order, each fed the previous one's output.
// All names are resolved before anything runs. A failing step or an empty
// result aborts the chain; `out` is only set on success.
bool apply_fx_chain(const Config& cfg,
    const std::vector<std::string>& names,
    const Bytes& input,
    Bytes& out,
    std::string& err);

// "trim → upper"
std::string fx_chain_label(const std::vector<std::string>& names);

// NAME / DESCRIPTION table; falls back to the command when there is no description
void print_fx_list(std::ostream& os, const Config& cfg);
