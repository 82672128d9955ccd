#pragma once
#include <ostream>

// Prints an environment report: OS, clipboard backend, missing tools,
// ssh availability and config location. false if the clipboard is unusable.
bool run_doctor(std::ostream& os);
