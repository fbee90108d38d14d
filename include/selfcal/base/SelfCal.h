// SelfCal.h: Command line interface of the selfcal program.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_SELFCAL_H_
#define SELFCAL_BASE_SELFCAL_H_

#include <string>

#include "../../../common/ParameterSet.h"

namespace selfcal {
namespace base {

void ShowUsage();

/// Command-line interface: selfcal <command> [parsetkeys...]
void ExecuteFromCommandLine(int argc, char* argv[]);

/// Execute a command with the settings in @p parset.
/// @throw std::runtime_error for an unknown command, missing settings and
/// I/O errors.
void Execute(const std::string& command, const common::ParameterSet& parset);

}  // namespace base
}  // namespace selfcal

#endif  // SELFCAL_BASE_SELFCAL_H_
