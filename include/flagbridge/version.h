//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: version.h
// Purpose: Build version of the flag bridge
//==========================================================================================================
#pragma once

#include <string>

namespace flagbridge {

// "MAJOR.MINOR.PATCH" from the CMake project version. Reported as serverInfo.version, in the
// startup log line and in the User-Agent sent to Unleash.
std::string getVersionString();

} // namespace flagbridge
