//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: version.cpp
// Purpose: Build version string
//==========================================================================================================
#include "flagbridge/version.h"

#ifndef FLAGBRIDGE_VERSION
#error "FLAGBRIDGE_VERSION must be defined by the build"
#endif

namespace flagbridge {

std::string getVersionString() {
    return FLAGBRIDGE_VERSION;
}

} // namespace flagbridge
