/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

#pragma once

/**
 * @file StrataCore.h
 * @brief Single header that includes all StrataCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// File system
#include "FileSystem/DirectoryEntry.h"
#include "FileSystem/FileOpenLimiter.h"
#include "FileSystem/FileSystemError.h"
#include "FileSystem/IFileSystem.h"
#include "FileSystem/ModKey.h"
#include "FileSystem/PathUtils.h"
#include "FileSystem/RealFileSystem.h"
