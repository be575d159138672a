///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Owns the logging core and the two sinks SPIMCore writes to.
//
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "Logging/Logging.h"

#include <memory>
#include <mutex>
#include <string>

namespace spim
{

struct LoggingSettings;

/**
 * Owns the logging core. Entries go to stderr, to one log file, or both,
 * filtered by a single level.
 */
class LogManager
{
   std::shared_ptr<logging::LoggingCore> core_;
   logging::Logger logger_;

   mutable std::mutex mutex_;
   logging::LogLevel level_;
   std::shared_ptr<logging::StdErrLogSink> stdErrSink_;
   std::shared_ptr<logging::FileLogSink> fileSink_;

public:
   LogManager();

   /**
    * Apply the logging section of a controller configuration: level, then
    * stderr, then the log file (appended to). An unknown level throws
    * SPIMERR_INVALID_CONFIGURATION before anything is changed; a file that
    * cannot be opened throws SPIMERR_FILE_OPEN_FAILED.
    */
   void Configure(const LoggingSettings& settings);

   void SetLevel(logging::LogLevel level);
   logging::LogLevel GetLevel() const;

   void EnableStdErr(bool enable);
   bool IsStdErrEnabled() const;

   // Empty filename closes the log file
   void SetLogFile(const std::string& filename, bool truncate);
   std::string GetLogFile() const;

   logging::Logger NewLogger(const std::string& label);

private:
   void SetLevelLocked(logging::LogLevel level);
   void EnableStdErrLocked(bool enable);
   void SetLogFileLocked(const std::string& filename, bool truncate);
};

// "trace", "debug", "info", "warning", "error" or "fatal"; throws
// SPIMError(SPIMERR_INVALID_CONFIGURATION) for anything else.
logging::LogLevel LogLevelFromString(const std::string& name);
const char* StringForLogLevel(logging::LogLevel level);

} // namespace spim
