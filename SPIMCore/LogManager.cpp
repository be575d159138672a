///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.cpp
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

#include "LogManager.h"

#include "ControllerConfig.h"
#include "CoreUtils.h"
#include "Error.h"

#include <utility>
#include <vector>

namespace spim
{

namespace
{

const logging::SinkMode LogSinkMode = logging::SinkModeAsynchronous;

typedef std::pair<std::shared_ptr<logging::LogSink>, logging::SinkMode>
   SinkModePair;

} // anonymous namespace


const char*
StringForLogLevel(logging::LogLevel level)
{
   switch (level)
   {
      case logging::LogLevelTrace: return "trace";
      case logging::LogLevelDebug: return "debug";
      case logging::LogLevelInfo: return "info";
      case logging::LogLevelWarning: return "warning";
      case logging::LogLevelError: return "error";
      case logging::LogLevelFatal: return "fatal";
      default: return "(unknown)";
   }
}


logging::LogLevel
LogLevelFromString(const std::string& name)
{
   static const logging::LogLevel levels[] = {
      logging::LogLevelTrace,
      logging::LogLevelDebug,
      logging::LogLevelInfo,
      logging::LogLevelWarning,
      logging::LogLevelError,
      logging::LogLevelFatal,
   };
   for (logging::LogLevel level : levels)
   {
      if (name == StringForLogLevel(level))
         return level;
   }
   throw SPIMError("Unknown log level " + ToQuotedString(name),
         SPIMERR_INVALID_CONFIGURATION);
}


LogManager::LogManager() :
   core_(std::make_shared<logging::LoggingCore>()),
   logger_(core_->NewLogger("LogManager")),
   level_(logging::LogLevelInfo)
{}


void
LogManager::Configure(const LoggingSettings& settings)
{
   const logging::LogLevel level = LogLevelFromString(settings.level);

   std::lock_guard<std::mutex> lock(mutex_);
   SetLevelLocked(level);
   EnableStdErrLocked(settings.useStdErr);
   SetLogFileLocked(settings.file, false);
}


void
LogManager::SetLevel(logging::LogLevel level)
{
   std::lock_guard<std::mutex> lock(mutex_);
   SetLevelLocked(level);
}


logging::LogLevel
LogManager::GetLevel() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return level_;
}


void
LogManager::EnableStdErr(bool enable)
{
   std::lock_guard<std::mutex> lock(mutex_);
   EnableStdErrLocked(enable);
}


bool
LogManager::IsStdErrEnabled() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return stdErrSink_ != nullptr;
}


void
LogManager::SetLogFile(const std::string& filename, bool truncate)
{
   std::lock_guard<std::mutex> lock(mutex_);
   SetLogFileLocked(filename, truncate);
}


std::string
LogManager::GetLogFile() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return fileSink_ ? fileSink_->GetFilename() : std::string();
}


logging::Logger
LogManager::NewLogger(const std::string& label)
{
   return core_->NewLogger(label);
}


void
LogManager::SetLevelLocked(logging::LogLevel level)
{
   if (level == level_)
      return;
   level_ = level;

   std::shared_ptr<logging::EntryFilter> filter =
      std::make_shared<logging::LevelFilter>(level);
   std::vector<std::pair<SinkModePair, std::shared_ptr<logging::EntryFilter>>>
      changes;
   if (stdErrSink_)
      changes.push_back(std::make_pair(SinkModePair(stdErrSink_, LogSinkMode), filter));
   if (fileSink_)
      changes.push_back(std::make_pair(SinkModePair(fileSink_, LogSinkMode), filter));
   core_->AtomicSetSinkFilters(changes.begin(), changes.end());

   LOG_INFO(logger_) << "Log level set to " << StringForLogLevel(level);
}


void
LogManager::EnableStdErrLocked(bool enable)
{
   if (enable == (stdErrSink_ != nullptr))
      return;

   if (enable)
   {
      stdErrSink_ = std::make_shared<logging::StdErrLogSink>();
      stdErrSink_->SetFilter(std::make_shared<logging::LevelFilter>(level_));
      core_->AddSink(stdErrSink_, LogSinkMode);
   }
   else
   {
      core_->RemoveSink(stdErrSink_, LogSinkMode);
      stdErrSink_.reset();
   }
}


void
LogManager::SetLogFileLocked(const std::string& filename, bool truncate)
{
   if (fileSink_ && fileSink_->GetFilename() == filename)
      return;

   if (filename.empty())
   {
      if (fileSink_)
      {
         LOG_INFO(logger_) << "Closing log file " << fileSink_->GetFilename();
         core_->RemoveSink(fileSink_, LogSinkMode);
         fileSink_.reset();
      }
      return;
   }

   std::shared_ptr<logging::FileLogSink> newSink;
   try
   {
      newSink = std::make_shared<logging::FileLogSink>(filename, !truncate);
   }
   catch (const logging::CannotOpenFileException&)
   {
      LOG_ERROR(logger_) << "Cannot open log file " << filename;
      throw SPIMError("Cannot open file " + ToQuotedString(filename),
            SPIMERR_FILE_OPEN_FAILED);
   }
   newSink->SetFilter(std::make_shared<logging::LevelFilter>(level_));

   // Swap in one step so that no entry is lost between the two files
   std::vector<SinkModePair> toRemove;
   if (fileSink_)
      toRemove.push_back(SinkModePair(fileSink_, LogSinkMode));
   std::vector<SinkModePair> toAdd(1, SinkModePair(newSink, LogSinkMode));
   core_->AtomicSwapSinks(toRemove.begin(), toRemove.end(),
         toAdd.begin(), toAdd.end());
   fileSink_ = newSink;

   LOG_INFO(logger_) << "Logging to " << filename;
}

} // namespace spim
