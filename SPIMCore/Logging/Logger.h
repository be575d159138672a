// COPYRIGHT:     University of California, San Francisco, 2014,
//                All Rights reserved
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//
// AUTHOR:        Mark Tsuchida

#pragma once

#include "Metadata.h"

#include <functional>
#include <sstream>
#include <string>
#include <utility>


namespace spim
{
namespace logging
{

/**
 * Handle used by components to emit log entries.
 *
 * Copyable and cheap; the component label is bound when the logger is
 * created by LoggingCore::NewLogger(). A default-constructed logger discards
 * everything.
 */
class Logger
{
public:
   typedef std::function<void(EntryData, const char*)> SendFunction;

private:
   SendFunction send_;

public:
   Logger() {}
   explicit Logger(SendFunction send) : send_(std::move(send)) {}

   void operator()(EntryData entryData, const char* text) const
   {
      if (send_)
         send_(entryData, text);
   }

   void operator()(EntryData entryData, const std::string& text) const
   { (*this)(entryData, text.c_str()); }
};


namespace internal
{

// Collects the streamed text and sends it as one entry on destruction.
class LogStream : public std::ostringstream
{
   Logger logger_;
   EntryData entryData_;
   bool used_;

public:
   LogStream(const Logger& logger, EntryData entryData) :
      logger_(logger),
      entryData_(entryData),
      used_(false)
   {}

   ~LogStream() { logger_(entryData_, str()); }

   // For use by the LOG_* macros' for-statement
   bool Used() const { return used_; }
   void MarkUsed() { used_ = true; }
};

} // namespace internal

} // namespace logging
} // namespace spim


#define LOG_WITH_ENTRY_DATA(logger, data) \
   for (::spim::logging::internal::LogStream spimLogStrm_((logger), (data)); \
         !spimLogStrm_.Used(); spimLogStrm_.MarkUsed()) \
      spimLogStrm_

#define LOG_TRACE(logger) \
   LOG_WITH_ENTRY_DATA((logger), ::spim::logging::LogLevelTrace)
#define LOG_DEBUG(logger) \
   LOG_WITH_ENTRY_DATA((logger), ::spim::logging::LogLevelDebug)
#define LOG_INFO(logger) \
   LOG_WITH_ENTRY_DATA((logger), ::spim::logging::LogLevelInfo)
#define LOG_WARNING(logger) \
   LOG_WITH_ENTRY_DATA((logger), ::spim::logging::LogLevelWarning)
#define LOG_ERROR(logger) \
   LOG_WITH_ENTRY_DATA((logger), ::spim::logging::LogLevelError)
#define LOG_FATAL(logger) \
   LOG_WITH_ENTRY_DATA((logger), ::spim::logging::LogLevelFatal)
