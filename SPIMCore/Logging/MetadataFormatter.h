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

#include "GenericLinePacket.h"
#include "Metadata.h"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <ostream>
#include <sstream>
#include <string>


namespace spim
{
namespace logging
{
namespace internal
{


inline const char*
LevelString(LogLevel logLevel)
{
   switch (logLevel)
   {
      case LogLevelTrace: return "trc";
      case LogLevelDebug: return "dbg";
      case LogLevelInfo: return "IFO";
      case LogLevelWarning: return "WRN";
      case LogLevelError: return "ERR";
      case LogLevelFatal: return "FTL";
      default: return "???";
   }
}


// Stateful formatter for the entry prefix and the matching continuation
// prefix. Single-threaded use only; each sink owns one.
class MetadataFormatter
{
   std::string buf_;
   std::ostringstream sstrm_;
   std::size_t openBracketCol_;
   std::size_t closeBracketCol_;

public:
   MetadataFormatter() : openBracketCol_(0), closeBracketCol_(0) {}

   // "<time> tid<id> [LVL,component]"
   void FormatLinePrefix(std::ostream& stream, const Metadata& metadata);

   // Blank padding with the brackets aligned under the first line's
   void FormatContinuationPrefix(std::ostream& stream);
};


inline std::string
FormatLocalTime(std::chrono::time_point<std::chrono::system_clock> tp)
{
   using namespace std::chrono;
   auto us = duration_cast<microseconds>(tp.time_since_epoch());
   auto secs = duration_cast<seconds>(us);
   auto whole = duration_cast<microseconds>(secs);
   auto frac = static_cast<int>((us - whole).count());

   std::time_t t(secs.count());
   std::tm tmstruct;
   std::tm* ptm = localtime_r(&t, &tmstruct);

   // "yyyy-mm-ddThh:mm:ss.uuuuuu"
   char buf[32];
   std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", ptm);
   std::snprintf(buf + len, sizeof(buf) - len, ".%06d", frac);
   return buf;
}


inline void
MetadataFormatter::FormatLinePrefix(std::ostream& stream,
      const Metadata& metadata)
{
   buf_ = FormatLocalTime(metadata.GetStampData().GetTimestamp());
   buf_ += " tid";
   sstrm_.str(std::string());
   sstrm_ << metadata.GetStampData().GetThreadId();
   buf_ += sstrm_.str();
   buf_ += ' ';

   openBracketCol_ = buf_.size();
   buf_ += '[';

   buf_ += LevelString(metadata.GetEntryData().GetLevel());
   buf_ += ',';
   buf_ += metadata.GetLoggerData().GetComponentLabel();

   closeBracketCol_ = buf_.size();
   buf_ += ']';

   stream << buf_;
}


inline void
MetadataFormatter::FormatContinuationPrefix(std::ostream& stream)
{
   buf_.assign(closeBracketCol_ + 1, ' ');
   buf_[openBracketCol_] = '[';
   buf_[closeBracketCol_] = ']';
   stream << buf_;
}


// Write whole entries, one output line per hard line; soft-split packets are
// joined back together.
template <typename TPacketIter>
void
WriteLinesToStreamWithStandardFormat(std::ostream& stream,
      TPacketIter begin, TPacketIter end, MetadataFormatter& formatter)
{
   bool beforeFirst = true;
   for (TPacketIter it = begin; it != end; ++it)
   {
      switch (it->GetPacketState())
      {
         case PacketStateEntryFirstLine:
            if (!beforeFirst)
               stream << '\n';
            formatter.FormatLinePrefix(stream, it->GetMetadataConstRef());
            stream << ' ' << it->GetText();
            break;
         case PacketStateNewLine:
            stream << '\n';
            formatter.FormatContinuationPrefix(stream);
            stream << ' ' << it->GetText();
            break;
         case PacketStateLineContinuation:
            stream << it->GetText();
            break;
      }
      beforeFirst = false;
   }
   if (!beforeFirst)
      stream << '\n';
}


} // namespace internal
} // namespace logging
} // namespace spim
