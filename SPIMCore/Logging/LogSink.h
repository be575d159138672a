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

#include "GenericPacketArray.h"
#include "Metadata.h"
#include "MetadataFormatter.h"

#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>


namespace spim
{
namespace logging
{

typedef internal::GenericLinePacket<Metadata> LinePacket;
typedef internal::GenericPacketArray<Metadata> PacketArray;


class EntryFilter
{
public:
   virtual ~EntryFilter() {}
   virtual bool Filter(const Metadata& metadata) const = 0;
};


class LevelFilter : public EntryFilter
{
   LogLevel minLevel_;

public:
   LevelFilter(LogLevel minLevel) : minLevel_(minLevel) {}

   virtual bool Filter(const Metadata& metadata) const
   { return metadata.GetEntryData().GetLevel() >= minLevel_; }
};


/**
 * Base class for log destinations.
 *
 * Consume() is only ever called with whole entries that passed the filter,
 * and never concurrently for the same sink.
 */
class LogSink
{
   std::mutex filterMutex_;
   std::shared_ptr<EntryFilter> filter_;
   std::vector<LinePacket> filtered_;

public:
   virtual ~LogSink() {}

   void SetFilter(std::shared_ptr<EntryFilter> filter);

   // Called by the logging core
   void Append(const PacketArray& packets);

protected:
   virtual void Consume(std::vector<LinePacket>::const_iterator begin,
         std::vector<LinePacket>::const_iterator end) = 0;
};


class StdErrLogSink : public LogSink
{
   internal::MetadataFormatter formatter_;

public:
   StdErrLogSink() {}

protected:
   virtual void Consume(std::vector<LinePacket>::const_iterator begin,
         std::vector<LinePacket>::const_iterator end);
};


class CannotOpenFileException : public std::exception
{
public:
   virtual const char* what() const noexcept { return "Cannot open log file"; }
};


class FileLogSink : public LogSink
{
   std::string filename_;
   std::ofstream fileStream_;
   internal::MetadataFormatter formatter_;

public:
   FileLogSink(const std::string& filename, bool append = false);

   const std::string& GetFilename() const { return filename_; }

protected:
   virtual void Consume(std::vector<LinePacket>::const_iterator begin,
         std::vector<LinePacket>::const_iterator end);
};

} // namespace logging
} // namespace spim
