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

#include "LogSink.h"

#include <iostream>


namespace spim
{
namespace logging
{

void
LogSink::SetFilter(std::shared_ptr<EntryFilter> filter)
{
   std::lock_guard<std::mutex> lock(filterMutex_);
   filter_ = filter;
}


void
LogSink::Append(const PacketArray& packets)
{
   std::shared_ptr<EntryFilter> filter;
   {
      std::lock_guard<std::mutex> lock(filterMutex_);
      filter = filter_;
   }

   filtered_.clear();
   for (PacketArray::ConstIterator it = packets.Begin(), end = packets.End();
         it != end; ++it)
   {
      if (!filter || filter->Filter(it->GetMetadataConstRef()))
         filtered_.push_back(*it);
   }
   if (!filtered_.empty())
      Consume(filtered_.begin(), filtered_.end());
}


void
StdErrLogSink::Consume(std::vector<LinePacket>::const_iterator begin,
      std::vector<LinePacket>::const_iterator end)
{
   internal::WriteLinesToStreamWithStandardFormat(std::clog, begin, end,
         formatter_);
   std::clog.flush();
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException();
}


void
FileLogSink::Consume(std::vector<LinePacket>::const_iterator begin,
      std::vector<LinePacket>::const_iterator end)
{
   internal::WriteLinesToStreamWithStandardFormat(fileStream_, begin, end,
         formatter_);
   fileStream_.flush();
}

} // namespace logging
} // namespace spim
