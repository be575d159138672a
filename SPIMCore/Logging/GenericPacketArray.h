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

#include <cstring>
#include <vector>


namespace spim
{
namespace logging
{
namespace internal
{


// A sequence of line packets making up zero or more whole entries.
template <typename TMetadata>
class GenericPacketArray
{
public:
   typedef TMetadata MetadataType;
   typedef GenericLinePacket<MetadataType> PacketType;
   typedef typename std::vector<PacketType>::const_iterator ConstIterator;

private:
   std::vector<PacketType> packets_;

public:
   // Split the entry text into lines (CR, LF and CRLF each end a line) and
   // lines into packets of at most PacketTextLen characters. Trailing
   // newlines are dropped; an empty entry yields one empty packet.
   void AppendEntry(
         typename MetadataType::LoggerDataType loggerData,
         typename MetadataType::EntryDataType entryData,
         typename MetadataType::StampDataType stampData,
         const char* entryText)
   {
      const MetadataType metadata(loggerData, entryData, stampData);

      const char* begin = entryText;
      const char* end = entryText + std::strlen(entryText);
      while (end > begin && (end[-1] == '\r' || end[-1] == '\n'))
         --end;

      PacketState state = PacketStateEntryFirstLine;
      const char* lineStart = begin;
      for (;;)
      {
         const char* lineEnd = lineStart;
         while (lineEnd < end && *lineEnd != '\r' && *lineEnd != '\n')
            ++lineEnd;

         const char* chunk = lineStart;
         do
         {
            std::size_t len = static_cast<std::size_t>(lineEnd - chunk);
            if (len > PacketType::PacketTextLen)
               len = PacketType::PacketTextLen;
            packets_.push_back(PacketType(state, metadata, chunk, len));
            chunk += len;
            state = PacketStateLineContinuation;
         } while (chunk < lineEnd);

         if (lineEnd == end)
            break;

         if (lineEnd[0] == '\r' && lineEnd + 1 < end && lineEnd[1] == '\n')
            lineStart = lineEnd + 2;
         else
            lineStart = lineEnd + 1;
         state = PacketStateNewLine;
      }
   }

   void Append(const GenericPacketArray& other)
   {
      packets_.insert(packets_.end(),
            other.packets_.begin(), other.packets_.end());
   }

   void Swap(GenericPacketArray& other) { packets_.swap(other.packets_); }
   void Clear() { packets_.clear(); }
   bool IsEmpty() const { return packets_.empty(); }
   std::size_t Size() const { return packets_.size(); }

   ConstIterator Begin() const { return packets_.begin(); }
   ConstIterator End() const { return packets_.end(); }
};


} // namespace internal
} // namespace logging
} // namespace spim
