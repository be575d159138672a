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

#include <algorithm>
#include <cstddef>
#include <cstring>


namespace spim
{
namespace logging
{
namespace internal
{


enum PacketState
{
   PacketStateEntryFirstLine,
   PacketStateNewLine,
   PacketStateLineContinuation,
};


// A fixed-size chunk of one log line. Entries are split into packets so that
// they can be queued without per-entry heap allocation of the text.
template <typename TMetadata>
class GenericLinePacket
{
public:
   typedef TMetadata MetadataType;

   static const std::size_t PacketTextLen = 127;

private:
   PacketState state_;
   MetadataType metadata_;
   char text_[PacketTextLen + 1];

public:
   GenericLinePacket(PacketState state, const MetadataType& metadata,
         const char* text, std::size_t textLen) :
      state_(state),
      metadata_(metadata)
   {
      std::size_t len = (std::min)(textLen, PacketTextLen);
      std::memcpy(text_, text, len);
      text_[len] = '\0';
   }

   PacketState GetPacketState() const { return state_; }
   const MetadataType& GetMetadataConstRef() const { return metadata_; }
   const char* GetText() const { return text_; }
};


} // namespace internal
} // namespace logging
} // namespace spim
