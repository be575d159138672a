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


namespace spim
{
namespace logging
{
namespace internal
{


// Metadata is split into three parts: data fixed per logger (component
// label), data chosen per entry (level), and data stamped by the core when
// the entry is sent (time, thread).
template <typename TLoggerData, typename TEntryData, typename TStampData>
class GenericMetadata
{
public:
   typedef TLoggerData LoggerDataType;
   typedef TEntryData EntryDataType;
   typedef TStampData StampDataType;

private:
   LoggerDataType loggerData_;
   EntryDataType entryData_;
   StampDataType stampData_;

public:
   GenericMetadata(const LoggerDataType& loggerData,
         const EntryDataType& entryData, const StampDataType& stampData) :
      loggerData_(loggerData),
      entryData_(entryData),
      stampData_(stampData)
   {}

   const LoggerDataType& GetLoggerData() const { return loggerData_; }
   const EntryDataType& GetEntryData() const { return entryData_; }
   const StampDataType& GetStampData() const { return stampData_; }
};


} // namespace internal
} // namespace logging
} // namespace spim
