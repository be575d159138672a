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

#include "LogSink.h"
#include "Logger.h"
#include "Metadata.h"

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>


namespace spim
{
namespace logging
{

enum SinkMode
{
   SinkModeSynchronous,
   SinkModeAsynchronous,
};


/**
 * Owner of the log sinks.
 *
 * Synchronous sinks are written on the thread that logs the entry.
 * Asynchronous sinks are written on a background thread owned by the core,
 * so that logging from time-critical threads never waits on file I/O.
 *
 * Must be held by std::shared_ptr (loggers keep the core alive).
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   std::mutex syncSinksMutex_;
   std::vector<std::shared_ptr<LogSink>> synchronousSinks_;

   // Lock order: asyncSinksMutex_ before asyncQueueMutex_
   std::mutex asyncSinksMutex_;
   std::vector<std::shared_ptr<LogSink>> asynchronousSinks_;

   std::mutex asyncQueueMutex_;
   std::condition_variable asyncQueueCondVar_;
   PacketArray asyncQueue_;
   bool shutdownRequested_;

   std::thread asyncThread_;

public:
   LoggingCore();
   ~LoggingCore();

   LoggingCore(const LoggingCore&) = delete;
   LoggingCore& operator=(const LoggingCore&) = delete;

   Logger NewLogger(const std::string& componentLabel);

   void AddSink(std::shared_ptr<LogSink> sink, SinkMode mode);

   // Entries already queued for an asynchronous sink are written before it
   // is removed.
   void RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode);

   // Remove and add sinks with no entry lost or duplicated in between.
   // Iterators dereference to std::pair<std::shared_ptr<LogSink>, SinkMode>.
   template <typename TSinkModePairIterator>
   void AtomicSwapSinks(TSinkModePairIterator firstToRemove,
         TSinkModePairIterator lastToRemove,
         TSinkModePairIterator firstToAdd,
         TSinkModePairIterator lastToAdd);

   // Iterators dereference to
   // std::pair<std::pair<std::shared_ptr<LogSink>, SinkMode>,
   //           std::shared_ptr<EntryFilter>>.
   template <typename TSinkModePairFilterPairIterator>
   void AtomicSetSinkFilters(TSinkModePairFilterPairIterator first,
         TSinkModePairFilterPairIterator last);

   void SendEntry(const LoggerData& loggerData, EntryData entryData,
         const char* text);

private:
   void RunAsyncWriter();
   void FlushAsyncQueueLocked();

   static void AddToList(std::vector<std::shared_ptr<LogSink>>& list,
         std::shared_ptr<LogSink> sink)
   {
      if (std::find(list.begin(), list.end(), sink) == list.end())
         list.push_back(sink);
   }

   static void RemoveFromList(std::vector<std::shared_ptr<LogSink>>& list,
         std::shared_ptr<LogSink> sink)
   {
      list.erase(std::remove(list.begin(), list.end(), sink), list.end());
   }
};


template <typename TSinkModePairIterator>
void
LoggingCore::AtomicSwapSinks(TSinkModePairIterator firstToRemove,
      TSinkModePairIterator lastToRemove,
      TSinkModePairIterator firstToAdd,
      TSinkModePairIterator lastToAdd)
{
   std::lock_guard<std::mutex> syncLock(syncSinksMutex_);
   std::lock_guard<std::mutex> asyncLock(asyncSinksMutex_);

   FlushAsyncQueueLocked();

   for (TSinkModePairIterator it = firstToRemove; it != lastToRemove; ++it)
   {
      if (it->second == SinkModeSynchronous)
         RemoveFromList(synchronousSinks_, it->first);
      else
         RemoveFromList(asynchronousSinks_, it->first);
   }
   for (TSinkModePairIterator it = firstToAdd; it != lastToAdd; ++it)
   {
      if (it->second == SinkModeSynchronous)
         AddToList(synchronousSinks_, it->first);
      else
         AddToList(asynchronousSinks_, it->first);
   }
}


template <typename TSinkModePairFilterPairIterator>
void
LoggingCore::AtomicSetSinkFilters(TSinkModePairFilterPairIterator first,
      TSinkModePairFilterPairIterator last)
{
   std::lock_guard<std::mutex> syncLock(syncSinksMutex_);
   std::lock_guard<std::mutex> asyncLock(asyncSinksMutex_);

   // Queued entries were logged under the old filters
   FlushAsyncQueueLocked();

   for (TSinkModePairFilterPairIterator it = first; it != last; ++it)
      it->first.first->SetFilter(it->second);
}

} // namespace logging
} // namespace spim
