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

#include "LoggingCore.h"


namespace spim
{
namespace logging
{

LoggingCore::LoggingCore() :
   shutdownRequested_(false)
{
   asyncThread_ = std::thread(&LoggingCore::RunAsyncWriter, this);
}


LoggingCore::~LoggingCore()
{
   {
      std::lock_guard<std::mutex> lock(asyncQueueMutex_);
      shutdownRequested_ = true;
   }
   asyncQueueCondVar_.notify_one();
   asyncThread_.join();
}


Logger
LoggingCore::NewLogger(const std::string& componentLabel)
{
   std::shared_ptr<LoggingCore> self = shared_from_this();
   LoggerData loggerData(componentLabel);
   return Logger([self, loggerData](EntryData entryData, const char* text)
         { self->SendEntry(loggerData, entryData, text); });
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   if (mode == SinkModeSynchronous)
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      AddToList(synchronousSinks_, sink);
   }
   else
   {
      std::lock_guard<std::mutex> lock(asyncSinksMutex_);
      AddToList(asynchronousSinks_, sink);
   }
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   if (mode == SinkModeSynchronous)
   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      RemoveFromList(synchronousSinks_, sink);
   }
   else
   {
      std::lock_guard<std::mutex> lock(asyncSinksMutex_);
      FlushAsyncQueueLocked();
      RemoveFromList(asynchronousSinks_, sink);
   }
}


void
LoggingCore::SendEntry(const LoggerData& loggerData, EntryData entryData,
      const char* text)
{
   StampData stampData;
   stampData.Stamp();

   PacketArray packets;
   packets.AppendEntry(loggerData, entryData, stampData, text);

   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      for (const auto& sink : synchronousSinks_)
         sink->Append(packets);
   }

   {
      std::lock_guard<std::mutex> lock(asyncQueueMutex_);
      asyncQueue_.Append(packets);
   }
   asyncQueueCondVar_.notify_one();
}


// Caller must hold asyncSinksMutex_
void
LoggingCore::FlushAsyncQueueLocked()
{
   PacketArray pending;
   {
      std::lock_guard<std::mutex> lock(asyncQueueMutex_);
      pending.Swap(asyncQueue_);
   }
   if (pending.IsEmpty())
      return;
   for (const auto& sink : asynchronousSinks_)
      sink->Append(pending);
}


void
LoggingCore::RunAsyncWriter()
{
   for (;;)
   {
      bool shuttingDown;
      {
         std::unique_lock<std::mutex> lock(asyncQueueMutex_);
         asyncQueueCondVar_.wait(lock,
               [this] { return shutdownRequested_ || !asyncQueue_.IsEmpty(); });
         shuttingDown = shutdownRequested_;
      }

      {
         std::lock_guard<std::mutex> lock(asyncSinksMutex_);
         FlushAsyncQueueLocked();
      }

      if (shuttingDown)
         return;
   }
}

} // namespace logging
} // namespace spim
