///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceSession.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Serialized command/acknowledge exchange with the controller.
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

#pragma once

#include "CommandCodec.h"
#include "ControllerConfig.h"
#include "Logging/Logger.h"

#include "../SPIMDevice/SPIMDevice.h"

#include <atomic>
#include <memory>
#include <string>

namespace spim
{

/**
 * The single owner of the controller connection.
 *
 * At most one command is in flight. A call made while another is in flight
 * fails immediately with SPIMERR_SESSION_BUSY instead of queueing; callers
 * are expected to issue commands from one context.
 */
class DeviceSession
{
public:
   enum State
   {
      StateDisconnected,
      StateConnected,
      StateBusy,
   };

private:
   std::shared_ptr<SPIM::Connector> connector_;
   logging::Logger logger_;
   std::atomic<int> state_;
   std::atomic<long> timeoutMs_;
   std::atomic<unsigned long long> commandCount_;

   class BusyGuard;

public:
   DeviceSession(std::shared_ptr<SPIM::Connector> connector,
         const SessionSettings& settings, logging::Logger logger);
   ~DeviceSession();

   DeviceSession(const DeviceSession&) = delete;
   DeviceSession& operator=(const DeviceSession&) = delete;

   void Connect();
   void Disconnect();

   /**
    * Send a command and wait for its acknowledgement.
    *
    * Throws SPIMError with SPIMERR_SESSION_TIMEOUT when the reply does not
    * arrive in time (the session is usable again afterwards), or with a
    * protocol error code when the reply is a fault or cannot be parsed.
    */
   Ack Send(const std::string& command);

   // For commands the controller never acknowledges
   void SendFireAndForget(const std::string& command);

   State GetState() const { return static_cast<State>(state_.load()); }
   bool IsConnected() const { return GetState() != StateDisconnected; }

   void SetTimeoutMs(long timeoutMs);
   long GetTimeoutMs() const { return timeoutMs_.load(); }

   // Number of acknowledged commands since construction
   unsigned long long GetCommandCount() const { return commandCount_.load(); }
};

const char* SessionStateName(DeviceSession::State state);

} // namespace spim
