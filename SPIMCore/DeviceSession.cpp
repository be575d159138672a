///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceSession.cpp
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

#include "DeviceSession.h"

#include "CoreUtils.h"
#include "Error.h"

namespace spim
{

// Holds the session in StateBusy for the duration of one exchange
class DeviceSession::BusyGuard
{
   std::atomic<int>& state_;
   int exitState_;

public:
   BusyGuard(std::atomic<int>& state, int requiredState, int exitState) :
      state_(state),
      exitState_(exitState)
   {
      int expected = requiredState;
      if (!state_.compare_exchange_strong(expected, StateBusy))
      {
         if (expected == StateBusy)
         {
            throw SPIMError("Controller session is busy with another command",
                  SPIMERR_SESSION_BUSY);
         }
         if (expected == StateDisconnected)
         {
            throw SPIMError("Controller session is not connected",
                  SPIMERR_SESSION_NOT_CONNECTED);
         }
         throw SPIMError("Controller session is already connected",
               SPIMERR_GENERIC);
      }
   }

   ~BusyGuard() { state_.store(exitState_); }

   void SetExitState(int state) { exitState_ = state; }
};


const char*
SessionStateName(DeviceSession::State state)
{
   switch (state)
   {
      case DeviceSession::StateDisconnected: return "Disconnected";
      case DeviceSession::StateConnected: return "Connected";
      case DeviceSession::StateBusy: return "Busy";
   }
   return "(unknown)";
}


DeviceSession::DeviceSession(std::shared_ptr<SPIM::Connector> connector,
      const SessionSettings& settings, logging::Logger logger) :
   connector_(connector),
   logger_(logger),
   state_(StateDisconnected),
   timeoutMs_(settings.commandTimeoutMs),
   commandCount_(0)
{
   if (!connector_)
      throw SPIMError("Controller session requires a connector");
}


DeviceSession::~DeviceSession()
{
   if (GetState() == StateConnected)
   {
      int ret = connector_->Close();
      if (ret != DEVICE_OK)
         LOG_WARNING(logger_) << "Closing connector failed (error " << ret << ")";
   }
}


void
DeviceSession::Connect()
{
   if (GetState() == StateConnected)
      return;

   BusyGuard guard(state_, StateDisconnected, StateDisconnected);
   int ret = connector_->Open();
   if (ret != DEVICE_OK)
   {
      LOG_ERROR(logger_) << "Failed to open connector (error " << ret << ")";
      throw SPIMError("Cannot connect to controller (error " + ToString(ret) +
            ")", SPIMERR_SESSION_TRANSPORT);
   }
   guard.SetExitState(StateConnected);
   LOG_INFO(logger_) << "Connected";
}


void
DeviceSession::Disconnect()
{
   if (GetState() == StateDisconnected)
      return;

   BusyGuard guard(state_, StateConnected, StateDisconnected);
   int ret = connector_->Close();
   if (ret != DEVICE_OK)
      LOG_WARNING(logger_) << "Closing connector failed (error " << ret << ")";
   LOG_INFO(logger_) << "Disconnected";
}


Ack
DeviceSession::Send(const std::string& command)
{
   BusyGuard guard(state_, StateConnected, StateConnected);

   LOG_DEBUG(logger_) << "-> " << command;

   std::string answer;
   const long timeoutMs = timeoutMs_.load();
   int ret = connector_->SendQuery(command, answer, timeoutMs);
   if (ret == DEVICE_TIMEOUT)
   {
      LOG_ERROR(logger_) << "No reply to " << command << " within " <<
         timeoutMs << " ms";
      throw SPIMError("Timed out waiting for reply to " +
            ToQuotedString(command), SPIMERR_SESSION_TIMEOUT);
   }
   if (ret == DEVICE_NOT_CONNECTED)
   {
      guard.SetExitState(StateDisconnected);
      throw SPIMError("Connector is not open", SPIMERR_SESSION_NOT_CONNECTED);
   }
   if (ret != DEVICE_OK)
   {
      throw SPIMError("Transport error " + ToString(ret) + " sending " +
            ToQuotedString(command), SPIMERR_SESSION_TRANSPORT);
   }

   LOG_DEBUG(logger_) << "<- " << answer;

   try
   {
      Ack ack = ParseAck(answer);
      ++commandCount_;
      return ack;
   }
   catch (const SPIMError& e)
   {
      LOG_ERROR(logger_) << command << ": " << e.getMsg();
      throw SPIMError("Command " + ToQuotedString(command) + " failed",
            e.getCode(), e);
   }
}


void
DeviceSession::SendFireAndForget(const std::string& command)
{
   BusyGuard guard(state_, StateConnected, StateConnected);

   LOG_DEBUG(logger_) << "-> " << command << " (no reply expected)";

   int ret = connector_->Send(command);
   if (ret == DEVICE_NOT_CONNECTED)
   {
      guard.SetExitState(StateDisconnected);
      throw SPIMError("Connector is not open", SPIMERR_SESSION_NOT_CONNECTED);
   }
   if (ret != DEVICE_OK)
   {
      throw SPIMError("Transport error " + ToString(ret) + " sending " +
            ToQuotedString(command), SPIMERR_SESSION_TRANSPORT);
   }
}


void
DeviceSession::SetTimeoutMs(long timeoutMs)
{
   if (timeoutMs <= 0)
   {
      throw SPIMError("Command timeout must be positive",
            SPIMERR_INVALID_CONFIGURATION);
   }
   timeoutMs_.store(timeoutMs);
}

} // namespace spim
