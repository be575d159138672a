///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exception type thrown by the sequencing core.
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

#include "Error.h"

namespace spim
{

SPIMError::SPIMError(const std::string& msg, Code code) :
   message_(msg),
   code_(code),
   hasDeviceFaultCode_(false),
   deviceFaultCode_(0)
{}


SPIMError::SPIMError(const char* msg, Code code) :
   message_(msg ? msg : "(null message)"),
   code_(code),
   hasDeviceFaultCode_(false),
   deviceFaultCode_(0)
{}


SPIMError::SPIMError(const std::string& msg, Code code, int deviceFaultCode) :
   message_(msg),
   code_(code),
   hasDeviceFaultCode_(true),
   deviceFaultCode_(deviceFaultCode)
{}


SPIMError::SPIMError(const std::string& msg, Code code,
      const SPIMError& underlyingError) :
   message_(msg),
   code_(code),
   hasDeviceFaultCode_(underlyingError.hasDeviceFaultCode_),
   deviceFaultCode_(underlyingError.deviceFaultCode_),
   underlying_(new SPIMError(underlyingError))
{}


SPIMError::SPIMError(const SPIMError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   hasDeviceFaultCode_(other.hasDeviceFaultCode_),
   deviceFaultCode_(other.deviceFaultCode_)
{
   if (other.underlying_)
      underlying_.reset(new SPIMError(*other.underlying_));
}


SPIMError&
SPIMError::operator=(const SPIMError& rhs)
{
   if (this == &rhs)
      return *this;

   message_ = rhs.message_;
   code_ = rhs.code_;
   hasDeviceFaultCode_ = rhs.hasDeviceFaultCode_;
   deviceFaultCode_ = rhs.deviceFaultCode_;
   if (rhs.underlying_)
      underlying_.reset(new SPIMError(*rhs.underlying_));
   else
      underlying_.reset();
   return *this;
}


std::string
SPIMError::getFullMsg() const
{
   if (underlying_)
      return getMsg() + " [ " + underlying_->getFullMsg() + " ]";
   return getMsg();
}


SPIMError::Code
SPIMError::getSpecificCode() const
{
   if (code_ == SPIMERR_GENERIC && underlying_)
      return underlying_->getSpecificCode();
   return code_;
}


bool
IsProtocolError(SPIMError::Code code)
{
   return code == SPIMERR_PROTOCOL_MALFORMED ||
      code == SPIMERR_PROTOCOL_DEVICE_ERROR;
}


bool
IsSessionError(SPIMError::Code code)
{
   return code == SPIMERR_SESSION_BUSY ||
      code == SPIMERR_SESSION_TIMEOUT ||
      code == SPIMERR_SESSION_NOT_CONNECTED ||
      code == SPIMERR_SESSION_TRANSPORT;
}


bool
IsProgramError(SPIMError::Code code)
{
   return code == SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED ||
      code == SPIMERR_PROGRAM_REJECTED;
}

} // namespace spim
