///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.h
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

#pragma once

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>

namespace spim
{

/// Core error class. Exceptions thrown by the core are of this type.
/**
 * Carries a message, an SPIMERR_* code, optionally the fault code reported
 * by the controller (":N-<code>"), and optionally the error that caused it.
 */
class SPIMError : public std::exception
{
public:
   typedef int Code;

   explicit SPIMError(const std::string& msg, Code code = SPIMERR_GENERIC);
   explicit SPIMError(const char* msg, Code code = SPIMERR_GENERIC);

   /// Construct with a controller fault code.
   SPIMError(const std::string& msg, Code code, int deviceFaultCode);

   /// Construct with an underlying (chained/nested) error.
   SPIMError(const std::string& msg, Code code,
         const SPIMError& underlyingError);

   SPIMError(const SPIMError& other);
   SPIMError& operator=(const SPIMError& rhs);

   virtual ~SPIMError() noexcept {}

   /// Get the error message for this error (excluding any chained errors).
   virtual const char* what() const noexcept { return message_.c_str(); }

   /// Get the error message for this error (excluding any chained errors).
   virtual std::string getMsg() const { return message_; }

   /// Get the message for this error and all chained errors.
   virtual std::string getFullMsg() const;

   /// Get the error code for this error.
   virtual Code getCode() const { return code_; }

   /// Get the code of this error, or of the first chained error that is
   /// more specific than SPIMERR_GENERIC.
   virtual Code getSpecificCode() const;

   bool hasDeviceFaultCode() const { return hasDeviceFaultCode_; }
   int getDeviceFaultCode() const { return deviceFaultCode_; }

   /// Access the underlying error, or nullptr if there is none.
   virtual const SPIMError* getUnderlyingError() const
   { return underlying_.get(); }

private:
   std::string message_;
   Code code_;
   bool hasDeviceFaultCode_;
   int deviceFaultCode_;
   std::unique_ptr<SPIMError> underlying_;
};

// Error families as seen by callers of the engine
bool IsProtocolError(SPIMError::Code code);
bool IsSessionError(SPIMError::Code code);
bool IsProgramError(SPIMError::Code code);

} // namespace spim
