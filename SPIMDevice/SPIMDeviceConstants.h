///////////////////////////////////////////////////////////////////////////////
// FILE:          SPIMDeviceConstants.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMDevice - Device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Return codes and keywords shared by device implementations
//                and the core.
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

///////////////////////////////////////////////////////////////////////////////
// Global error codes
//
#define DEVICE_OK                      0
#define DEVICE_ERR                     1 // generic, undefined error
#define DEVICE_NOT_CONNECTED           2
#define DEVICE_TIMEOUT                 3
#define DEVICE_INVALID_INPUT_PARAM     4
#define DEVICE_NOT_SUPPORTED           5
#define DEVICE_CAMERA_BUSY_ACQUIRING   6
#define DEVICE_BUFFER_OVERFLOW         7
#define DEVICE_BUFFER_EMPTY            8
#define DEVICE_SERIAL_COMMAND_FAILED   9
#define DEVICE_UNSUPPORTED_COMMAND     10

namespace SPIM {

   const int MaxStrLength = 1024;

   // Standard per-frame metadata keys. Cameras must supply the first three
   // for every frame they hand to the core.
   namespace g_Keyword_Metadata {
      const char* const CameraLabel = "Camera";
      const char* const HardwareSequenceNumber = "HardwareSequenceNumber";
      const char* const HardwareTimestampUs = "HardwareTimestamp-us";
      const char* const Width = "Width";
      const char* const Height = "Height";
   }

   enum TriggerMode {
      InternalTrigger,
      ExternalEdgeTrigger
   };

} // namespace SPIM
