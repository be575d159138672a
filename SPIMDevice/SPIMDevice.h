///////////////////////////////////////////////////////////////////////////////
// FILE:          SPIMDevice.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMDevice - Device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   The interface between the sequencing core and the hardware
//                it drives: the controller connector and camera devices.
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

// N.B.
//
// Device methods report failure through DEVICE_* return codes, never by
// throwing. The core converts codes into exceptions at its boundary.

#include "FrameMetadata.h"
#include "SPIMDeviceConstants.h"

#include <string>
#include <vector>

namespace SPIM {

   /**
    * One image popped from a camera's sequence buffer.
    */
   struct ImageFrame
   {
      unsigned width = 0;
      unsigned height = 0;
      unsigned bytesPerPixel = 0;
      std::vector<unsigned char> pixels;
      FrameMetadata metadata;

      std::size_t GetSizeBytes() const { return pixels.size(); }
   };

   /**
    * Transport to the controller.
    *
    * Moves one command string to the controller and, for acknowledged
    * commands, brings back one reply line (terminator stripped). The
    * connector knows nothing about the command grammar.
    */
   class Connector
   {
   public:
      virtual ~Connector() {}

      virtual int Open() = 0;
      virtual int Close() = 0;
      virtual bool IsOpen() const = 0;

      /**
       * Send a command and block for one reply line.
       *
       * Returns DEVICE_TIMEOUT if no complete reply arrives within
       * timeoutMs. The command may or may not have been executed in that
       * case.
       */
      virtual int SendQuery(const std::string& command, std::string& answer,
            long timeoutMs) = 0;

      /**
       * Send a command for which the controller produces no reply.
       */
      virtual int Send(const std::string& command) = 0;
   };

   /**
    * Camera device as seen by the acquisition engine.
    *
    * A composite camera fans a single logical device out to several
    * physical cameras that are triggered together; every frame it delivers
    * carries the label of the physical camera that produced it.
    */
   class Camera
   {
   public:
      virtual ~Camera() {}

      virtual std::string GetLabel() const = 0;

      // Composite camera support
      virtual bool IsComposite() const = 0;
      virtual unsigned GetNumberOfPhysicalCameras() const = 0;
      virtual int GetPhysicalCameraLabel(unsigned index,
            std::string& label) const = 0;

      virtual int SetTriggerMode(TriggerMode mode) = 0;
      virtual double GetMinimumExposureMs() const = 0;

      // Sequence acquisition
      virtual int StartSequenceAcquisition(long numImages) = 0;
      virtual int StopSequenceAcquisition() = 0;
      virtual bool IsCapturing() = 0;
      virtual bool IsBufferOverflowed() = 0;

      /**
       * Number of frames waiting in the sequence buffer. Never blocks.
       */
      virtual long GetRemainingImageCount() = 0;

      /**
       * Remove the oldest frame from the sequence buffer. Never blocks;
       * returns DEVICE_BUFFER_EMPTY if there is nothing to pop.
       */
      virtual int PopNextImage(ImageFrame& frame) = 0;
   };

} // namespace SPIM
