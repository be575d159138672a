///////////////////////////////////////////////////////////////////////////////
// FILE:          DemoTiger.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Simulated Tiger controller and cameras, for running the
//                engine without hardware.
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

#include "SPIMDevice.h"
#include "Logging/Logger.h"

#include <boost/circular_buffer.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

extern const char* g_DemoTigerName;
extern const char* g_DemoCameraName;

class DemoCamera;

/**
 * Answers controller commands the way a Tiger controller with a scanner card
 * and a PLogic card would, without moving anything.
 *
 * Well-formed commands for a known mnemonic are acknowledged with ":A";
 * unknown mnemonics get ":N-1", and commands addressed to a card that does
 * not exist get ":N-7". The start-scan command makes every attached demo
 * camera produce one volume of frames.
 */
class DemoTigerConnector : public SPIM::Connector
{
public:
   struct Cell
   {
      int type = 0;
      int config = 0;
      int input1 = 0;
      int input2 = 0;
      int input3 = 0;
   };

   DemoTigerConnector(int scannerCard, int logicCard,
         spim::logging::Logger logger);

   int Open();
   int Close();
   bool IsOpen() const;
   int SendQuery(const std::string& command, std::string& answer,
         long timeoutMs);
   int Send(const std::string& command);

   void AttachCamera(std::shared_ptr<DemoCamera> camera);

   // Make the next occurrence of the command fail with ":N-<code>"
   void InjectFault(const std::string& command, int faultCode);

   // Controller state, for inspection
   long GetSliceCount() const;
   long GetSideCount() const;
   long GetRepeatCount() const;
   double GetScanDurationMs() const;
   double GetDelayBeforeSideMs() const;
   double GetAmplitudeDeg() const;
   int GetLogicSaveCount() const;
   char GetScanState() const;
   bool IsLaserEnabled() const;
   std::vector<int> GetSelectedPresets() const;
   bool GetCell(int index, Cell& cell) const;

private:
   std::string Execute(const std::string& command);
   std::string ExecuteScanner(const std::string& mnemonic,
         const std::map<std::string, std::string>& params);
   std::string ExecuteLogic(const std::string& mnemonic,
         const std::map<std::string, std::string>& params);
   void StartScan();

   const int scannerCard_;
   const int logicCard_;
   spim::logging::Logger logger_;

   mutable std::mutex mutex_;
   bool open_;
   long slices_;
   long sides_;
   long repeats_;
   double scanDurationMs_;
   double delayBeforeSideMs_;
   double delayBeforeRepeatMs_;
   double amplitudeDeg_;
   char scanState_;
   bool laserEnabled_;
   int pointer_;
   int saveCount_;
   std::vector<int> presets_;
   std::map<int, Cell> cells_;
   std::map<std::string, int> faults_;
   std::vector<std::shared_ptr<DemoCamera>> cameras_;
};


/**
 * Synthetic camera. With more than one physical label it behaves as a
 * composite device whose sub-cameras are triggered together.
 *
 * Frames go into a bounded circular buffer; a frame produced while the
 * buffer is full is lost and the buffer reports overflow until the next
 * sequence starts.
 */
class DemoCamera : public SPIM::Camera
{
public:
   DemoCamera(const std::string& label,
         const std::vector<std::string>& physicalLabels,
         std::size_t bufferCapacity, spim::logging::Logger logger);

   std::string GetLabel() const;
   bool IsComposite() const;
   unsigned GetNumberOfPhysicalCameras() const;
   int GetPhysicalCameraLabel(unsigned index, std::string& label) const;

   int SetTriggerMode(SPIM::TriggerMode mode);
   double GetMinimumExposureMs() const { return minExposureMs_; }
   void SetMinimumExposureMs(double ms) { minExposureMs_ = ms; }
   void SetImageSize(unsigned width, unsigned height);

   int StartSequenceAcquisition(long numImages);
   int StopSequenceAcquisition();
   bool IsCapturing();
   bool IsBufferOverflowed();
   long GetRemainingImageCount();
   int PopNextImage(SPIM::ImageFrame& frame);

   // Called by the demo controller: one trigger per slice, each exposing
   // every physical camera once. Ignored unless capturing in external
   // trigger mode.
   void TriggerVolume(long numSlices, double slicePeriodMs);

private:
   void GenerateFrame(unsigned cameraIndex, double timestampUs);

   std::string label_;
   std::vector<std::string> physicalLabels_;
   spim::logging::Logger logger_;
   double minExposureMs_;
   unsigned width_;
   unsigned height_;

   std::mutex mutex_;
   boost::circular_buffer<SPIM::ImageFrame> buffer_;
   SPIM::TriggerMode triggerMode_;
   bool capturing_;
   bool overflowed_;
   long imagesRemaining_; // per physical camera
   std::vector<long> sequenceNumbers_;
   double elapsedUs_;
};
