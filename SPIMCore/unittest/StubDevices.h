// Stub connector and camera for SPIMCore unit tests. The connector records
// every command it is given and answers from a script; the camera buffers
// whatever frames the test (or a connector callback) pushes into it.

#pragma once

#include "SPIMDevice.h"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct StubConnector : SPIM::Connector {
   // Reply per exact command; anything not listed gets ":A"
   std::map<std::string, std::string> replies;
   // Commands that never get a reply
   std::set<std::string> timeouts;
   // Return code of SendQuery() for commands not listed in timeouts
   int queryResult = DEVICE_OK;
   // Called (on the sending thread) after each command is recorded
   std::function<void(const std::string&)> onCommand;

   bool open = false;

   int Open() override { open = true; return DEVICE_OK; }
   int Close() override { open = false; return DEVICE_OK; }
   bool IsOpen() const override { return open; }

   int SendQuery(const std::string& command, std::string& answer,
         long) override {
      Record(command, true);
      if (onCommand)
         onCommand(command);
      if (timeouts.count(command))
         return DEVICE_TIMEOUT;
      if (queryResult != DEVICE_OK)
         return queryResult;
      auto it = replies.find(command);
      answer = (it == replies.end()) ? ":A" : it->second;
      return DEVICE_OK;
   }

   int Send(const std::string& command) override {
      Record(command, false);
      if (onCommand)
         onCommand(command);
      return DEVICE_OK;
   }

   std::vector<std::string> GetCommands() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return commands_;
   }

   // Commands sent with Send() rather than SendQuery()
   std::vector<std::string> GetUnacknowledgedCommands() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return unacknowledged_;
   }

   std::size_t CountCommand(const std::string& command) const {
      std::lock_guard<std::mutex> lock(mutex_);
      std::size_t n = 0;
      for (const std::string& c : commands_)
         if (c == command)
            ++n;
      return n;
   }

   void ClearCommands() {
      std::lock_guard<std::mutex> lock(mutex_);
      commands_.clear();
      unacknowledged_.clear();
   }

private:
   void Record(const std::string& command, bool acknowledged) {
      std::lock_guard<std::mutex> lock(mutex_);
      commands_.push_back(command);
      if (!acknowledged)
         unacknowledged_.push_back(command);
   }

   mutable std::mutex mutex_;
   std::vector<std::string> commands_;
   std::vector<std::string> unacknowledged_;
};

struct StubCamera : SPIM::Camera {
   std::string label = "StubCamera";
   // Non-empty makes this a composite camera
   std::vector<std::string> physicalLabels;
   double minExposureMs = 0.0;
   unsigned width = 4;
   unsigned height = 2;
   unsigned bytesPerPixel = 2;

   int startResult = DEVICE_OK;
   int popResult = DEVICE_OK;

   std::string GetLabel() const override { return label; }
   bool IsComposite() const override { return !physicalLabels.empty(); }
   unsigned GetNumberOfPhysicalCameras() const override {
      return IsComposite() ?
         static_cast<unsigned>(physicalLabels.size()) : 1;
   }
   int GetPhysicalCameraLabel(unsigned index,
         std::string& physLabel) const override {
      if (!IsComposite()) {
         physLabel = label;
         return index == 0 ? DEVICE_OK : DEVICE_INVALID_INPUT_PARAM;
      }
      if (index >= physicalLabels.size())
         return DEVICE_INVALID_INPUT_PARAM;
      physLabel = physicalLabels[index];
      return DEVICE_OK;
   }

   int SetTriggerMode(SPIM::TriggerMode mode) override {
      std::lock_guard<std::mutex> lock(mutex_);
      triggerModes_.push_back(mode);
      return DEVICE_OK;
   }
   double GetMinimumExposureMs() const override { return minExposureMs; }

   int StartSequenceAcquisition(long numImages) override {
      std::lock_guard<std::mutex> lock(mutex_);
      if (startResult != DEVICE_OK)
         return startResult;
      capturing_ = true;
      requestedImages_ = numImages;
      return DEVICE_OK;
   }
   int StopSequenceAcquisition() override {
      std::lock_guard<std::mutex> lock(mutex_);
      capturing_ = false;
      ++stopCount_;
      return DEVICE_OK;
   }
   bool IsCapturing() override {
      std::lock_guard<std::mutex> lock(mutex_);
      return capturing_;
   }
   bool IsBufferOverflowed() override {
      std::lock_guard<std::mutex> lock(mutex_);
      return overflowed_;
   }
   long GetRemainingImageCount() override {
      std::lock_guard<std::mutex> lock(mutex_);
      return static_cast<long>(buffer_.size());
   }
   int PopNextImage(SPIM::ImageFrame& frame) override {
      std::lock_guard<std::mutex> lock(mutex_);
      if (popResult != DEVICE_OK)
         return popResult;
      if (buffer_.empty())
         return DEVICE_BUFFER_EMPTY;
      frame = buffer_.front();
      buffer_.pop_front();
      return DEVICE_OK;
   }

   // Push one frame as if produced by the given physical camera
   void InsertFrame(const std::string& physLabel) {
      std::lock_guard<std::mutex> lock(mutex_);
      SPIM::ImageFrame frame;
      frame.width = width;
      frame.height = height;
      frame.bytesPerPixel = bytesPerPixel;
      frame.pixels.assign(
            static_cast<std::size_t>(width) * height * bytesPerPixel,
            static_cast<unsigned char>(sequenceNumber_ & 0xff));
      frame.metadata.AddTag(SPIM::g_Keyword_Metadata::CameraLabel, physLabel);
      frame.metadata.AddTag(SPIM::g_Keyword_Metadata::HardwareSequenceNumber,
            sequenceNumber_);
      frame.metadata.AddTag(SPIM::g_Keyword_Metadata::HardwareTimestampUs,
            sequenceNumber_ * 1000);
      ++sequenceNumber_;
      buffer_.push_back(frame);
   }

   // Push the frames of one volume in hardware order
   void InsertVolume(unsigned numSlices) {
      std::vector<std::string> labels = physicalLabels;
      if (labels.empty())
         labels.push_back(label);
      for (unsigned s = 0; s < numSlices; ++s)
         for (const std::string& l : labels)
            InsertFrame(l);
   }

   void SetOverflowed(bool flag) {
      std::lock_guard<std::mutex> lock(mutex_);
      overflowed_ = flag;
   }
   void SetCapturing(bool flag) {
      std::lock_guard<std::mutex> lock(mutex_);
      capturing_ = flag;
   }

   std::vector<SPIM::TriggerMode> GetTriggerModes() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return triggerModes_;
   }
   long GetRequestedImages() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return requestedImages_;
   }
   int GetStopCount() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return stopCount_;
   }

private:
   mutable std::mutex mutex_;
   std::deque<SPIM::ImageFrame> buffer_;
   bool capturing_ = false;
   bool overflowed_ = false;
   long requestedImages_ = 0;
   long sequenceNumber_ = 0;
   int stopCount_ = 0;
   std::vector<SPIM::TriggerMode> triggerModes_;
};
