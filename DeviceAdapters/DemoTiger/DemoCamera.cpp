///////////////////////////////////////////////////////////////////////////////
// FILE:          DemoCamera.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Synthetic camera triggered by the demo controller
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

#include "DemoTiger.h"

#include <algorithm>
#include <cstdint>
#include <utility>

DemoCamera::DemoCamera(const std::string& label,
      const std::vector<std::string>& physicalLabels,
      std::size_t bufferCapacity, spim::logging::Logger logger) :
   label_(label),
   physicalLabels_(physicalLabels),
   logger_(logger),
   minExposureMs_(1.0),
   width_(64),
   height_(32),
   buffer_(bufferCapacity),
   triggerMode_(SPIM::InternalTrigger),
   capturing_(false),
   overflowed_(false),
   imagesRemaining_(0),
   sequenceNumbers_(physicalLabels.empty() ? 1 : physicalLabels.size(), 0),
   elapsedUs_(0.0)
{
}

std::string DemoCamera::GetLabel() const
{
   return label_;
}

bool DemoCamera::IsComposite() const
{
   return !physicalLabels_.empty();
}

unsigned DemoCamera::GetNumberOfPhysicalCameras() const
{
   return IsComposite() ? static_cast<unsigned>(physicalLabels_.size()) : 1;
}

int DemoCamera::GetPhysicalCameraLabel(unsigned index, std::string& label) const
{
   if (index >= GetNumberOfPhysicalCameras())
      return DEVICE_INVALID_INPUT_PARAM;
   label = IsComposite() ? physicalLabels_[index] : label_;
   return DEVICE_OK;
}

int DemoCamera::SetTriggerMode(SPIM::TriggerMode mode)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (capturing_)
      return DEVICE_CAMERA_BUSY_ACQUIRING;
   triggerMode_ = mode;
   return DEVICE_OK;
}

void DemoCamera::SetImageSize(unsigned width, unsigned height)
{
   std::lock_guard<std::mutex> lock(mutex_);
   width_ = width;
   height_ = height;
}

int DemoCamera::StartSequenceAcquisition(long numImages)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (capturing_)
      return DEVICE_CAMERA_BUSY_ACQUIRING;
   if (numImages < 1)
      return DEVICE_INVALID_INPUT_PARAM;

   buffer_.clear();
   overflowed_ = false;
   imagesRemaining_ = numImages;
   std::fill(sequenceNumbers_.begin(), sequenceNumbers_.end(), 0);
   elapsedUs_ = 0.0;
   capturing_ = true;
   LOG_DEBUG(logger_) << label_ << ": sequence of " << numImages <<
      " image(s) per camera started";
   return DEVICE_OK;
}

int DemoCamera::StopSequenceAcquisition()
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (capturing_)
      LOG_DEBUG(logger_) << label_ << ": sequence stopped";
   capturing_ = false;
   imagesRemaining_ = 0;
   return DEVICE_OK;
}

bool DemoCamera::IsCapturing()
{
   std::lock_guard<std::mutex> lock(mutex_);
   return capturing_;
}

bool DemoCamera::IsBufferOverflowed()
{
   std::lock_guard<std::mutex> lock(mutex_);
   return overflowed_;
}

long DemoCamera::GetRemainingImageCount()
{
   std::lock_guard<std::mutex> lock(mutex_);
   return static_cast<long>(buffer_.size());
}

int DemoCamera::PopNextImage(SPIM::ImageFrame& frame)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (buffer_.empty())
      return DEVICE_BUFFER_EMPTY;
   frame = std::move(buffer_.front());
   buffer_.pop_front();
   return DEVICE_OK;
}

void DemoCamera::TriggerVolume(long numSlices, double slicePeriodMs)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (!capturing_ || triggerMode_ != SPIM::ExternalEdgeTrigger)
   {
      LOG_DEBUG(logger_) << label_ << ": ignoring trigger (not armed)";
      return;
   }

   for (long slice = 0; slice < numSlices && imagesRemaining_ > 0; ++slice)
   {
      for (unsigned cam = 0; cam < sequenceNumbers_.size(); ++cam)
         GenerateFrame(cam, elapsedUs_);
      elapsedUs_ += slicePeriodMs * 1000.0;
      --imagesRemaining_;
   }

   if (imagesRemaining_ == 0)
   {
      capturing_ = false;
      LOG_DEBUG(logger_) << label_ << ": sequence complete";
   }
}

// Caller holds mutex_
void DemoCamera::GenerateFrame(unsigned cameraIndex, double timestampUs)
{
   const long seqNum = sequenceNumbers_[cameraIndex]++;

   SPIM::ImageFrame frame;
   frame.width = width_;
   frame.height = height_;
   frame.bytesPerPixel = 2;
   frame.pixels.resize(static_cast<std::size_t>(width_) * height_ * 2);
   for (unsigned y = 0; y < height_; ++y)
   {
      for (unsigned x = 0; x < width_; ++x)
      {
         const std::uint16_t value = static_cast<std::uint16_t>(
               (x + y) * 64 + seqNum * 16 + cameraIndex * 1024);
         const std::size_t offset = (static_cast<std::size_t>(y) * width_ + x) * 2;
         frame.pixels[offset] = static_cast<unsigned char>(value & 0xff);
         frame.pixels[offset + 1] = static_cast<unsigned char>(value >> 8);
      }
   }

   const std::string& label = IsComposite() ?
      physicalLabels_[cameraIndex] : label_;
   frame.metadata.AddTag(SPIM::g_Keyword_Metadata::CameraLabel, label);
   frame.metadata.AddTag(SPIM::g_Keyword_Metadata::HardwareSequenceNumber,
         seqNum);
   frame.metadata.AddTag(SPIM::g_Keyword_Metadata::HardwareTimestampUs,
         static_cast<long long>(timestampUs));
   frame.metadata.AddTag(SPIM::g_Keyword_Metadata::Width, width_);
   frame.metadata.AddTag(SPIM::g_Keyword_Metadata::Height, height_);

   if (buffer_.full())
   {
      if (!overflowed_)
         LOG_ERROR(logger_) << label_ << ": sequence buffer overflowed";
      overflowed_ = true;
      return;
   }
   buffer_.push_back(std::move(frame));
}
