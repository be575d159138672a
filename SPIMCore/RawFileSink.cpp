///////////////////////////////////////////////////////////////////////////////
// FILE:          RawFileSink.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Image sink writing one raw pixel file and one JSON index per camera.
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

#include "RawFileSink.h"

#include "CoreUtils.h"
#include "Error.h"

#include <utility>

namespace spim
{

namespace
{

// Camera labels end up in file names
std::string
FileNameComponent(const std::string& label)
{
   std::string s = label;
   for (char& c : s)
   {
      if (c == '/' || c == '\\' || c == ':' || c == ' ')
         c = '_';
   }
   return s;
}

nlohmann::json
PlanToJson(const AcquisitionPlan& plan)
{
   nlohmann::json j;
   j["numTimePoints"] = plan.numTimePoints;
   j["numSlices"] = plan.numSlices;
   j["sliceStepUm"] = plan.sliceStepUm;
   j["exposureMs"] = plan.exposureMs;
   j["topology"] = TriggerTopologyName(plan.topology);
   if (plan.hasInterval)
      j["intervalMs"] = plan.intervalMs;
   else
      j["intervalMs"] = nullptr;
   nlohmann::json channels = nlohmann::json::array();
   for (const Channel& ch : plan.channels)
   {
      nlohmann::json c;
      c["name"] = ch.name;
      c["laserLine"] = ch.laserLine;
      c["cameraIndex"] = ch.cameraIndex;
      channels.push_back(c);
   }
   j["channels"] = channels;
   return j;
}

} // anonymous namespace


RawFileSink::RawFileSink(const std::string& basePath, logging::Logger logger) :
   basePath_(basePath),
   logger_(logger),
   stopRequested_(false),
   writerFailed_(false)
{}


RawFileSink::~RawFileSink()
{
   StopWriter();
}


std::string
RawFileSink::GetRawFilePath(const std::string& cameraLabel) const
{
   return basePath_ + "_" + FileNameComponent(cameraLabel) + ".raw";
}


std::string
RawFileSink::GetIndexFilePath(const std::string& cameraLabel) const
{
   return basePath_ + "_" + FileNameComponent(cameraLabel) + ".json";
}


void
RawFileSink::SequenceStarted(const RunMetadata& metadata)
{
   StopWriter();

   runMetadata_ = metadata;
   files_.clear();
   for (const std::string& label : metadata.cameraLabels)
      OpenCameraFile(label);

   {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.clear();
      stopRequested_ = false;
      writerFailed_ = false;
      writerError_.clear();
   }
   writerThread_ = std::thread(&RawFileSink::WriterLoop, this);

   LOG_INFO(logger_) << "Writing run " << metadata.runId << " to " <<
      basePath_ << "_*.raw (" << metadata.cameraLabels.size() << " camera(s))";
}


void
RawFileSink::FrameReady(const SPIM::ImageFrame& image,
      const AcquisitionEvent& event, const SPIM::FrameMetadata& frameMetadata)
{
   PendingFrame pending;
   pending.image = image;
   pending.event = event;
   pending.metadata = frameMetadata;

   {
      std::lock_guard<std::mutex> lock(mutex_);
      if (writerFailed_)
         throw SPIMError("Raw file writer failed: " + writerError_, SPIMERR_SINK);
      queue_.push_back(std::move(pending));
   }
   cv_.notify_one();
}


void
RawFileSink::SequenceEnded(const RunResult& result)
{
   StopWriter();

   std::string error;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      if (writerFailed_)
         error = writerError_;
   }

   WriteIndexFiles(result);
   for (auto& entry : files_)
      entry.second->stream.close();

   LOG_INFO(logger_) << "Run " << runMetadata_.runId << " ended (" <<
      RunStateName(result.state) << ", " << result.completedEvents <<
      " frame(s))";

   if (!error.empty())
      throw SPIMError("Raw file writer failed: " + error, SPIMERR_FILE_WRITE_FAILED);
}


void
RawFileSink::StopWriter()
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      stopRequested_ = true;
   }
   cv_.notify_one();
   if (writerThread_.joinable())
      writerThread_.join();
}


void
RawFileSink::WriterLoop()
{
   for (;;)
   {
      PendingFrame frame;
      {
         std::unique_lock<std::mutex> lock(mutex_);
         cv_.wait(lock, [this] { return stopRequested_ || !queue_.empty(); });
         if (queue_.empty())
            return; // stop requested and queue flushed
         frame = std::move(queue_.front());
         queue_.pop_front();
         if (writerFailed_)
            continue;
      }

      try
      {
         WriteFrame(frame);
      }
      catch (const SPIMError& e)
      {
         LOG_ERROR(logger_) << e.getFullMsg();
         std::lock_guard<std::mutex> lock(mutex_);
         writerFailed_ = true;
         writerError_ = e.getMsg();
      }
   }
}


RawFileSink::CameraFile&
RawFileSink::OpenCameraFile(const std::string& cameraLabel)
{
   auto it = files_.find(cameraLabel);
   if (it != files_.end())
      return *it->second;

   std::unique_ptr<CameraFile> file(new CameraFile);
   file->rawPath = GetRawFilePath(cameraLabel);
   file->indexPath = GetIndexFilePath(cameraLabel);
   file->stream.open(file->rawPath.c_str(),
         std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
   if (!file->stream)
   {
      throw SPIMError("Cannot open " + ToQuotedString(file->rawPath) +
            " for writing", SPIMERR_FILE_OPEN_FAILED);
   }
   CameraFile& ref = *file;
   files_.insert(std::make_pair(cameraLabel, std::move(file)));
   return ref;
}


void
RawFileSink::WriteFrame(const PendingFrame& frame)
{
   CameraFile& file = OpenCameraFile(frame.event.cameraLabel);

   const unsigned long long offset = file.bytesWritten;
   const std::vector<unsigned char>& pixels = frame.image.pixels;
   file.stream.write(reinterpret_cast<const char*>(pixels.data()),
         static_cast<std::streamsize>(pixels.size()));
   if (!file.stream)
   {
      throw SPIMError("Write to " + ToQuotedString(file.rawPath) + " failed",
            SPIMERR_FILE_WRITE_FAILED);
   }
   file.bytesWritten += pixels.size();

   nlohmann::json entry;
   entry["timePoint"] = frame.event.timePoint;
   entry["slice"] = frame.event.sliceIndex;
   entry["channel"] = frame.event.channel;
   entry["zOffsetUm"] = frame.event.zOffsetUm;
   entry["offset"] = offset;
   entry["size"] = pixels.size();
   entry["width"] = frame.image.width;
   entry["height"] = frame.image.height;
   entry["bytesPerPixel"] = frame.image.bytesPerPixel;
   entry["hardwareSequenceNumber"] = frame.metadata.GetHardwareSequenceNumber();
   entry["hardwareTimestampUs"] = frame.metadata.GetHardwareTimestamp();
   file.frames.push_back(entry);
}


void
RawFileSink::WriteIndexFiles(const RunResult& result)
{
   const nlohmann::json plan = PlanToJson(runMetadata_.plan);

   for (auto& entry : files_)
   {
      CameraFile& file = *entry.second;
      nlohmann::json index;
      index["camera"] = entry.first;
      index["runId"] = runMetadata_.runId;
      index["rawFile"] = file.rawPath;
      index["status"] = RunStateName(result.state);
      index["completedEvents"] = result.completedEvents;
      index["expectedEvents"] = result.expectedEvents;
      if (!result.errorMessage.empty())
         index["error"] = result.errorMessage;
      index["plan"] = plan;
      index["frames"] = file.frames;

      // Labels and channel names are not guaranteed to be valid UTF-8
      std::string text;
      try
      {
         text = index.dump(2, ' ', false,
               nlohmann::json::error_handler_t::replace);
      }
      catch (const nlohmann::json::exception& e)
      {
         throw SPIMError("Cannot serialize index " +
               ToQuotedString(file.indexPath) + ": " + e.what(),
               SPIMERR_FILE_WRITE_FAILED);
      }

      std::ofstream out(file.indexPath.c_str(),
            std::ios_base::out | std::ios_base::trunc);
      if (!out)
      {
         LOG_ERROR(logger_) << "Cannot write index " << file.indexPath;
         throw SPIMError("Cannot open " + ToQuotedString(file.indexPath) +
               " for writing", SPIMERR_FILE_OPEN_FAILED);
      }
      out << text << '\n';
      if (!out)
      {
         throw SPIMError("Cannot write " + ToQuotedString(file.indexPath),
               SPIMERR_FILE_WRITE_FAILED);
      }
   }
}

} // namespace spim
