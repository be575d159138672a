///////////////////////////////////////////////////////////////////////////////
// FILE:          RawFileSink.h
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

#pragma once

#include "ImageSink.h"
#include "Logging/Logger.h"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <deque>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace spim
{

/**
 * Writes each physical camera's frames, back to back, to
 * "<base>_<camera>.raw", and describes them in "<base>_<camera>.json"
 * (event coordinates, byte offset, hardware sequence number and timestamp).
 *
 * Disk writes happen on a writer thread; FrameReady() only copies the frame
 * into a queue. The index files are written by SequenceEnded(), after the
 * queue has been flushed.
 */
class RawFileSink : public ImageSink
{
   struct PendingFrame
   {
      SPIM::ImageFrame image;
      AcquisitionEvent event;
      SPIM::FrameMetadata metadata;
   };

   struct CameraFile
   {
      std::string rawPath;
      std::string indexPath;
      std::ofstream stream;
      unsigned long long bytesWritten = 0;
      nlohmann::json frames = nlohmann::json::array();
   };

   std::string basePath_;
   logging::Logger logger_;
   RunMetadata runMetadata_;

   // Owned by the writer thread while it runs
   std::map<std::string, std::unique_ptr<CameraFile>> files_;

   std::thread writerThread_;
   std::mutex mutex_;
   std::condition_variable cv_;
   std::deque<PendingFrame> queue_;
   bool stopRequested_;
   bool writerFailed_;
   std::string writerError_;

public:
   RawFileSink(const std::string& basePath, logging::Logger logger);
   ~RawFileSink();

   virtual void SequenceStarted(const RunMetadata& metadata);
   virtual void FrameReady(const SPIM::ImageFrame& image,
         const AcquisitionEvent& event,
         const SPIM::FrameMetadata& frameMetadata);
   virtual void SequenceEnded(const RunResult& result);

   std::string GetRawFilePath(const std::string& cameraLabel) const;
   std::string GetIndexFilePath(const std::string& cameraLabel) const;

private:
   void WriterLoop();
   void WriteFrame(const PendingFrame& frame);
   CameraFile& OpenCameraFile(const std::string& cameraLabel);
   void StopWriter();
   void WriteIndexFiles(const RunResult& result);
};

} // namespace spim
