///////////////////////////////////////////////////////////////////////////////
// FILE:          FrameMetadata.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMDevice - Device kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Per-frame metadata attached by camera devices.
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

#include "SPIMDeviceConstants.h"

#include <cassert>
#include <map>
#include <sstream>
#include <string>

namespace SPIM {

/**
 * @brief Tag map carried by every frame from the camera to the core.
 *
 * The core treats the tags as opaque pass-through data. It only reads the
 * camera label to route the frame; the hardware sequence number and
 * timestamp are forwarded to the image sink unmodified.
 */
class FrameMetadata {
public:
   /**
    * @brief Add a tag.
    *
    * The key must not contain newlines. The value should be a string,
    * integer, or floating point number. If a tag with the same key is added
    * more than once, the last value wins.
    *
    * @param key the key (must not be null)
    * @param value the value
    */
   template <typename V>
   void AddTag(const char* key, V value) {
      assert(key != nullptr);
      std::ostringstream strm;
      strm << value;
      tags_[key] = strm.str();
   }

   /** @brief Optimized overload for string values. */
   void AddTag(const char* key, const char* value) {
      assert(key != nullptr);
      assert(value != nullptr);
      tags_[key] = value;
   }

   /** @brief Overload for std::string key. */
   template <typename V>
   void AddTag(const std::string& key, V value) {
      AddTag(key.c_str(), value);
   }

   bool HasTag(const std::string& key) const {
      return tags_.find(key) != tags_.end();
   }

   /**
    * @brief Return the value of a tag, or an empty string if absent.
    */
   std::string GetTag(const std::string& key) const {
      auto it = tags_.find(key);
      if (it == tags_.end())
         return std::string();
      return it->second;
   }

   const std::map<std::string, std::string>& GetTags() const { return tags_; }

   void Clear() { tags_.clear(); }

   // Accessors for the standard keys
   std::string GetCameraLabel() const {
      return GetTag(g_Keyword_Metadata::CameraLabel);
   }
   std::string GetHardwareSequenceNumber() const {
      return GetTag(g_Keyword_Metadata::HardwareSequenceNumber);
   }
   std::string GetHardwareTimestamp() const {
      return GetTag(g_Keyword_Metadata::HardwareTimestampUs);
   }

   bool operator==(const FrameMetadata& other) const {
      return tags_ == other.tags_;
   }
   bool operator!=(const FrameMetadata& other) const {
      return !(*this == other);
   }

private:
   std::map<std::string, std::string> tags_;
};

} // namespace SPIM
