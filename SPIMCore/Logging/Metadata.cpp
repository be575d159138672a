// COPYRIGHT:     University of California, San Francisco, 2014,
//                All Rights reserved
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//
// AUTHOR:        Mark Tsuchida

#include "Metadata.h"

#include <mutex>
#include <set>


namespace spim
{
namespace logging
{

const char*
LoggerData::InternString(const std::string& s)
{
   static std::mutex mutex;
   static std::set<std::string> strings;

   std::lock_guard<std::mutex> lock(mutex);
   std::set<std::string>::const_iterator it = strings.insert(s).first;
   return it->c_str();
}

} // namespace logging
} // namespace spim
