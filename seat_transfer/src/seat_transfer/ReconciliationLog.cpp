/*
 * Copyright (C) 2022 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#include <seat_transfer/ReconciliationLog.hpp>

#include <iostream>
#include <mutex>

namespace seat_transfer {

//==============================================================================
const char* to_string(const ReconciliationLog::Kind kind)
{
  using Kind = ReconciliationLog::Kind;
  switch (kind)
  {
    case Kind::OrphanedOriginalBooking: return "orphaned original booking";
    case Kind::CompensationFailed: return "compensation failed";
    case Kind::ReleaseFailed: return "release failed";
  }

  return "unknown";
}

//==============================================================================
class ReconciliationLog::Implementation
{
public:
  mutable std::mutex mutex;
  std::vector<Entry> entries;
};

//==============================================================================
ReconciliationLog::ReconciliationLog()
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
void ReconciliationLog::record(Entry entry)
{
  // TODO(seat_transfer): Allow users to route these into their own logger
  // instead of only printing them to the terminal.
  std::cerr << "[ReconciliationLog::record] " << to_string(entry.kind);
  if (entry.request.has_value())
    std::cerr << " | transfer request [" << *entry.request << "]";

  if (entry.booking.has_value())
    std::cerr << " | booking [" << *entry.booking << "]";

  if (entry.ride.has_value())
    std::cerr << " | ride [" << *entry.ride << "]";

  std::cerr << " | seats [" << entry.seats << "]: "
            << entry.description << std::endl;

  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->entries.push_back(std::move(entry));
}

//==============================================================================
auto ReconciliationLog::entries() const -> std::vector<Entry>
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->entries;
}

//==============================================================================
std::size_t ReconciliationLog::size() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->entries.size();
}

//==============================================================================
bool ReconciliationLog::empty() const
{
  return size() == 0;
}

} // namespace seat_transfer
