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

#include <seat_transfer/storage/MemoryRideCapacityLedger.hpp>

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace seat_transfer {
namespace storage {

//==============================================================================
const char* to_string(const CapacityChange change)
{
  switch (change)
  {
    case CapacityChange::Applied: return "applied";
    case CapacityChange::InsufficientSeats: return "insufficient seats";
    case CapacityChange::ExceedsTotal: return "exceeds total seats";
    case CapacityChange::Retired: return "ride retired";
    case CapacityChange::UnknownRide: return "unknown ride";
    case CapacityChange::Unavailable: return "storage unavailable";
  }

  return "unknown";
}

//==============================================================================
class MemoryRideCapacityLedger::Implementation
{
public:

  struct Entry
  {
    DriverId driver;
    SeatCount total_seats;
    SeatCount available_seats;
    bool active;
  };

  Ride snapshot(RideId id, const Entry& entry) const
  {
    return Ride::make(
      id, entry.driver, entry.total_seats, entry.available_seats, entry.active);
  }

  mutable std::mutex mutex;
  std::map<RideId, Entry> rides;
  RideId next_id = 1;
};

//==============================================================================
MemoryRideCapacityLedger::MemoryRideCapacityLedger()
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
Ride MemoryRideCapacityLedger::add_ride(
  const DriverId driver,
  const SeatCount total_seats)
{
  if (total_seats == 0)
  {
    throw std::invalid_argument(
      "[MemoryRideCapacityLedger::add_ride] A ride posted by driver ["
      + std::to_string(driver) + "] must have at least one seat");
  }

  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const RideId id = _pimpl->next_id++;
  const auto& entry = _pimpl->rides.insert(
    {id, Implementation::Entry{driver, total_seats, total_seats, true}})
    .first->second;

  return _pimpl->snapshot(id, entry);
}

//==============================================================================
bool MemoryRideCapacityLedger::retire(const RideId ride)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->rides.find(ride);
  if (it == _pimpl->rides.end())
    return false;

  it->second.active = false;
  return true;
}

//==============================================================================
std::vector<Ride> MemoryRideCapacityLedger::rides() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  std::vector<Ride> output;
  output.reserve(_pimpl->rides.size());
  for (const auto& [id, entry] : _pimpl->rides)
    output.push_back(_pimpl->snapshot(id, entry));

  return output;
}

//==============================================================================
std::optional<Ride> MemoryRideCapacityLedger::get(const RideId ride) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->rides.find(ride);
  if (it == _pimpl->rides.end())
    return std::nullopt;

  return _pimpl->snapshot(it->first, it->second);
}

//==============================================================================
CapacityChange MemoryRideCapacityLedger::reserve(
  const RideId ride,
  const SeatCount seats)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->rides.find(ride);
  if (it == _pimpl->rides.end())
    return CapacityChange::UnknownRide;

  auto& entry = it->second;
  if (!entry.active)
    return CapacityChange::Retired;

  if (entry.available_seats < seats)
    return CapacityChange::InsufficientSeats;

  entry.available_seats -= seats;
  return CapacityChange::Applied;
}

//==============================================================================
CapacityChange MemoryRideCapacityLedger::release(
  const RideId ride,
  const SeatCount seats)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->rides.find(ride);
  if (it == _pimpl->rides.end())
    return CapacityChange::UnknownRide;

  auto& entry = it->second;
  if (seats > entry.total_seats - entry.available_seats)
    return CapacityChange::ExceedsTotal;

  entry.available_seats += seats;
  return CapacityChange::Applied;
}

} // namespace storage
} // namespace seat_transfer
