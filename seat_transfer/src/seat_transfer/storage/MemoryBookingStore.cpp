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

#include <seat_transfer/storage/MemoryBookingStore.hpp>

#include <map>
#include <mutex>

namespace seat_transfer {
namespace storage {

//==============================================================================
const char* to_string(const StatusChange change)
{
  switch (change)
  {
    case StatusChange::Applied: return "applied";
    case StatusChange::Mismatch: return "status mismatch";
    case StatusChange::UnknownBooking: return "unknown booking";
    case StatusChange::Unavailable: return "storage unavailable";
  }

  return "unknown";
}

//==============================================================================
class MemoryBookingStore::Implementation
{
public:

  template<typename Predicate>
  std::vector<Booking> collect(Predicate&& pred) const
  {
    std::vector<Booking> output;
    for (const auto& [id, booking] : bookings)
    {
      if (pred(booking))
        output.push_back(booking);
    }

    return output;
  }

  mutable std::mutex mutex;

  // Ordered so that queries come back in creation order
  std::map<BookingId, Booking> bookings;
  BookingId next_id = 1;
};

//==============================================================================
MemoryBookingStore::MemoryBookingStore()
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
std::optional<Booking> MemoryBookingStore::get(const BookingId booking) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->bookings.find(booking);
  if (it == _pimpl->bookings.end())
    return std::nullopt;

  return it->second;
}

//==============================================================================
std::optional<Booking> MemoryBookingStore::create(Booking::Draft draft)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const BookingId id = _pimpl->next_id++;
  return _pimpl->bookings.insert(
    {id, Booking::make(id, std::move(draft))}).first->second;
}

//==============================================================================
StatusChange MemoryBookingStore::compare_and_set_status(
  const BookingId booking,
  const BookingStatus expected,
  const BookingStatus desired)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->bookings.find(booking);
  if (it == _pimpl->bookings.end())
    return StatusChange::UnknownBooking;

  if (it->second.status() != expected)
    return StatusChange::Mismatch;

  it->second = it->second.with_status(desired);
  return StatusChange::Applied;
}

//==============================================================================
std::vector<Booking> MemoryBookingStore::bookings_for_ride(
  const RideId ride) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->collect(
    [ride](const Booking& b) { return b.ride() == ride; });
}

//==============================================================================
std::vector<Booking> MemoryBookingStore::bookings_for_passenger(
  const PassengerId passenger) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->collect(
    [passenger](const Booking& b) { return b.passenger() == passenger; });
}

//==============================================================================
std::size_t MemoryBookingStore::size() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->bookings.size();
}

} // namespace storage
} // namespace seat_transfer
