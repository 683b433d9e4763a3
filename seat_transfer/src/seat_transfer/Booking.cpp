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

#include <seat_transfer/Booking.hpp>

namespace seat_transfer {

//==============================================================================
const char* to_string(const BookingStatus status)
{
  switch (status)
  {
    case BookingStatus::Pending: return "pending";
    case BookingStatus::Confirmed: return "confirmed";
    case BookingStatus::Cancelled: return "cancelled";
  }

  return "unknown";
}

//==============================================================================
class Booking::Implementation
{
public:
  BookingId _id;
  Draft _draft;
};

//==============================================================================
BookingId Booking::id() const
{
  return _pimpl->_id;
}

//==============================================================================
PassengerId Booking::passenger() const
{
  return _pimpl->_draft.passenger;
}

//==============================================================================
RideId Booking::ride() const
{
  return _pimpl->_draft.ride;
}

//==============================================================================
SeatCount Booking::seats() const
{
  return _pimpl->_draft.seats;
}

//==============================================================================
double Booking::total_price() const
{
  return _pimpl->_draft.total_price;
}

//==============================================================================
BookingStatus Booking::status() const
{
  return _pimpl->_draft.status;
}

//==============================================================================
const std::string& Booking::notes() const
{
  return _pimpl->_draft.notes;
}

//==============================================================================
bool Booking::holds_capacity() const
{
  return _pimpl->_draft.status == BookingStatus::Confirmed;
}

//==============================================================================
Booking Booking::make(BookingId id, Draft draft)
{
  Booking booking;
  booking._pimpl->_id = id;
  booking._pimpl->_draft = std::move(draft);
  return booking;
}

//==============================================================================
Booking Booking::with_status(BookingStatus status) const
{
  Booking copy(*this);
  copy._pimpl->_draft.status = status;
  return copy;
}

//==============================================================================
Booking::Booking()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

} // namespace seat_transfer
