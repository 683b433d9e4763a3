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

#ifndef SEAT_TRANSFER__BOOKING_HPP
#define SEAT_TRANSFER__BOOKING_HPP

#include <seat_transfer/Time.hpp>
#include <rmf_utils/impl_ptr.hpp>

#include <string>

namespace seat_transfer {

//==============================================================================
enum class BookingStatus : uint8_t
{
  Pending,
  Confirmed,
  Cancelled
};

//==============================================================================
const char* to_string(BookingStatus status);

//==============================================================================
/// \brief A passenger's reservation of seats on exactly one ride.
///
/// A booking is never moved between rides. A transfer creates a new booking on
/// the target ride and cancels the original one, which stays in the store as
/// an audit record.
class Booking
{
public:

  /// The fields of a booking that has not been given an id yet.
  struct Draft
  {
    PassengerId passenger;
    RideId ride;
    SeatCount seats;
    double total_price;
    BookingStatus status;
    std::string notes;
  };

  BookingId id() const;

  PassengerId passenger() const;

  RideId ride() const;

  SeatCount seats() const;

  double total_price() const;

  BookingStatus status() const;

  /// Free-form notes left by the passenger
  const std::string& notes() const;

  /// Returns true if the booking is confirmed and therefore holds capacity on
  /// its ride.
  bool holds_capacity() const;

  ///===========================================================================
  /// \brief Create a booking from a draft.
  static Booking make(BookingId id, Draft draft);

  ///===========================================================================
  /// \brief Get a copy of this booking with a different status.
  Booking with_status(BookingStatus status) const;

  class Implementation;
private:
  Booking();
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__BOOKING_HPP
