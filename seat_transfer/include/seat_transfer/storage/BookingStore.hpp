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

#ifndef SEAT_TRANSFER__STORAGE__BOOKINGSTORE_HPP
#define SEAT_TRANSFER__STORAGE__BOOKINGSTORE_HPP

#include <seat_transfer/Booking.hpp>

#include <optional>
#include <vector>

namespace seat_transfer {
namespace storage {

//==============================================================================
/// The outcome of a conditional status update
enum class StatusChange : uint8_t
{
  /// The booking had the expected status and now has the desired one
  Applied,

  /// The booking did not have the expected status. Nothing changed.
  Mismatch,

  /// The booking does not exist
  UnknownBooking,

  /// The storage could not be written. Nothing changed.
  Unavailable
};

//==============================================================================
const char* to_string(StatusChange change);

//==============================================================================
/// A pure abstract interface for booking storage. Bookings are never deleted;
/// cancelled bookings remain readable as an audit trail.
class BookingStore
{
public:

  /// Read a snapshot of a booking.
  ///
  /// \return std::nullopt if the booking is unknown.
  virtual std::optional<Booking> get(BookingId booking) const = 0;

  /// Store a new booking and assign it an id.
  ///
  /// \return the stored booking, or std::nullopt if the storage could not be
  /// written.
  virtual std::optional<Booking> create(Booking::Draft draft) = 0;

  /// Change the status of a booking to `desired`, but only if its current
  /// status is `expected`. The check and the write happen as one step.
  virtual StatusChange compare_and_set_status(
    BookingId booking,
    BookingStatus expected,
    BookingStatus desired) = 0;

  /// Get every booking that references a ride, in any status.
  virtual std::vector<Booking> bookings_for_ride(RideId ride) const = 0;

  /// Get every booking held by a passenger, in any status.
  virtual std::vector<Booking> bookings_for_passenger(
    PassengerId passenger) const = 0;

  virtual ~BookingStore() = default;
};

} // namespace storage
} // namespace seat_transfer

#endif // SEAT_TRANSFER__STORAGE__BOOKINGSTORE_HPP
