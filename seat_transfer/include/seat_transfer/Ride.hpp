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

#ifndef SEAT_TRANSFER__RIDE_HPP
#define SEAT_TRANSFER__RIDE_HPP

#include <seat_transfer/Time.hpp>
#include <rmf_utils/impl_ptr.hpp>

namespace seat_transfer {

//==============================================================================
/// \brief A snapshot of a driver-posted ride and its seat capacity. Snapshots
/// are produced by a RideCapacityLedger and do not change when the ledger
/// does.
class Ride
{
public:

  ///===========================================================================
  /// \brief The unique identifier of the ride.
  RideId id() const;

  ///===========================================================================
  /// \brief The driver who posted the ride.
  DriverId driver() const;

  ///===========================================================================
  /// \brief The seat capacity of the ride. This is fixed at creation.
  SeatCount total_seats() const;

  ///===========================================================================
  /// \brief The number of seats that are not held by a confirmed booking.
  /// This is always in the range [0, total_seats()].
  SeatCount available_seats() const;

  ///===========================================================================
  /// \brief The number of seats held by confirmed bookings.
  SeatCount occupied_seats() const;

  ///===========================================================================
  /// \brief Returns false once the ride has been retired. A retired ride
  /// accepts no new reservations but is never deleted.
  bool active() const;

  ///===========================================================================
  /// \brief Creates a ride snapshot.
  /// \param[in] id The ride id.
  /// \param[in] driver The driver who posted the ride.
  /// \param[in] total_seats The seat capacity. Must be greater than zero.
  /// \param[in] available_seats The currently available seats. Must not
  ///   exceed total_seats.
  /// \param[in] active Whether the ride still accepts reservations.
  /// \throws std::invalid_argument if the seat counts are inconsistent.
  static Ride make(
    RideId id,
    DriverId driver,
    SeatCount total_seats,
    SeatCount available_seats,
    bool active = true);

  class Implementation;
private:
  Ride();
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__RIDE_HPP
