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

#ifndef SEAT_TRANSFER__STORAGE__MEMORYRIDECAPACITYLEDGER_HPP
#define SEAT_TRANSFER__STORAGE__MEMORYRIDECAPACITYLEDGER_HPP

#include <seat_transfer/storage/RideCapacityLedger.hpp>
#include <rmf_utils/impl_ptr.hpp>

#include <vector>

namespace seat_transfer {
namespace storage {

//==============================================================================
/// A thread-safe, in-process implementation of RideCapacityLedger.
class MemoryRideCapacityLedger : public RideCapacityLedger
{
public:

  /// Constructor
  MemoryRideCapacityLedger();

  /// Post a new ride with all of its seats available.
  ///
  /// \param[in] driver
  ///   The driver who is posting the ride.
  ///
  /// \param[in] total_seats
  ///   The seat capacity of the ride.
  ///
  /// \throws std::invalid_argument if total_seats is zero.
  Ride add_ride(DriverId driver, SeatCount total_seats);

  /// Retire a ride. It keeps its seat counts but accepts no new reservations.
  ///
  /// \return false if the ride is unknown.
  bool retire(RideId ride);

  /// Get a snapshot of every ride, ordered by id.
  std::vector<Ride> rides() const;

  // Documentation inherited
  std::optional<Ride> get(RideId ride) const final;

  // Documentation inherited
  CapacityChange reserve(RideId ride, SeatCount seats) final;

  // Documentation inherited
  CapacityChange release(RideId ride, SeatCount seats) final;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace storage
} // namespace seat_transfer

#endif // SEAT_TRANSFER__STORAGE__MEMORYRIDECAPACITYLEDGER_HPP
