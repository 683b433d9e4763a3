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

#ifndef SEAT_TRANSFER__STORAGE__RIDECAPACITYLEDGER_HPP
#define SEAT_TRANSFER__STORAGE__RIDECAPACITYLEDGER_HPP

#include <seat_transfer/Ride.hpp>

#include <optional>

namespace seat_transfer {
namespace storage {

//==============================================================================
/// The outcome of an attempt to change the available seats of a ride
enum class CapacityChange : uint8_t
{
  /// The change was applied
  Applied,

  /// A reservation asked for more seats than are available. Nothing changed.
  InsufficientSeats,

  /// A release would push the available seats above the ride's total.
  /// Nothing changed.
  ExceedsTotal,

  /// The ride has been retired and accepts no new reservations
  Retired,

  /// The ride does not exist
  UnknownRide,

  /// The storage could not be written. Nothing changed.
  Unavailable
};

//==============================================================================
const char* to_string(CapacityChange change);

//==============================================================================
/// A pure abstract interface for the per-ride seat counters. Every operation
/// must be atomic against the ledger. Implementations are not expected to
/// offer transactions that span more than one call.
class RideCapacityLedger
{
public:

  /// Read a snapshot of a ride.
  ///
  /// \return std::nullopt if the ride is unknown.
  virtual std::optional<Ride> get(RideId ride) const = 0;

  /// Decrement the available seats of a ride by `seats`, but only if at least
  /// that many seats are available and the ride is still active. The check and
  /// the decrement happen as one step.
  virtual CapacityChange reserve(RideId ride, SeatCount seats) = 0;

  /// Increment the available seats of a ride by `seats`, unless that would
  /// exceed the ride's total seats. Retired rides still accept releases.
  virtual CapacityChange release(RideId ride, SeatCount seats) = 0;

  virtual ~RideCapacityLedger() = default;
};

} // namespace storage
} // namespace seat_transfer

#endif // SEAT_TRANSFER__STORAGE__RIDECAPACITYLEDGER_HPP
