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

#ifndef SEAT_TRANSFER__BOOKINGSERVICE_HPP
#define SEAT_TRANSFER__BOOKINGSERVICE_HPP

#include <seat_transfer/ReconciliationLog.hpp>
#include <seat_transfer/Result.hpp>
#include <seat_transfer/storage/BookingStore.hpp>
#include <seat_transfer/storage/RideCapacityLedger.hpp>

#include <memory>

namespace seat_transfer {

//==============================================================================
/// \brief Creates, confirms and cancels ordinary bookings while keeping the
/// capacity ledger and the booking store consistent with each other.
///
/// A confirmed booking always holds its seats in the ledger. Pending and
/// cancelled bookings hold none.
class BookingService
{
public:

  /// Constructor
  ///
  /// \param[in] bookings
  ///   Where bookings are stored.
  ///
  /// \param[in] rides
  ///   The seat counters of every ride.
  ///
  /// \param[in] reconciliation
  ///   Where to record inconsistencies that could not be repaired. A log is
  ///   created if this is nullptr.
  BookingService(
    std::shared_ptr<storage::BookingStore> bookings,
    std::shared_ptr<storage::RideCapacityLedger> rides,
    std::shared_ptr<ReconciliationLog> reconciliation = nullptr);

  ///===========================================================================
  /// \brief Book seats on a ride and confirm them immediately.
  ///
  /// \param[in] passenger The passenger making the booking.
  /// \param[in] ride The ride to book.
  /// \param[in] seats How many seats to book. Must be at least one.
  /// \param[in] total_price The price of the whole booking.
  /// \param[in] notes Free-form notes for the driver.
  ///
  /// \return the confirmed booking, or one of InvalidBooking, NotFound,
  /// RideUnavailable, OwnRide, DuplicateBooking, InsufficientSeats,
  /// PersistenceError.
  Result<Booking> book(
    PassengerId passenger,
    RideId ride,
    SeatCount seats,
    double total_price,
    std::string notes = "");

  ///===========================================================================
  /// \brief Create a pending booking. It holds no seats until confirm() is
  /// called. Validation is the same as book(), except that capacity is only
  /// checked when the booking is confirmed.
  Result<Booking> hold(
    PassengerId passenger,
    RideId ride,
    SeatCount seats,
    double total_price,
    std::string notes = "");

  ///===========================================================================
  /// \brief Confirm a pending booking, taking its seats from the ride.
  ///
  /// \return the confirmed booking, or one of NotFound, InvalidBooking,
  /// RideUnavailable, InsufficientSeats, PersistenceError.
  Result<Booking> confirm(BookingId booking);

  ///===========================================================================
  /// \brief Cancel a pending or confirmed booking. A confirmed booking gives
  /// its seats back to the ride.
  ///
  /// \return the cancelled booking, or one of NotFound, InvalidBooking,
  /// PersistenceError.
  Result<Booking> cancel(BookingId booking);

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__BOOKINGSERVICE_HPP
