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

#include <seat_transfer/BookingService.hpp>

#include <mutex>
#include <string>

namespace seat_transfer {

namespace {
//==============================================================================
Failure reservation_failure(
  const storage::CapacityChange change,
  const RideId ride,
  const SeatCount seats)
{
  using storage::CapacityChange;
  const std::string detail = "Could not reserve " + std::to_string(seats)
    + " seats on ride [" + std::to_string(ride) + "]: "
    + storage::to_string(change);

  switch (change)
  {
    case CapacityChange::InsufficientSeats:
      return Failure{ErrorCode::InsufficientSeats, detail};
    case CapacityChange::Retired:
    case CapacityChange::UnknownRide:
      return Failure{ErrorCode::RideUnavailable, detail};
    default:
      return Failure{ErrorCode::PersistenceError, detail};
  }
}
} // anonymous namespace

//==============================================================================
class BookingService::Implementation
{
public:

  std::shared_ptr<storage::BookingStore> bookings;
  std::shared_ptr<storage::RideCapacityLedger> rides;
  std::shared_ptr<ReconciliationLog> reconciliation;

  // Keeps the duplicate booking check and the write that follows it together
  std::mutex admission_mutex;

  //============================================================================
  void give_back(const Booking::Draft& draft, const std::string& why)
  {
    const auto change = rides->release(draft.ride, draft.seats);
    if (change == storage::CapacityChange::Applied)
      return;

    reconciliation->record(
      {
        ReconciliationLog::Kind::CompensationFailed,
        std::nullopt,
        std::nullopt,
        draft.ride,
        draft.seats,
        why + ", and the reserved seats could not be returned: "
        + storage::to_string(change)
      });
  }

  //============================================================================
  Result<Booking> admit(Booking::Draft draft)
  {
    if (draft.seats == 0)
    {
      return Failure{
        ErrorCode::InvalidBooking,
        "A booking must be for at least one seat"};
    }

    std::lock_guard<std::mutex> lock(admission_mutex);
    const auto ride = rides->get(draft.ride);
    if (!ride.has_value())
    {
      return Failure{
        ErrorCode::NotFound,
        "Ride [" + std::to_string(draft.ride) + "] does not exist"};
    }

    if (!ride->active())
    {
      return Failure{
        ErrorCode::RideUnavailable,
        "Ride [" + std::to_string(draft.ride) + "] is no longer available"};
    }

    if (ride->driver() == draft.passenger)
    {
      return Failure{
        ErrorCode::OwnRide,
        "Passenger [" + std::to_string(draft.passenger)
        + "] is the driver of ride [" + std::to_string(draft.ride) + "]"};
    }

    for (const auto& existing : bookings->bookings_for_passenger(
        draft.passenger))
    {
      if (existing.ride() == draft.ride
        && existing.status() != BookingStatus::Cancelled)
      {
        return Failure{
          ErrorCode::DuplicateBooking,
          "Passenger [" + std::to_string(draft.passenger)
          + "] already holds booking [" + std::to_string(existing.id())
          + "] on ride [" + std::to_string(draft.ride) + "]"};
      }
    }

    if (draft.seats > ride->total_seats())
    {
      return Failure{
        ErrorCode::InsufficientSeats,
        "Ride [" + std::to_string(draft.ride) + "] only has "
        + std::to_string(ride->total_seats()) + " seats in total"};
    }

    const bool confirmed = draft.status == BookingStatus::Confirmed;
    if (confirmed)
    {
      const auto change = rides->reserve(draft.ride, draft.seats);
      if (change != storage::CapacityChange::Applied)
        return reservation_failure(change, draft.ride, draft.seats);
    }

    auto created = bookings->create(draft);
    if (!created.has_value())
    {
      const std::string why = "Failed to store a booking for passenger ["
        + std::to_string(draft.passenger) + "] on ride ["
        + std::to_string(draft.ride) + "]";

      if (confirmed)
        give_back(draft, why);

      return Failure{ErrorCode::PersistenceError, why};
    }

    return *created;
  }
};

//==============================================================================
BookingService::BookingService(
  std::shared_ptr<storage::BookingStore> bookings,
  std::shared_ptr<storage::RideCapacityLedger> rides,
  std::shared_ptr<ReconciliationLog> reconciliation)
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  _pimpl->bookings = std::move(bookings);
  _pimpl->rides = std::move(rides);
  _pimpl->reconciliation = reconciliation ?
    std::move(reconciliation) : std::make_shared<ReconciliationLog>();
}

//==============================================================================
Result<Booking> BookingService::book(
  const PassengerId passenger,
  const RideId ride,
  const SeatCount seats,
  const double total_price,
  std::string notes)
{
  return _pimpl->admit(
    {passenger, ride, seats, total_price, BookingStatus::Confirmed,
      std::move(notes)});
}

//==============================================================================
Result<Booking> BookingService::hold(
  const PassengerId passenger,
  const RideId ride,
  const SeatCount seats,
  const double total_price,
  std::string notes)
{
  return _pimpl->admit(
    {passenger, ride, seats, total_price, BookingStatus::Pending,
      std::move(notes)});
}

//==============================================================================
Result<Booking> BookingService::confirm(const BookingId booking_id)
{
  const auto booking = _pimpl->bookings->get(booking_id);
  if (!booking.has_value())
  {
    return Failure{
      ErrorCode::NotFound,
      "Booking [" + std::to_string(booking_id) + "] does not exist"};
  }

  if (booking->status() != BookingStatus::Pending)
  {
    return Failure{
      ErrorCode::InvalidBooking,
      "Booking [" + std::to_string(booking_id) + "] is "
      + to_string(booking->status()) + ", not pending"};
  }

  const auto reserved =
    _pimpl->rides->reserve(booking->ride(), booking->seats());
  if (reserved != storage::CapacityChange::Applied)
    return reservation_failure(reserved, booking->ride(), booking->seats());

  const auto change = _pimpl->bookings->compare_and_set_status(
    booking_id, BookingStatus::Pending, BookingStatus::Confirmed);

  if (change != storage::StatusChange::Applied)
  {
    const std::string why = "Failed to confirm booking ["
      + std::to_string(booking_id) + "]: " + storage::to_string(change);

    _pimpl->give_back(
      {booking->passenger(), booking->ride(), booking->seats(),
        booking->total_price(), BookingStatus::Pending, booking->notes()},
      why);

    if (change == storage::StatusChange::Mismatch)
      return Failure{ErrorCode::InvalidBooking, why};

    return Failure{ErrorCode::PersistenceError, why};
  }

  return booking->with_status(BookingStatus::Confirmed);
}

//==============================================================================
Result<Booking> BookingService::cancel(const BookingId booking_id)
{
  const auto booking = _pimpl->bookings->get(booking_id);
  if (!booking.has_value())
  {
    return Failure{
      ErrorCode::NotFound,
      "Booking [" + std::to_string(booking_id) + "] does not exist"};
  }

  const auto previous = booking->status();
  if (previous == BookingStatus::Cancelled)
  {
    return Failure{
      ErrorCode::InvalidBooking,
      "Booking [" + std::to_string(booking_id) + "] is already cancelled"};
  }

  const auto change = _pimpl->bookings->compare_and_set_status(
    booking_id, previous, BookingStatus::Cancelled);

  if (change == storage::StatusChange::Mismatch)
  {
    return Failure{
      ErrorCode::InvalidBooking,
      "Booking [" + std::to_string(booking_id)
      + "] changed status while it was being cancelled"};
  }

  if (change != storage::StatusChange::Applied)
  {
    return Failure{
      ErrorCode::PersistenceError,
      "Failed to cancel booking [" + std::to_string(booking_id) + "]: "
      + storage::to_string(change)};
  }

  if (previous == BookingStatus::Confirmed)
  {
    const auto released =
      _pimpl->rides->release(booking->ride(), booking->seats());

    if (released != storage::CapacityChange::Applied)
    {
      // The cancellation stands. Re-confirming the booking here could hand
      // the same seats to two passengers.
      _pimpl->reconciliation->record(
        {
          ReconciliationLog::Kind::ReleaseFailed,
          std::nullopt,
          booking_id,
          booking->ride(),
          booking->seats(),
          std::string("Booking was cancelled but its seats were not returned: ")
          + storage::to_string(released)
        });
    }
  }

  return booking->with_status(BookingStatus::Cancelled);
}

} // namespace seat_transfer
