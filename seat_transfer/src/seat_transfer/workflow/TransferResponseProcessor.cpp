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

#include <seat_transfer/workflow/TransferResponseProcessor.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace seat_transfer {
namespace workflow {

//==============================================================================
const char* to_string(const Decision decision)
{
  switch (decision)
  {
    case Decision::Accept: return "accept";
    case Decision::Decline: return "decline";
  }

  return "unknown";
}

namespace {
//==============================================================================
/// Gives a claimed request back to the manager unless the response went all
/// the way through.
class ClaimGuard
{
public:

  ClaimGuard(TransferRequestManager& manager, const TransferRequestId request)
  : _manager(manager),
    _request(request)
  {
    // Do nothing
  }

  ClaimGuard(const ClaimGuard&) = delete;
  ClaimGuard& operator=(const ClaimGuard&) = delete;

  void dismiss()
  {
    _active = false;
  }

  ~ClaimGuard()
  {
    if (_active)
      _manager.release(_request);
  }

private:
  TransferRequestManager& _manager;
  TransferRequestId _request;
  bool _active = true;
};

//==============================================================================
Failure saga_failure(
  const ErrorCode code,
  const SagaStep step,
  const TransferRequest& request,
  const std::string& detail)
{
  Failure failure{
    code,
    "Transfer request [" + std::to_string(request.id()) + "] failed at step ["
    + to_string(step) + "]: " + detail};
  failure.step = step;
  return failure;
}

} // anonymous namespace

//==============================================================================
class TransferResponseProcessor::Implementation
{
public:

  std::shared_ptr<TransferRequestManager> manager;
  std::shared_ptr<storage::BookingStore> bookings;
  std::shared_ptr<storage::RideCapacityLedger> rides;
  std::shared_ptr<ReconciliationLog> reconciliation;

  //============================================================================
  TransferRequest resolve(
    const TransferRequestId request,
    const TransferStatus status,
    const std::optional<BookingId> target_booking,
    const Time now)
  {
    auto resolved = manager->resolve(request, status, target_booking, now);
    if (!resolved.has_value())
    {
      // Only the holder of a claim can resolve, and we hold it
      throw std::runtime_error(
        "[TransferResponseProcessor::respond] Transfer request ["
        + std::to_string(request) + "] was resolved by someone else while it "
        "was claimed");
    }

    return *resolved;
  }

  //============================================================================
  void return_target_seats(
    const TransferRequest& request,
    const SeatCount seats)
  {
    const auto change = rides->release(request.target_ride(), seats);
    if (change == storage::CapacityChange::Applied)
    {
      std::cerr << "[TransferResponseProcessor::respond] Returned " << seats
                << " reserved seats to ride [" << request.target_ride()
                << "] after transfer request [" << request.id()
                << "] failed" << std::endl;
      return;
    }

    reconciliation->record(
      {
        ReconciliationLog::Kind::CompensationFailed,
        request.id(),
        std::nullopt,
        request.target_ride(),
        seats,
        std::string("Seats reserved for a failed transfer could not be "
        "returned to the target ride: ") + storage::to_string(change)
      });
  }

  //============================================================================
  void retake_original_seats(
    const TransferRequest& request,
    const RideId origin,
    const SeatCount seats)
  {
    const auto change = rides->reserve(origin, seats);
    if (change == storage::CapacityChange::Applied)
    {
      std::cerr << "[TransferResponseProcessor::respond] Took back " << seats
                << " seats on ride [" << origin << "] that transfer request ["
                << request.id() << "] released twice" << std::endl;
      return;
    }

    reconciliation->record(
      {
        ReconciliationLog::Kind::CompensationFailed,
        request.id(),
        request.original_booking(),
        origin,
        seats,
        std::string("Seats of a booking that was cancelled during a transfer "
        "were released twice and could not be taken back: ")
        + storage::to_string(change)
      });
  }

  //============================================================================
  /// \return true if the new booking no longer holds any seats.
  bool cancel_new_booking(
    const TransferRequest& request,
    const Booking& created)
  {
    const auto change = bookings->compare_and_set_status(
      created.id(), BookingStatus::Confirmed, BookingStatus::Cancelled);

    if (change == storage::StatusChange::Applied)
    {
      std::cerr << "[TransferResponseProcessor::respond] Cancelled booking ["
                << created.id() << "] after transfer request ["
                << request.id() << "] failed" << std::endl;
      return true;
    }

    // The booking is still confirmed, so it keeps its seats on the target
    // ride. Returning them now would let them be sold twice.
    reconciliation->record(
      {
        ReconciliationLog::Kind::CompensationFailed,
        request.id(),
        created.id(),
        request.target_ride(),
        created.seats(),
        std::string("The booking created by a failed transfer could not be "
        "cancelled, so its seats were left reserved: ")
        + storage::to_string(change)
      });

    return false;
  }

  //============================================================================
  Result<BookingId> move_seats(const TransferRequest& request)
  {
    // Step a
    const auto original = bookings->get(request.original_booking());
    if (!original.has_value()
      || original->status() != BookingStatus::Confirmed)
    {
      return saga_failure(
        ErrorCode::StaleBooking, SagaStep::ReadOriginalBooking, request,
        "booking [" + std::to_string(request.original_booking())
        + "] is no longer confirmed");
    }

    const SeatCount seats = original->seats();
    const RideId origin = original->ride();
    const RideId target = request.target_ride();

    // Step b
    const auto reserved = rides->reserve(target, seats);
    if (reserved != storage::CapacityChange::Applied)
    {
      const std::string detail = "could not reserve " + std::to_string(seats)
        + " seats on ride [" + std::to_string(target) + "]: "
        + storage::to_string(reserved);

      switch (reserved)
      {
        case storage::CapacityChange::InsufficientSeats:
          return saga_failure(
            ErrorCode::TargetRideFull, SagaStep::ReserveTargetSeats, request,
            detail);
        case storage::CapacityChange::Retired:
        case storage::CapacityChange::UnknownRide:
          return saga_failure(
            ErrorCode::RideUnavailable, SagaStep::ReserveTargetSeats, request,
            detail);
        default:
          return saga_failure(
            ErrorCode::PersistenceError, SagaStep::ReserveTargetSeats, request,
            detail);
      }
    }

    // Step c
    const auto created = bookings->create(
      {
        original->passenger(),
        target,
        seats,
        original->total_price(),
        BookingStatus::Confirmed,
        original->notes()
      });

    if (!created.has_value())
    {
      return_target_seats(request, seats);
      return saga_failure(
        ErrorCode::PersistenceError, SagaStep::CreateTargetBooking, request,
        "the booking on ride [" + std::to_string(target)
        + "] could not be stored");
    }

    // Step d
    const auto released = rides->release(origin, seats);
    if (released != storage::CapacityChange::Applied)
    {
      if (cancel_new_booking(request, *created))
        return_target_seats(request, seats);

      return saga_failure(
        ErrorCode::PersistenceError, SagaStep::ReleaseOriginalSeats, request,
        "could not release " + std::to_string(seats) + " seats on ride ["
        + std::to_string(origin) + "]: " + storage::to_string(released));
    }

    // Step e
    const auto cancelled = bookings->compare_and_set_status(
      original->id(), BookingStatus::Confirmed, BookingStatus::Cancelled);

    if (cancelled == storage::StatusChange::Mismatch)
    {
      // The original was cancelled while the saga ran, and that cancellation
      // already returned its seats. Step d returned them a second time.
      retake_original_seats(request, origin, seats);
      if (cancel_new_booking(request, *created))
        return_target_seats(request, seats);

      return saga_failure(
        ErrorCode::StaleBooking, SagaStep::CancelOriginalBooking, request,
        "booking [" + std::to_string(original->id()) + "] stopped being "
        "confirmed while the transfer was running");
    }

    if (cancelled != storage::StatusChange::Applied)
    {
      // The seats have moved, so a storage failure here is not rolled back
      reconciliation->record(
        {
          ReconciliationLog::Kind::OrphanedOriginalBooking,
          request.id(),
          original->id(),
          origin,
          seats,
          "The seats were moved to booking [" + std::to_string(created->id())
          + "] on ride [" + std::to_string(target) + "] but the original "
          "booking could not be cancelled: " + storage::to_string(cancelled)
        });
    }

    return created->id();
  }
};

//==============================================================================
TransferResponseProcessor::TransferResponseProcessor(
  std::shared_ptr<TransferRequestManager> manager,
  std::shared_ptr<storage::BookingStore> bookings,
  std::shared_ptr<storage::RideCapacityLedger> rides,
  std::shared_ptr<ReconciliationLog> reconciliation)
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  if (!manager || !bookings || !rides)
  {
    throw std::invalid_argument(
      "[TransferResponseProcessor] The manager, booking store and capacity "
      "ledger must all be provided");
  }

  _pimpl->manager = std::move(manager);
  _pimpl->bookings = std::move(bookings);
  _pimpl->rides = std::move(rides);
  _pimpl->reconciliation = reconciliation ?
    std::move(reconciliation) : std::make_shared<ReconciliationLog>();
}

//==============================================================================
Result<TransferOutcome> TransferResponseProcessor::respond(
  const TransferRequestId request_id,
  const PassengerId passenger,
  const Decision decision,
  const Time now)
{
  const auto claimed = _pimpl->manager->claim(request_id, passenger, now);
  if (!claimed)
    return claimed.failure();

  ClaimGuard guard(*_pimpl->manager, request_id);
  const TransferRequest& request = *claimed;

  if (decision == Decision::Decline)
  {
    auto declined = _pimpl->resolve(
      request_id, TransferStatus::Declined, std::nullopt, now);
    guard.dismiss();

    return TransferOutcome{
      TransferStatus::Declined,
      std::move(declined),
      request.original_booking(),
      std::nullopt
    };
  }

  const auto moved = _pimpl->move_seats(request);
  if (!moved)
    return moved.failure();

  // Step f
  auto accepted = _pimpl->resolve(
    request_id, TransferStatus::Accepted, *moved, now);
  guard.dismiss();

  return TransferOutcome{
    TransferStatus::Accepted,
    std::move(accepted),
    request.original_booking(),
    *moved
  };
}

//==============================================================================
const std::shared_ptr<ReconciliationLog>&
TransferResponseProcessor::reconciliation() const
{
  return _pimpl->reconciliation;
}

} // namespace workflow
} // namespace seat_transfer
