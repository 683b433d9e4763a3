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

#ifndef SEAT_TRANSFER__WORKFLOW__TRANSFERRESPONSEPROCESSOR_HPP
#define SEAT_TRANSFER__WORKFLOW__TRANSFERRESPONSEPROCESSOR_HPP

#include <seat_transfer/ReconciliationLog.hpp>
#include <seat_transfer/Result.hpp>
#include <seat_transfer/storage/BookingStore.hpp>
#include <seat_transfer/storage/RideCapacityLedger.hpp>
#include <seat_transfer/workflow/TransferRequestManager.hpp>

#include <memory>
#include <optional>

namespace seat_transfer {
namespace workflow {

//==============================================================================
/// The answer a passenger gives to a transfer request
enum class Decision : uint8_t
{
  Accept,
  Decline
};

//==============================================================================
const char* to_string(Decision decision);

//==============================================================================
/// What a successful response produced
struct TransferOutcome
{
  /// Accepted or Declined
  TransferStatus status;

  /// The request after it was resolved
  TransferRequest request;

  /// The booking that was moved, or would have been
  BookingId original_booking;

  /// The booking created on the target ride, if the transfer was accepted
  std::optional<BookingId> new_booking;
};

//==============================================================================
/// \brief Applies a passenger's answer to a pending transfer request.
///
/// Declining only resolves the request. Accepting moves the booking's seats
/// to the target ride with the following steps:
///
///   1. Read the original booking, which must still be confirmed
///   2. Reserve the seats on the target ride
///   3. Create a confirmed booking on the target ride
///   4. Release the seats on the original ride
///   5. Cancel the original booking
///   6. Mark the request as accepted
///
/// If any of steps 1 through 4 fails, the steps that already went through are
/// undone in reverse order and the request stays pending, so the passenger can
/// try again before the deadline. If step 5 finds that the original booking
/// was cancelled while the transfer ran, that cancellation already gave its
/// seats back, so the seats released in step 4 are reserved again, steps 3
/// and 2 are undone, and the answer fails with StaleBooking. Any other
/// failure at step 5 happens after the seats have already moved, so it is
/// written to the ReconciliationLog and the transfer still counts as
/// accepted. Any undo that itself fails is also written to the
/// ReconciliationLog.
class TransferResponseProcessor
{
public:

  /// Constructor
  ///
  /// \param[in] manager
  ///   The owner of the transfer requests.
  ///
  /// \param[in] bookings
  ///   Booking storage. This should be the same store that `manager` reads.
  ///
  /// \param[in] rides
  ///   The seat counters of every ride.
  ///
  /// \param[in] reconciliation
  ///   Where to record inconsistencies that could not be undone. A log is
  ///   created if this is nullptr.
  TransferResponseProcessor(
    std::shared_ptr<TransferRequestManager> manager,
    std::shared_ptr<storage::BookingStore> bookings,
    std::shared_ptr<storage::RideCapacityLedger> rides,
    std::shared_ptr<ReconciliationLog> reconciliation = nullptr);

  ///===========================================================================
  /// \brief Apply a passenger's decision.
  ///
  /// Two responses to the same request never run at the same time. The second
  /// one waits for the first and then sees its result.
  ///
  /// \param[in] request The transfer request being answered.
  /// \param[in] passenger The passenger answering. Must own the request.
  /// \param[in] decision Accept or decline.
  /// \param[in] now The time of the response.
  ///
  /// \return the outcome, or one of
  ///   - NotFound: the request does not exist or belongs to someone else
  ///   - AlreadyResolved: the request is no longer pending. The status it
  ///     reached is in Failure::resolved_status.
  ///   - StaleBooking: the original booking is no longer confirmed
  ///   - TargetRideFull: the target ride ran out of seats
  ///   - RideUnavailable: the target ride was retired
  ///   - PersistenceError: a storage write failed. Failure::step names the
  ///     step.
  Result<TransferOutcome> respond(
    TransferRequestId request,
    PassengerId passenger,
    Decision decision,
    Time now);

  /// Get the log that inconsistencies are written to.
  const std::shared_ptr<ReconciliationLog>& reconciliation() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace workflow
} // namespace seat_transfer

#endif // SEAT_TRANSFER__WORKFLOW__TRANSFERRESPONSEPROCESSOR_HPP
