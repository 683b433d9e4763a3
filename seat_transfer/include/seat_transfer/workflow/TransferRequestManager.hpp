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

#ifndef SEAT_TRANSFER__WORKFLOW__TRANSFERREQUESTMANAGER_HPP
#define SEAT_TRANSFER__WORKFLOW__TRANSFERREQUESTMANAGER_HPP

#include <seat_transfer/Configuration.hpp>
#include <seat_transfer/Result.hpp>
#include <seat_transfer/TransferCandidate.hpp>
#include <seat_transfer/storage/BookingStore.hpp>
#include <seat_transfer/storage/RideCapacityLedger.hpp>
#include <seat_transfer/workflow/TransferObserver.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace seat_transfer {
namespace workflow {

//==============================================================================
/// \brief Owns every TransferRequest and enforces its state machine.
///
/// A request starts out pending and moves to exactly one of accepted,
/// declined or expired. Every move out of pending is a conditional update made
/// under the manager's lock, so when a passenger's answer and the expiry
/// watcher race, exactly one of them wins. At most one request per booking is
/// pending at any time. Requests are kept forever as an audit trail.
class TransferRequestManager
{
public:

  /// Constructor
  ///
  /// \param[in] bookings
  ///   Used to validate the booking that a request is opened for.
  ///
  /// \param[in] rides
  ///   Used to validate the target ride of a candidate.
  ///
  /// \param[in] config
  ///   The offer window is taken from here.
  TransferRequestManager(
    std::shared_ptr<const storage::BookingStore> bookings,
    std::shared_ptr<const storage::RideCapacityLedger> rides,
    Configuration config = Configuration());

  ///===========================================================================
  /// \brief Open a pending transfer request for a confirmed booking.
  ///
  /// \param[in] booking The booking that would be moved.
  /// \param[in] candidate The ride to offer, as ranked by a locator.
  /// \param[in] now The current time. The deadline is now plus the offer
  ///   window.
  ///
  /// \return the new request, or one of
  ///   - NotFound: the booking does not exist
  ///   - InvalidBooking: the booking is not confirmed
  ///   - RideUnavailable: the target ride is unknown, retired, or is the ride
  ///     the booking is already on
  ///   - ConflictingRequest: the booking already has a pending request
  Result<TransferRequest> open(
    BookingId booking,
    const TransferCandidate& candidate,
    Time now);

  ///===========================================================================
  /// \brief Ask a locator for candidates and open a request for the best one
  /// that can currently be honoured.
  ///
  /// Candidates are tried in the order the locator ranked them. A candidate is
  /// skipped if its ride is unknown, retired, the booking's own ride, or does
  /// not have enough available seats right now.
  ///
  /// \return the new request, NoCandidate if nothing qualified, or any of the
  /// failures of open().
  Result<TransferRequest> offer(
    BookingId booking,
    TransferCandidateLocator& locator,
    Time now);

  ///===========================================================================
  /// \brief Look up a request that belongs to a passenger, in any status. A
  /// pending request whose deadline has passed is expired first.
  ///
  /// \return NotFound if the request does not exist or belongs to a different
  /// passenger.
  Result<TransferRequest> lookup(
    TransferRequestId request,
    PassengerId passenger,
    Time now);

  ///===========================================================================
  /// \brief Same as lookup(), but a request that can no longer be answered is
  /// also reported as NotFound.
  Result<TransferRequest> lookup_actionable(
    TransferRequestId request,
    PassengerId passenger,
    Time now);

  /// Get any request by id, without any ownership check or expiry.
  std::optional<TransferRequest> get(TransferRequestId request) const;

  /// Get every request ever opened for a booking, oldest first.
  std::vector<TransferRequest> requests_for_booking(BookingId booking) const;

  /// Get the pending request of a booking, if it has one.
  std::optional<TransferRequest> pending_for_booking(BookingId booking) const;

  ///===========================================================================
  /// \brief Move every pending request whose deadline has passed to expired.
  ///
  /// Requests that are already terminal are left alone, so calling this more
  /// than once has the same effect as calling it once. Requests that are in
  /// the middle of being answered are also left alone; the answer decides
  /// their fate.
  ///
  /// \return the requests that this call expired.
  std::vector<TransferRequest> expire_overdue(Time now);

  ///===========================================================================
  /// \brief Take exclusive hold of a pending request so that it can be
  /// answered.
  ///
  /// If another caller holds the request, this waits until that caller
  /// resolves or releases it. The wait is bounded by the other caller's
  /// storage operations.
  ///
  /// \return the held request, or
  ///   - NotFound: the request does not exist or belongs to someone else
  ///   - AlreadyResolved: the request is terminal. If its deadline had passed
  ///     it is expired by this call.
  Result<TransferRequest> claim(
    TransferRequestId request,
    PassengerId passenger,
    Time now);

  ///===========================================================================
  /// \brief Give up a claim without changing the request. It stays pending.
  void release(TransferRequestId request);

  ///===========================================================================
  /// \brief Move a claimed request to a terminal status and give up the claim.
  ///
  /// \param[in] request The claimed request.
  /// \param[in] status Accepted or Declined.
  /// \param[in] target_booking The booking created by an accepted transfer.
  /// \param[in] now The response time.
  ///
  /// \return the resolved request, or std::nullopt if the request was not
  /// claimed or `status` is not a passenger decision.
  std::optional<TransferRequest> resolve(
    TransferRequestId request,
    TransferStatus status,
    std::optional<BookingId> target_booking,
    Time now);

  /// Register an observer. Observers are held weakly and dropped once they
  /// expire.
  void add_observer(std::weak_ptr<TransferObserver> observer);

  const Configuration& configuration() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace workflow
} // namespace seat_transfer

#endif // SEAT_TRANSFER__WORKFLOW__TRANSFERREQUESTMANAGER_HPP
