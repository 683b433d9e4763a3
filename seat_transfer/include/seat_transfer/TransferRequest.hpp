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

#ifndef SEAT_TRANSFER__TRANSFERREQUEST_HPP
#define SEAT_TRANSFER__TRANSFERREQUEST_HPP

#include <seat_transfer/TransferCandidate.hpp>
#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <string>
#include <vector>

namespace seat_transfer {

//==============================================================================
enum class TransferStatus : uint8_t
{
  Pending,
  Accepted,
  Declined,
  Expired
};

//==============================================================================
const char* to_string(TransferStatus status);

//==============================================================================
/// Returns true for every status other than Pending. A terminal status is
/// permanent.
bool is_terminal(TransferStatus status);

//==============================================================================
/// \brief A snapshot of an offer to move a confirmed booking onto a different
/// ride, and the outcome of that offer.
///
/// The request references both bookings and both rides, but neither the
/// bookings nor the rides know about the request.
class TransferRequest
{
public:

  TransferRequestId id() const;

  /// The booking that the passenger currently holds
  BookingId original_booking() const;

  /// The ride that original_booking() references
  RideId original_ride() const;

  /// The ride that the passenger is being offered
  RideId target_ride() const;

  /// The booking created on target_ride(). This only has a value once the
  /// request has been accepted.
  std::optional<BookingId> target_booking() const;

  PassengerId passenger() const;

  TransferStatus status() const;

  TransferPriority priority() const;

  /// The candidate's headline justification
  const std::string& reason() const;

  /// The benefits to display to the passenger, in order
  const std::vector<std::string>& benefits() const;

  Time created_at() const;

  /// The request must be answered strictly before this time.
  Time deadline() const;

  /// When the passenger answered. Empty until the passenger responds, and it
  /// stays empty if the request expires.
  std::optional<Time> responded_at() const;

  ///===========================================================================
  /// \brief How long the passenger has left to answer. This is a pure read for
  /// client countdowns. It never changes the request.
  /// \return zero when the deadline has passed or the request is terminal.
  Duration time_remaining(Time now) const;

  ///===========================================================================
  /// \brief Returns true if this request is pending but its deadline has
  /// passed at `now`.
  bool overdue(Time now) const;

  class Implementation;
private:
  TransferRequest();
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__TRANSFERREQUEST_HPP
