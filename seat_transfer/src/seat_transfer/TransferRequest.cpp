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

#include "internal_TransferRequest.hpp"

namespace seat_transfer {

//==============================================================================
const char* to_string(const TransferStatus status)
{
  switch (status)
  {
    case TransferStatus::Pending: return "pending";
    case TransferStatus::Accepted: return "accepted";
    case TransferStatus::Declined: return "declined";
    case TransferStatus::Expired: return "expired";
  }

  return "unknown";
}

//==============================================================================
bool is_terminal(const TransferStatus status)
{
  return status != TransferStatus::Pending;
}

//==============================================================================
TransferRequestId TransferRequest::id() const
{
  return _pimpl->id;
}

//==============================================================================
BookingId TransferRequest::original_booking() const
{
  return _pimpl->original_booking;
}

//==============================================================================
RideId TransferRequest::original_ride() const
{
  return _pimpl->original_ride;
}

//==============================================================================
RideId TransferRequest::target_ride() const
{
  return _pimpl->target_ride;
}

//==============================================================================
std::optional<BookingId> TransferRequest::target_booking() const
{
  return _pimpl->target_booking;
}

//==============================================================================
PassengerId TransferRequest::passenger() const
{
  return _pimpl->passenger;
}

//==============================================================================
TransferStatus TransferRequest::status() const
{
  return _pimpl->status;
}

//==============================================================================
TransferPriority TransferRequest::priority() const
{
  return _pimpl->priority;
}

//==============================================================================
const std::string& TransferRequest::reason() const
{
  return _pimpl->reason;
}

//==============================================================================
const std::vector<std::string>& TransferRequest::benefits() const
{
  return _pimpl->benefits;
}

//==============================================================================
Time TransferRequest::created_at() const
{
  return _pimpl->created_at;
}

//==============================================================================
Time TransferRequest::deadline() const
{
  return _pimpl->deadline;
}

//==============================================================================
std::optional<Time> TransferRequest::responded_at() const
{
  return _pimpl->responded_at;
}

//==============================================================================
Duration TransferRequest::time_remaining(const Time now) const
{
  if (is_terminal(_pimpl->status) || now >= _pimpl->deadline)
    return Duration::zero();

  return _pimpl->deadline - now;
}

//==============================================================================
bool TransferRequest::overdue(const Time now) const
{
  return _pimpl->status == TransferStatus::Pending && now >= _pimpl->deadline;
}

//==============================================================================
TransferRequest::TransferRequest()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

} // namespace seat_transfer
