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

#ifndef SRC__SEAT_TRANSFER__INTERNAL_TRANSFERREQUEST_HPP
#define SRC__SEAT_TRANSFER__INTERNAL_TRANSFERREQUEST_HPP

#include <seat_transfer/TransferRequest.hpp>

namespace seat_transfer {

//==============================================================================
class TransferRequest::Implementation
{
public:

  TransferRequestId id;
  BookingId original_booking;
  RideId original_ride;
  RideId target_ride;
  std::optional<BookingId> target_booking;
  PassengerId passenger;
  TransferStatus status = TransferStatus::Pending;
  TransferPriority priority = TransferPriority::Secondary;
  std::string reason;
  std::vector<std::string> benefits;
  Time created_at;
  Time deadline;
  std::optional<Time> responded_at;

  static TransferRequest make(Implementation data)
  {
    TransferRequest request;
    *request._pimpl = std::move(data);
    return request;
  }
};

} // namespace seat_transfer

#endif // SRC__SEAT_TRANSFER__INTERNAL_TRANSFERREQUEST_HPP
