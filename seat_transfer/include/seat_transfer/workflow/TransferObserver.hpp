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

#ifndef SEAT_TRANSFER__WORKFLOW__TRANSFEROBSERVER_HPP
#define SEAT_TRANSFER__WORKFLOW__TRANSFEROBSERVER_HPP

#include <seat_transfer/TransferRequest.hpp>

namespace seat_transfer {
namespace workflow {

//==============================================================================
/// \brief Inherit this class to be told about changes to transfer requests,
/// for example to hand them to a push or SMS delivery channel.
///
/// Callbacks are fire-and-forget. They are called after the change has been
/// stored and outside of any internal lock. If a callback throws, the
/// exception is logged and the change still stands.
class TransferObserver
{
public:

  ///===========================================================================
  /// \brief A new transfer request was opened and is waiting for an answer.
  virtual void transfer_offered(const TransferRequest& request) = 0;

  ///===========================================================================
  /// \brief The passenger accepted and the seats have been moved.
  /// request.target_booking() holds the new booking.
  virtual void transfer_accepted(const TransferRequest& request) = 0;

  ///===========================================================================
  /// \brief The passenger declined. Nothing about the booking changed.
  virtual void transfer_declined(const TransferRequest& request) = 0;

  ///===========================================================================
  /// \brief The request was not answered in time. Nothing about the booking
  /// changed.
  virtual void transfer_expired(const TransferRequest& request) = 0;

  virtual ~TransferObserver() = default;
};

} // namespace workflow
} // namespace seat_transfer

#endif // SEAT_TRANSFER__WORKFLOW__TRANSFEROBSERVER_HPP
