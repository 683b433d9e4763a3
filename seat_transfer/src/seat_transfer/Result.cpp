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

#include <seat_transfer/Result.hpp>

namespace seat_transfer {

//==============================================================================
const char* to_string(const ErrorCode code)
{
  switch (code)
  {
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::ConflictingRequest: return "ConflictingRequest";
    case ErrorCode::InvalidBooking: return "InvalidBooking";
    case ErrorCode::AlreadyResolved: return "AlreadyResolved";
    case ErrorCode::StaleBooking: return "StaleBooking";
    case ErrorCode::TargetRideFull: return "TargetRideFull";
    case ErrorCode::PersistenceError: return "PersistenceError";
    case ErrorCode::NoCandidate: return "NoCandidate";
    case ErrorCode::RideUnavailable: return "RideUnavailable";
    case ErrorCode::InsufficientSeats: return "InsufficientSeats";
    case ErrorCode::DuplicateBooking: return "DuplicateBooking";
    case ErrorCode::OwnRide: return "OwnRide";
  }

  return "Unknown";
}

//==============================================================================
const char* to_string(const SagaStep step)
{
  switch (step)
  {
    case SagaStep::ReadOriginalBooking: return "read original booking";
    case SagaStep::ReserveTargetSeats: return "reserve target seats";
    case SagaStep::CreateTargetBooking: return "create target booking";
    case SagaStep::ReleaseOriginalSeats: return "release original seats";
    case SagaStep::CancelOriginalBooking: return "cancel original booking";
    case SagaStep::RecordAcceptance: return "record acceptance";
  }

  return "unknown step";
}

} // namespace seat_transfer
