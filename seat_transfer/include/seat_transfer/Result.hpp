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

#ifndef SEAT_TRANSFER__RESULT_HPP
#define SEAT_TRANSFER__RESULT_HPP

#include <seat_transfer/TransferRequest.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace seat_transfer {

//==============================================================================
enum class ErrorCode : uint8_t
{
  /// The request or booking does not exist, or belongs to someone else
  NotFound,

  /// Another pending transfer request already exists for the booking
  ConflictingRequest,

  /// The booking is not in a state that allows the operation
  InvalidBooking,

  /// The transfer request has already reached a terminal status
  AlreadyResolved,

  /// The original booking stopped being confirmed before the transfer ran
  StaleBooking,

  /// The target ride no longer has room for the booking's seats
  TargetRideFull,

  /// A storage write failed partway through a multi-step operation
  PersistenceError,

  /// The candidate locator produced nothing that can be offered
  NoCandidate,

  /// The ride does not exist or has been retired
  RideUnavailable,

  /// An ordinary booking asked for more seats than the ride has available
  InsufficientSeats,

  /// The passenger already holds a live booking on the ride
  DuplicateBooking,

  /// A driver tried to book their own ride
  OwnRide
};

//==============================================================================
const char* to_string(ErrorCode code);

//==============================================================================
/// The steps of the transfer saga, in the order they are executed.
enum class SagaStep : uint8_t
{
  ReadOriginalBooking,
  ReserveTargetSeats,
  CreateTargetBooking,
  ReleaseOriginalSeats,
  CancelOriginalBooking,
  RecordAcceptance
};

//==============================================================================
const char* to_string(SagaStep step);

//==============================================================================
/// A structured description of why an operation did not go through.
struct Failure
{
  ErrorCode code;

  /// A human-readable explanation
  std::string message;

  /// The saga step that failed, if the failure happened inside a saga
  std::optional<SagaStep> step = std::nullopt;

  /// For AlreadyResolved, the status that the request had already reached
  std::optional<TransferStatus> resolved_status = std::nullopt;
};

//==============================================================================
/// Holds either the value produced by an operation or the Failure that
/// prevented it.
template<typename T>
class Result
{
public:

  Result(T value)
  : _value(std::move(value))
  {
    // Do nothing
  }

  Result(Failure failure)
  : _failure(std::move(failure))
  {
    // Do nothing
  }

  bool has_value() const
  {
    return _value.has_value();
  }

  explicit operator bool() const
  {
    return has_value();
  }

  /// Get the value.
  /// \throws std::runtime_error if this result holds a failure.
  const T& value() const
  {
    if (!_value.has_value())
    {
      throw std::runtime_error(
        std::string("[seat_transfer::Result::value] Result holds a failure: ")
        + to_string(_failure->code) + " - " + _failure->message);
    }

    return *_value;
  }

  const T& operator*() const
  {
    return value();
  }

  const T* operator->() const
  {
    return &value();
  }

  /// Get the failure.
  /// \throws std::runtime_error if this result holds a value.
  const Failure& failure() const
  {
    if (!_failure.has_value())
    {
      throw std::runtime_error(
        "[seat_transfer::Result::failure] Result holds a value");
    }

    return *_failure;
  }

  /// Shortcut for failure().code
  ErrorCode error() const
  {
    return failure().code;
  }

private:
  std::optional<T> _value;
  std::optional<Failure> _failure;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__RESULT_HPP
