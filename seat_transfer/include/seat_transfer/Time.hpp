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

#ifndef SEAT_TRANSFER__TIME_HPP
#define SEAT_TRANSFER__TIME_HPP

#include <chrono>
#include <cstdint>

namespace seat_transfer {

using Time = std::chrono::steady_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

using RideId = uint64_t;
using BookingId = uint64_t;
using PassengerId = uint64_t;
using DriverId = uint64_t;
using TransferRequestId = uint64_t;
using SeatCount = uint32_t;

namespace time {

//==============================================================================
/// Convert a duration into a floating point number of seconds
double to_seconds(Duration delta_t);

//==============================================================================
/// Convert a floating point number of seconds into a duration
Duration from_seconds(double delta_t);

} // namespace time

} // namespace seat_transfer

#endif // SEAT_TRANSFER__TIME_HPP
