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

#ifndef SEAT_TRANSFER__TRANSFERCANDIDATE_HPP
#define SEAT_TRANSFER__TRANSFERCANDIDATE_HPP

#include <seat_transfer/Booking.hpp>

#include <string>
#include <vector>

namespace seat_transfer {

//==============================================================================
enum class TransferPriority : uint8_t
{
  Primary,
  Secondary
};

//==============================================================================
const char* to_string(TransferPriority priority);

//==============================================================================
/// One ranked result of a TransferCandidateLocator. The contents are treated
/// as opaque input; nothing here is re-derived by the transfer workflow.
struct TransferCandidate
{
  RideId target_ride;
  TransferPriority priority = TransferPriority::Secondary;
  double compatibility_score = 0.0;

  /// The headline justification for this candidate
  std::string reason;

  /// Human-readable benefits, in the order they should be displayed
  std::vector<std::string> benefits;
};

//==============================================================================
/// A pure abstract interface for the ranking service that looks for rides that
/// a booking could be transferred to.
class TransferCandidateLocator
{
public:

  /// Get the ranked candidates for a booking, best candidate first. An empty
  /// vector means there is nothing to offer.
  virtual std::vector<TransferCandidate> locate(const Booking& booking) = 0;

  virtual ~TransferCandidateLocator() = default;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__TRANSFERCANDIDATE_HPP
