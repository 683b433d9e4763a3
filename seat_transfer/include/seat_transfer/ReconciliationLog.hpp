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

#ifndef SEAT_TRANSFER__RECONCILIATIONLOG_HPP
#define SEAT_TRANSFER__RECONCILIATIONLOG_HPP

#include <seat_transfer/Time.hpp>
#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <string>
#include <vector>

namespace seat_transfer {

//==============================================================================
/// A thread-safe record of inconsistencies that could not be repaired
/// automatically and need a person to look at them. Every entry is also
/// printed to std::cerr when it is recorded.
class ReconciliationLog
{
public:

  enum class Kind : uint8_t
  {
    /// The seats were moved but the original booking could not be cancelled,
    /// so it still claims seats that it no longer holds.
    OrphanedOriginalBooking,

    /// A compensation inside a failed saga could not be applied
    CompensationFailed,

    /// An ordinary cancellation went through but its seats could not be
    /// returned to the ride
    ReleaseFailed
  };

  struct Entry
  {
    Kind kind;
    std::optional<TransferRequestId> request;
    std::optional<BookingId> booking;
    std::optional<RideId> ride;
    SeatCount seats = 0;
    std::string description;
  };

  ReconciliationLog();

  /// Record an item that needs manual reconciliation.
  void record(Entry entry);

  /// Get a copy of every entry recorded so far, oldest first.
  std::vector<Entry> entries() const;

  std::size_t size() const;

  bool empty() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

//==============================================================================
const char* to_string(ReconciliationLog::Kind kind);

} // namespace seat_transfer

#endif // SEAT_TRANSFER__RECONCILIATIONLOG_HPP
