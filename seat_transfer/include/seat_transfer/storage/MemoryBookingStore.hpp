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

#ifndef SEAT_TRANSFER__STORAGE__MEMORYBOOKINGSTORE_HPP
#define SEAT_TRANSFER__STORAGE__MEMORYBOOKINGSTORE_HPP

#include <seat_transfer/storage/BookingStore.hpp>
#include <rmf_utils/impl_ptr.hpp>

namespace seat_transfer {
namespace storage {

//==============================================================================
/// A thread-safe, in-process implementation of BookingStore. Booking ids are
/// assigned in increasing order starting from 1.
class MemoryBookingStore : public BookingStore
{
public:

  MemoryBookingStore();

  std::optional<Booking> get(BookingId booking) const final;

  std::optional<Booking> create(Booking::Draft draft) final;

  StatusChange compare_and_set_status(
    BookingId booking,
    BookingStatus expected,
    BookingStatus desired) final;

  std::vector<Booking> bookings_for_ride(RideId ride) const final;

  std::vector<Booking> bookings_for_passenger(
    PassengerId passenger) const final;

  /// Total number of bookings ever stored, including cancelled ones
  std::size_t size() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace storage
} // namespace seat_transfer

#endif // SEAT_TRANSFER__STORAGE__MEMORYBOOKINGSTORE_HPP
