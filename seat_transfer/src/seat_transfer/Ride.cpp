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

#include <seat_transfer/Ride.hpp>

#include <stdexcept>
#include <string>

namespace seat_transfer {

//==============================================================================
class Ride::Implementation
{
public:
  RideId _id;
  DriverId _driver;
  SeatCount _total_seats;
  SeatCount _available_seats;
  bool _active;
};

//==============================================================================
RideId Ride::id() const
{
  return _pimpl->_id;
}

//==============================================================================
DriverId Ride::driver() const
{
  return _pimpl->_driver;
}

//==============================================================================
SeatCount Ride::total_seats() const
{
  return _pimpl->_total_seats;
}

//==============================================================================
SeatCount Ride::available_seats() const
{
  return _pimpl->_available_seats;
}

//==============================================================================
SeatCount Ride::occupied_seats() const
{
  return _pimpl->_total_seats - _pimpl->_available_seats;
}

//==============================================================================
bool Ride::active() const
{
  return _pimpl->_active;
}

//==============================================================================
Ride Ride::make(
  RideId id,
  DriverId driver,
  SeatCount total_seats,
  SeatCount available_seats,
  bool active)
{
  if (total_seats == 0)
  {
    throw std::invalid_argument(
      "[seat_transfer::Ride::make] Ride [" + std::to_string(id)
      + "] must have at least one seat");
  }

  if (available_seats > total_seats)
  {
    throw std::invalid_argument(
      "[seat_transfer::Ride::make] Ride [" + std::to_string(id)
      + "] cannot have " + std::to_string(available_seats)
      + " available seats out of " + std::to_string(total_seats));
  }

  Ride ride;
  ride._pimpl->_id = id;
  ride._pimpl->_driver = driver;
  ride._pimpl->_total_seats = total_seats;
  ride._pimpl->_available_seats = available_seats;
  ride._pimpl->_active = active;
  return ride;
}

//==============================================================================
Ride::Ride()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

} // namespace seat_transfer
