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

#ifndef SEAT_TRANSFER__CONFIGURATION_HPP
#define SEAT_TRANSFER__CONFIGURATION_HPP

#include <seat_transfer/Time.hpp>
#include <rmf_utils/impl_ptr.hpp>

namespace seat_transfer {

//==============================================================================
/// The tunable parameters of the transfer workflow.
class Configuration
{
public:

  /// The default offer window. Short enough that the target seat is unlikely
  /// to be taken before the passenger answers, long enough for a person to
  /// read the offer.
  static const Duration DefaultOfferWindow;

  /// The default interval between expiry sweeps
  static const Duration DefaultSweepInterval;

  /// Constructor
  ///
  /// \param[in] offer_window
  ///   How long a passenger has to answer a transfer request.
  ///
  /// \param[in] sweep_interval
  ///   How often the expiry watcher looks for overdue requests.
  ///
  /// \throws std::invalid_argument if either duration is not positive.
  Configuration(
    Duration offer_window = DefaultOfferWindow,
    Duration sweep_interval = DefaultSweepInterval);

  /// Set the offer window.
  /// \throws std::invalid_argument if the duration is not positive.
  Configuration& offer_window(Duration window);

  /// Get the offer window.
  Duration offer_window() const;

  /// Set the sweep interval.
  /// \throws std::invalid_argument if the duration is not positive.
  Configuration& sweep_interval(Duration interval);

  /// Get the sweep interval.
  Duration sweep_interval() const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace seat_transfer

#endif // SEAT_TRANSFER__CONFIGURATION_HPP
