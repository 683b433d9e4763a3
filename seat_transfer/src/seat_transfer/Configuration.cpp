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

#include <seat_transfer/Configuration.hpp>

#include <stdexcept>
#include <string>

namespace seat_transfer {

namespace {
//==============================================================================
Duration validate(const Duration value, const char* name)
{
  if (value <= Duration::zero())
  {
    throw std::invalid_argument(
      std::string("[seat_transfer::Configuration] The ") + name
      + " must be positive, but was given "
      + std::to_string(time::to_seconds(value)) + "s");
  }

  return value;
}
} // anonymous namespace

//==============================================================================
const Duration Configuration::DefaultOfferWindow = std::chrono::minutes(2);

//==============================================================================
const Duration Configuration::DefaultSweepInterval = std::chrono::seconds(10);

//==============================================================================
class Configuration::Implementation
{
public:
  Duration offer_window;
  Duration sweep_interval;
};

//==============================================================================
Configuration::Configuration(
  const Duration offer_window,
  const Duration sweep_interval)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{
        validate(offer_window, "offer window"),
        validate(sweep_interval, "sweep interval")
      }))
{
  // Do nothing
}

//==============================================================================
Configuration& Configuration::offer_window(const Duration window)
{
  _pimpl->offer_window = validate(window, "offer window");
  return *this;
}

//==============================================================================
Duration Configuration::offer_window() const
{
  return _pimpl->offer_window;
}

//==============================================================================
Configuration& Configuration::sweep_interval(const Duration interval)
{
  _pimpl->sweep_interval = validate(interval, "sweep interval");
  return *this;
}

//==============================================================================
Duration Configuration::sweep_interval() const
{
  return _pimpl->sweep_interval;
}

} // namespace seat_transfer
