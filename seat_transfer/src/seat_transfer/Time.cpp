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

#include <seat_transfer/Time.hpp>

namespace seat_transfer {
namespace time {

//==============================================================================
double to_seconds(const Duration delta_t)
{
  using Sec64 = std::chrono::duration<double>;
  return std::chrono::duration_cast<Sec64>(delta_t).count();
}

//==============================================================================
Duration from_seconds(const double delta_t)
{
  using Sec64 = std::chrono::duration<double>;
  return std::chrono::duration_cast<Duration>(Sec64(delta_t));
}

} // namespace time
} // namespace seat_transfer
