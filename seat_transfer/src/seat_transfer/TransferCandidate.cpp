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

#include <seat_transfer/TransferCandidate.hpp>

namespace seat_transfer {

//==============================================================================
const char* to_string(const TransferPriority priority)
{
  switch (priority)
  {
    case TransferPriority::Primary: return "primary";
    case TransferPriority::Secondary: return "secondary";
  }

  return "unknown";
}

} // namespace seat_transfer
