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

#ifndef SEAT_TRANSFER__WORKFLOW__TRANSFEREXPIRYWATCHER_HPP
#define SEAT_TRANSFER__WORKFLOW__TRANSFEREXPIRYWATCHER_HPP

#include <seat_transfer/workflow/TransferRequestManager.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace seat_transfer {
namespace workflow {

//==============================================================================
/// \brief Makes sure that no transfer request stays pending past its deadline,
/// even when nobody ever looks at it again.
///
/// sweep() can be called directly, or start() can be used to sweep on a
/// background thread once per sweep interval of the manager's Configuration.
class TransferExpiryWatcher
{
public:

  /// The source of the current time for background sweeps
  using Clock = std::function<Time()>;

  /// Constructor
  ///
  /// \param[in] manager
  ///   The manager whose requests will be swept.
  ///
  /// \param[in] clock
  ///   Used by the background thread to get the current time. If this is
  ///   empty, std::chrono::steady_clock::now is used.
  TransferExpiryWatcher(
    std::shared_ptr<TransferRequestManager> manager,
    Clock clock = nullptr);

  /// Expire every pending request whose deadline has passed. Sweeping again
  /// at the same time does nothing.
  ///
  /// \return the requests that were expired by this sweep.
  std::vector<TransferRequest> sweep(Time now);

  /// Start sweeping on a background thread. The first sweep happens right
  /// away. Does nothing if the thread is already running.
  void start();

  /// Stop the background thread and wait for it to finish. Does nothing if it
  /// is not running.
  void stop();

  /// True while the background thread is running.
  bool running() const;

  /// The number of sweeps the background thread has finished since the
  /// watcher was created.
  std::size_t completed_sweeps() const;

  /// The destructor stops the background thread.
  ~TransferExpiryWatcher();

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace workflow
} // namespace seat_transfer

#endif // SEAT_TRANSFER__WORKFLOW__TRANSFEREXPIRYWATCHER_HPP
