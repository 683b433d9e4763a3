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

#include <seat_transfer/workflow/TransferExpiryWatcher.hpp>

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace seat_transfer {
namespace workflow {

//==============================================================================
class TransferExpiryWatcher::Implementation
{
public:

  std::shared_ptr<TransferRequestManager> manager;
  TransferExpiryWatcher::Clock clock;

  // Serializes start() and stop()
  std::mutex control_mutex;
  std::thread thread;

  mutable std::mutex mutex;
  std::condition_variable wakeup;
  bool stop_requested = false;
  bool active = false;
  std::size_t completed_sweeps = 0;

  //============================================================================
  void run()
  {
    const Duration interval = manager->configuration().sweep_interval();
    std::unique_lock<std::mutex> lock(mutex);
    while (!stop_requested)
    {
      lock.unlock();
      try
      {
        manager->expire_overdue(clock());
      }
      catch (const std::exception& e)
      {
        std::cerr << "[TransferExpiryWatcher::run] Sweep failed and will be "
                  << "tried again next interval: " << e.what() << std::endl;
      }
      catch (...)
      {
        std::cerr << "[TransferExpiryWatcher::run] Sweep failed with an "
                  << "unknown exception and will be tried again next "
                  << "interval" << std::endl;
      }
      lock.lock();

      ++completed_sweeps;
      wakeup.wait_for(lock, interval, [&]() { return stop_requested; });
    }

    active = false;
  }
};

//==============================================================================
TransferExpiryWatcher::TransferExpiryWatcher(
  std::shared_ptr<TransferRequestManager> manager,
  Clock clock)
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  if (!manager)
  {
    throw std::invalid_argument(
      "[TransferExpiryWatcher] A TransferRequestManager must be provided");
  }

  _pimpl->manager = std::move(manager);
  _pimpl->clock = clock ? std::move(clock) :
    Clock([]() { return std::chrono::steady_clock::now(); });
}

//==============================================================================
std::vector<TransferRequest> TransferExpiryWatcher::sweep(const Time now)
{
  return _pimpl->manager->expire_overdue(now);
}

//==============================================================================
void TransferExpiryWatcher::start()
{
  std::lock_guard<std::mutex> control(_pimpl->control_mutex);
  if (_pimpl->thread.joinable())
    return;

  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    _pimpl->stop_requested = false;
    _pimpl->active = true;
  }

  _pimpl->thread = std::thread(&Implementation::run, _pimpl.get());
}

//==============================================================================
void TransferExpiryWatcher::stop()
{
  std::lock_guard<std::mutex> control(_pimpl->control_mutex);
  if (!_pimpl->thread.joinable())
    return;

  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    _pimpl->stop_requested = true;
  }

  _pimpl->wakeup.notify_all();
  _pimpl->thread.join();
}

//==============================================================================
bool TransferExpiryWatcher::running() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->active;
}

//==============================================================================
std::size_t TransferExpiryWatcher::completed_sweeps() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->completed_sweeps;
}

//==============================================================================
TransferExpiryWatcher::~TransferExpiryWatcher()
{
  stop();
}

} // namespace workflow
} // namespace seat_transfer
