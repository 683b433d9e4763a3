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

#include <seat_transfer/workflow/TransferRequestManager.hpp>

#include "../internal_TransferRequest.hpp"

#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace seat_transfer {
namespace workflow {

//==============================================================================
class TransferRequestManager::Implementation
{
public:

  struct Record
  {
    TransferRequest::Implementation data;

    // True while a response is being applied to this request
    bool claimed = false;
  };

  enum class Event
  {
    Offered,
    Accepted,
    Declined,
    Expired
  };

  std::shared_ptr<const storage::BookingStore> bookings;
  std::shared_ptr<const storage::RideCapacityLedger> rides;
  Configuration config;

  mutable std::mutex mutex;
  std::condition_variable claim_released;

  // std::map keeps iterators valid while claim() waits on the condition
  std::map<TransferRequestId, Record> records;
  std::unordered_map<BookingId, TransferRequestId> pending_by_booking;
  TransferRequestId next_id = 1;

  std::mutex observer_mutex;
  std::vector<std::weak_ptr<TransferObserver>> observers;

  Implementation(
    std::shared_ptr<const storage::BookingStore> bookings_,
    std::shared_ptr<const storage::RideCapacityLedger> rides_,
    Configuration config_)
  : bookings(std::move(bookings_)),
    rides(std::move(rides_)),
    config(std::move(config_))
  {
    // Do nothing
  }

  //============================================================================
  static TransferRequest snapshot(const Record& record)
  {
    return TransferRequest::Implementation::make(record.data);
  }

  //============================================================================
  // The caller must hold the mutex
  TransferRequest expire(Record& record)
  {
    record.data.status = TransferStatus::Expired;
    pending_by_booking.erase(record.data.original_booking);
    return snapshot(record);
  }

  //============================================================================
  static Failure not_found(const TransferRequestId id)
  {
    return Failure{
      ErrorCode::NotFound,
      "Transfer request [" + std::to_string(id) + "] was not found"};
  }

  //============================================================================
  static Failure already_resolved(const Record& record)
  {
    Failure failure{
      ErrorCode::AlreadyResolved,
      "Transfer request [" + std::to_string(record.data.id) + "] is already "
      + to_string(record.data.status)};
    failure.resolved_status = record.data.status;
    return failure;
  }

  //============================================================================
  std::optional<Failure> check_target(
    const Booking& booking,
    const RideId target) const
  {
    const auto ride = rides->get(target);
    if (!ride.has_value() || !ride->active())
    {
      return Failure{
        ErrorCode::RideUnavailable,
        "Target ride [" + std::to_string(target) + "] is not available"};
    }

    if (target == booking.ride())
    {
      return Failure{
        ErrorCode::RideUnavailable,
        "Booking [" + std::to_string(booking.id()) + "] is already on ride ["
        + std::to_string(target) + "]"};
    }

    return std::nullopt;
  }

  //============================================================================
  Result<Booking> transferable_booking(const BookingId booking_id) const
  {
    const auto booking = bookings->get(booking_id);
    if (!booking.has_value())
    {
      return Failure{
        ErrorCode::NotFound,
        "Booking [" + std::to_string(booking_id) + "] does not exist"};
    }

    if (booking->status() != BookingStatus::Confirmed)
    {
      return Failure{
        ErrorCode::InvalidBooking,
        "Booking [" + std::to_string(booking_id) + "] is "
        + to_string(booking->status()) + ", only confirmed bookings can be "
        "transferred"};
    }

    return *booking;
  }

  //============================================================================
  void notify(const Event event, const TransferRequest& request)
  {
    std::vector<std::shared_ptr<TransferObserver>> live;
    {
      std::lock_guard<std::mutex> lock(observer_mutex);
      auto it = observers.begin();
      while (it != observers.end())
      {
        if (auto observer = it->lock())
        {
          live.push_back(std::move(observer));
          ++it;
        }
        else
        {
          it = observers.erase(it);
        }
      }
    }

    for (const auto& observer : live)
    {
      try
      {
        switch (event)
        {
          case Event::Offered: observer->transfer_offered(request); break;
          case Event::Accepted: observer->transfer_accepted(request); break;
          case Event::Declined: observer->transfer_declined(request); break;
          case Event::Expired: observer->transfer_expired(request); break;
        }
      }
      catch (const std::exception& e)
      {
        std::cerr << "[TransferRequestManager::notify] An observer failed to "
                  << "handle a change of transfer request [" << request.id()
                  << "] to status [" << to_string(request.status()) << "]: "
                  << e.what() << std::endl;
      }
      catch (...)
      {
        std::cerr << "[TransferRequestManager::notify] An observer threw an "
                  << "unknown exception while handling a change of transfer "
                  << "request [" << request.id() << "] to status ["
                  << to_string(request.status()) << "]" << std::endl;
      }
    }
  }
};

//==============================================================================
TransferRequestManager::TransferRequestManager(
  std::shared_ptr<const storage::BookingStore> bookings,
  std::shared_ptr<const storage::RideCapacityLedger> rides,
  Configuration config)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(
      std::move(bookings), std::move(rides), std::move(config)))
{
  // Do nothing
}

//==============================================================================
Result<TransferRequest> TransferRequestManager::open(
  const BookingId booking_id,
  const TransferCandidate& candidate,
  const Time now)
{
  const auto booking = _pimpl->transferable_booking(booking_id);
  if (!booking)
    return booking.failure();

  if (const auto failure = _pimpl->check_target(*booking, candidate.target_ride))
    return *failure;

  std::optional<TransferRequest> expired;
  std::optional<TransferRequest> created;
  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    const auto pending = _pimpl->pending_by_booking.find(booking_id);
    if (pending != _pimpl->pending_by_booking.end())
    {
      auto& existing = _pimpl->records.at(pending->second);
      if (existing.claimed || now < existing.data.deadline)
      {
        return Failure{
          ErrorCode::ConflictingRequest,
          "Booking [" + std::to_string(booking_id) + "] already has pending "
          "transfer request [" + std::to_string(existing.data.id) + "]"};
      }

      // The earlier offer ran out but has not been swept yet
      expired = _pimpl->expire(existing);
    }

    const TransferRequestId id = _pimpl->next_id++;
    Implementation::Record record;
    auto& data = record.data;
    data.id = id;
    data.original_booking = booking_id;
    data.original_ride = booking->ride();
    data.target_ride = candidate.target_ride;
    data.passenger = booking->passenger();
    data.status = TransferStatus::Pending;
    data.priority = candidate.priority;
    data.reason = candidate.reason;
    data.benefits = candidate.benefits;
    data.created_at = now;
    data.deadline = now + _pimpl->config.offer_window();

    const auto& stored = _pimpl->records.insert({id, std::move(record)})
      .first->second;
    _pimpl->pending_by_booking[booking_id] = id;
    created = Implementation::snapshot(stored);
  }

  if (expired.has_value())
    _pimpl->notify(Implementation::Event::Expired, *expired);

  _pimpl->notify(Implementation::Event::Offered, *created);
  return *created;
}

//==============================================================================
Result<TransferRequest> TransferRequestManager::offer(
  const BookingId booking_id,
  TransferCandidateLocator& locator,
  const Time now)
{
  const auto booking = _pimpl->transferable_booking(booking_id);
  if (!booking)
    return booking.failure();

  for (const auto& candidate : locator.locate(*booking))
  {
    if (_pimpl->check_target(*booking, candidate.target_ride).has_value())
      continue;

    const auto ride = _pimpl->rides->get(candidate.target_ride);
    if (!ride.has_value() || ride->available_seats() < booking->seats())
      continue;

    return open(booking_id, candidate, now);
  }

  return Failure{
    ErrorCode::NoCandidate,
    "No transfer candidate can take booking [" + std::to_string(booking_id)
    + "]"};
}

//==============================================================================
Result<TransferRequest> TransferRequestManager::lookup(
  const TransferRequestId request,
  const PassengerId passenger,
  const Time now)
{
  std::optional<TransferRequest> expired;
  std::optional<TransferRequest> found;
  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    const auto it = _pimpl->records.find(request);
    if (it == _pimpl->records.end() || it->second.data.passenger != passenger)
      return Implementation::not_found(request);

    auto& record = it->second;
    if (!record.claimed && record.data.status == TransferStatus::Pending
      && now >= record.data.deadline)
    {
      expired = _pimpl->expire(record);
    }

    found = Implementation::snapshot(record);
  }

  if (expired.has_value())
    _pimpl->notify(Implementation::Event::Expired, *expired);

  return *found;
}

//==============================================================================
Result<TransferRequest> TransferRequestManager::lookup_actionable(
  const TransferRequestId request,
  const PassengerId passenger,
  const Time now)
{
  auto found = lookup(request, passenger, now);
  if (!found)
    return found;

  if (found->status() != TransferStatus::Pending)
  {
    Failure failure = Implementation::not_found(request);
    failure.message += ": it is " + std::string(to_string(found->status()));
    failure.resolved_status = found->status();
    return failure;
  }

  return found;
}

//==============================================================================
std::optional<TransferRequest> TransferRequestManager::get(
  const TransferRequestId request) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->records.find(request);
  if (it == _pimpl->records.end())
    return std::nullopt;

  return Implementation::snapshot(it->second);
}

//==============================================================================
std::vector<TransferRequest> TransferRequestManager::requests_for_booking(
  const BookingId booking) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  std::vector<TransferRequest> output;
  for (const auto& [id, record] : _pimpl->records)
  {
    if (record.data.original_booking == booking)
      output.push_back(Implementation::snapshot(record));
  }

  return output;
}

//==============================================================================
std::optional<TransferRequest> TransferRequestManager::pending_for_booking(
  const BookingId booking) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->pending_by_booking.find(booking);
  if (it == _pimpl->pending_by_booking.end())
    return std::nullopt;

  return Implementation::snapshot(_pimpl->records.at(it->second));
}

//==============================================================================
std::vector<TransferRequest> TransferRequestManager::expire_overdue(
  const Time now)
{
  std::map<TransferRequestId, TransferRequest> expired;
  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    auto it = _pimpl->pending_by_booking.begin();
    while (it != _pimpl->pending_by_booking.end())
    {
      auto& record = _pimpl->records.at(it->second);
      if (record.claimed || now < record.data.deadline)
      {
        ++it;
        continue;
      }

      record.data.status = TransferStatus::Expired;
      expired.insert({record.data.id, Implementation::snapshot(record)});
      it = _pimpl->pending_by_booking.erase(it);
    }
  }

  std::vector<TransferRequest> output;
  output.reserve(expired.size());
  for (auto& [id, request] : expired)
  {
    _pimpl->notify(Implementation::Event::Expired, request);
    output.push_back(std::move(request));
  }

  return output;
}

//==============================================================================
Result<TransferRequest> TransferRequestManager::claim(
  const TransferRequestId request,
  const PassengerId passenger,
  const Time now)
{
  std::optional<TransferRequest> expired;
  auto result = [&]() -> Result<TransferRequest>
    {
      std::unique_lock<std::mutex> lock(_pimpl->mutex);
      const auto it = _pimpl->records.find(request);
      if (it == _pimpl->records.end() || it->second.data.passenger != passenger)
        return Implementation::not_found(request);

      auto& record = it->second;
      _pimpl->claim_released.wait(lock, [&]() { return !record.claimed; });

      if (is_terminal(record.data.status))
        return Implementation::already_resolved(record);

      if (now >= record.data.deadline)
      {
        expired = _pimpl->expire(record);
        return Implementation::already_resolved(record);
      }

      record.claimed = true;
      return Implementation::snapshot(record);
    } ();

  if (expired.has_value())
    _pimpl->notify(Implementation::Event::Expired, *expired);

  return result;
}

//==============================================================================
void TransferRequestManager::release(const TransferRequestId request)
{
  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    const auto it = _pimpl->records.find(request);
    if (it == _pimpl->records.end() || !it->second.claimed)
      return;

    it->second.claimed = false;
  }

  _pimpl->claim_released.notify_all();
}

//==============================================================================
std::optional<TransferRequest> TransferRequestManager::resolve(
  const TransferRequestId request,
  const TransferStatus status,
  const std::optional<BookingId> target_booking,
  const Time now)
{
  if (status != TransferStatus::Accepted && status != TransferStatus::Declined)
  {
    std::cerr << "[TransferRequestManager::resolve] Transfer request ["
              << request << "] cannot be resolved as [" << to_string(status)
              << "]. Only accepted and declined are passenger decisions."
              << std::endl;
    return std::nullopt;
  }

  std::optional<TransferRequest> resolved;
  {
    std::lock_guard<std::mutex> lock(_pimpl->mutex);
    const auto it = _pimpl->records.find(request);
    if (it == _pimpl->records.end() || !it->second.claimed)
      return std::nullopt;

    auto& record = it->second;
    record.data.status = status;
    record.data.responded_at = now;
    if (status == TransferStatus::Accepted)
      record.data.target_booking = target_booking;

    record.claimed = false;
    _pimpl->pending_by_booking.erase(record.data.original_booking);
    resolved = Implementation::snapshot(record);
  }

  _pimpl->claim_released.notify_all();
  _pimpl->notify(
    status == TransferStatus::Accepted ?
    Implementation::Event::Accepted : Implementation::Event::Declined,
    *resolved);

  return resolved;
}

//==============================================================================
void TransferRequestManager::add_observer(
  std::weak_ptr<TransferObserver> observer)
{
  std::lock_guard<std::mutex> lock(_pimpl->observer_mutex);
  _pimpl->observers.push_back(std::move(observer));
}

//==============================================================================
const Configuration& TransferRequestManager::configuration() const
{
  return _pimpl->config;
}

} // namespace workflow
} // namespace seat_transfer
