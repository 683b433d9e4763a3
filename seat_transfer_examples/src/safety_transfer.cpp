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

#include <seat_transfer/BookingService.hpp>
#include <seat_transfer/storage/MemoryBookingStore.hpp>
#include <seat_transfer/storage/MemoryRideCapacityLedger.hpp>
#include <seat_transfer/workflow/TransferExpiryWatcher.hpp>
#include <seat_transfer/workflow/TransferResponseProcessor.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <unordered_set>

//==============================================================================
/// Offers the rides of verified drivers, the emptiest rides first.
class VerifiedDriverLocator : public seat_transfer::TransferCandidateLocator
{
public:

  VerifiedDriverLocator(
    std::shared_ptr<const seat_transfer::storage::MemoryRideCapacityLedger> rides,
    std::unordered_set<seat_transfer::DriverId> verified)
  : _rides(std::move(rides)),
    _verified(std::move(verified))
  {
    // Do nothing
  }

  std::vector<seat_transfer::TransferCandidate> locate(
    const seat_transfer::Booking& booking) final
  {
    std::vector<seat_transfer::TransferCandidate> candidates;
    for (const auto& ride : _rides->rides())
    {
      if (ride.id() == booking.ride() || !_verified.count(ride.driver()))
        continue;

      candidates.push_back(
        {
          ride.id(),
          seat_transfer::TransferPriority::Primary,
          0.8 + 0.05 * ride.available_seats(),
          "This driver has completed identity verification",
          {
            "Verified driver",
            std::to_string(ride.available_seats()) + " seats open"
          }
        });
    }

    std::sort(candidates.begin(), candidates.end(),
      [](const auto& a, const auto& b)
      {
        return a.compatibility_score > b.compatibility_score;
      });

    return candidates;
  }

private:
  std::shared_ptr<const seat_transfer::storage::MemoryRideCapacityLedger> _rides;
  std::unordered_set<seat_transfer::DriverId> _verified;
};

//==============================================================================
class PrintingObserver : public seat_transfer::workflow::TransferObserver
{
public:

  void transfer_offered(const seat_transfer::TransferRequest& request) final
  {
    std::cout << "Offered transfer #" << request.id() << " to ride "
              << request.target_ride() << ":";
    for (const auto& benefit : request.benefits())
      std::cout << " [" << benefit << "]";
    std::cout << std::endl;
  }

  void transfer_accepted(const seat_transfer::TransferRequest& request) final
  {
    std::cout << "Transfer #" << request.id() << " accepted, new booking "
              << *request.target_booking() << std::endl;
  }

  void transfer_declined(const seat_transfer::TransferRequest& request) final
  {
    std::cout << "Transfer #" << request.id() << " declined" << std::endl;
  }

  void transfer_expired(const seat_transfer::TransferRequest& request) final
  {
    std::cout << "Transfer #" << request.id() << " expired" << std::endl;
  }
};

//==============================================================================
void print_rides(const seat_transfer::storage::MemoryRideCapacityLedger& rides)
{
  for (const auto& ride : rides.rides())
  {
    std::cout << "  ride " << ride.id() << " (driver " << ride.driver()
              << "): " << ride.available_seats() << "/" << ride.total_seats()
              << " seats available" << std::endl;
  }
}

//==============================================================================
int main()
{
  using namespace std::chrono_literals;
  using seat_transfer::workflow::Decision;

  auto rides = std::make_shared<seat_transfer::storage::MemoryRideCapacityLedger>();
  auto bookings = std::make_shared<seat_transfer::storage::MemoryBookingStore>();
  auto reconciliation = std::make_shared<seat_transfer::ReconciliationLog>();

  const seat_transfer::DriverId unverified_driver = 1;
  const seat_transfer::DriverId verified_driver = 2;
  const seat_transfer::DriverId busy_verified_driver = 3;

  const auto original = rides->add_ride(unverified_driver, 3).id();
  rides->add_ride(verified_driver, 4);
  const auto busy = rides->add_ride(busy_verified_driver, 2).id();

  seat_transfer::BookingService service(bookings, rides, reconciliation);
  if (!service.book(90, busy, 2, 30.0))
  {
    std::cout << "Failed to fill the busy ride!" << std::endl;
    return 1;
  }

  const auto booking = service.book(100, original, 2, 42.0, "Two backpacks");
  if (!booking)
  {
    std::cout << "Booking failed: " << booking.failure().message << std::endl;
    return 1;
  }

  std::cout << "Before the transfer:" << std::endl;
  print_rides(*rides);

  auto manager = std::make_shared<seat_transfer::workflow::TransferRequestManager>(
    bookings, rides, seat_transfer::Configuration().offer_window(90s));

  auto observer = std::make_shared<PrintingObserver>();
  manager->add_observer(observer);

  seat_transfer::workflow::TransferExpiryWatcher watcher(manager);
  watcher.start();

  seat_transfer::workflow::TransferResponseProcessor processor(
    manager, bookings, rides, reconciliation);

  const auto now = std::chrono::steady_clock::now();
  VerifiedDriverLocator locator(rides, {verified_driver, busy_verified_driver});
  const auto request = manager->offer(booking->id(), locator, now);
  if (!request)
  {
    std::cout << "No transfer offered: " << request.failure().message
              << std::endl;
    return 1;
  }

  std::cout << "Passenger has "
            << seat_transfer::time::to_seconds(request->time_remaining(now + 15s))
            << "s left to answer" << std::endl;

  const auto outcome = processor.respond(
    request->id(), booking->passenger(), Decision::Accept, now + 15s);

  if (!outcome)
  {
    std::cout << "Transfer failed: " << outcome.failure().message << std::endl;
    return 1;
  }

  std::cout << "After the transfer:" << std::endl;
  print_rides(*rides);

  watcher.stop();

  if (!reconciliation->empty())
  {
    std::cout << reconciliation->size() << " items need reconciliation"
              << std::endl;
  }

  return 0;
}
