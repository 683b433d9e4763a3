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

#include <seat_transfer/storage/MemoryRideCapacityLedger.hpp>

#include <rmf_utils/catch.hpp>

#include <thread>

SCENARIO("Seat counters in the memory ledger")
{
  using seat_transfer::storage::CapacityChange;

  seat_transfer::storage::MemoryRideCapacityLedger ledger;

  GIVEN("A posted ride with four seats")
  {
    const auto ride = ledger.add_ride(42, 4);
    CHECK(ride.driver() == 42);
    CHECK(ride.total_seats() == 4);
    CHECK(ride.available_seats() == 4);
    CHECK(ride.active());

    WHEN("Three seats are reserved")
    {
      CHECK(ledger.reserve(ride.id(), 3) == CapacityChange::Applied);

      THEN("Only one seat is left")
      {
        CHECK(ledger.get(ride.id())->available_seats() == 1);
        CHECK(ledger.get(ride.id())->occupied_seats() == 3);
      }

      THEN("A reservation larger than what is left changes nothing")
      {
        CHECK(ledger.reserve(ride.id(), 2) == CapacityChange::InsufficientSeats);
        CHECK(ledger.get(ride.id())->available_seats() == 1);
      }

      THEN("Releasing more seats than are taken changes nothing")
      {
        CHECK(ledger.release(ride.id(), 4) == CapacityChange::ExceedsTotal);
        CHECK(ledger.get(ride.id())->available_seats() == 1);
      }

      THEN("Releasing the taken seats restores the ride")
      {
        CHECK(ledger.release(ride.id(), 3) == CapacityChange::Applied);
        CHECK(ledger.get(ride.id())->available_seats() == 4);
      }
    }

    WHEN("The ride is retired")
    {
      CHECK(ledger.reserve(ride.id(), 2) == CapacityChange::Applied);
      CHECK(ledger.retire(ride.id()));

      THEN("It takes no new reservations but still accepts releases")
      {
        CHECK_FALSE(ledger.get(ride.id())->active());
        CHECK(ledger.reserve(ride.id(), 1) == CapacityChange::Retired);
        CHECK(ledger.release(ride.id(), 2) == CapacityChange::Applied);
        CHECK(ledger.get(ride.id())->available_seats() == 4);
      }
    }
  }

  GIVEN("A ride id that was never posted")
  {
    CHECK_FALSE(ledger.get(99).has_value());
    CHECK(ledger.reserve(99, 1) == CapacityChange::UnknownRide);
    CHECK(ledger.release(99, 1) == CapacityChange::UnknownRide);
    CHECK_FALSE(ledger.retire(99));
  }

  GIVEN("Several rides")
  {
    const auto first = ledger.add_ride(1, 2);
    const auto second = ledger.add_ride(2, 3);
    CHECK(first.id() != second.id());

    const auto rides = ledger.rides();
    REQUIRE(rides.size() == 2);
    CHECK(rides[0].id() == first.id());
    CHECK(rides[1].id() == second.id());
  }

  CHECK_THROWS_AS(ledger.add_ride(1, 0), std::invalid_argument);
}

SCENARIO("Concurrent reservations never oversell a ride")
{
  using seat_transfer::storage::CapacityChange;

  seat_transfer::storage::MemoryRideCapacityLedger ledger;
  const auto ride = ledger.add_ride(1, 10);

  std::vector<std::thread> threads;
  std::vector<CapacityChange> outcomes(40, CapacityChange::Unavailable);
  for (std::size_t i = 0; i < outcomes.size(); ++i)
  {
    threads.emplace_back(
      [&ledger, &outcomes, i, id = ride.id()]()
      {
        outcomes[i] = ledger.reserve(id, 1);
      });
  }

  for (auto& t : threads)
    t.join();

  std::size_t applied = 0;
  for (const auto outcome : outcomes)
  {
    if (outcome == CapacityChange::Applied)
      ++applied;
    else
      CHECK(outcome == CapacityChange::InsufficientSeats);
  }

  CHECK(applied == 10);
  CHECK(ledger.get(ride.id())->available_seats() == 0);
}
