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
#include <seat_transfer/Result.hpp>
#include <seat_transfer/Ride.hpp>

#include <rmf_utils/catch.hpp>

SCENARIO("Configuration defaults and validation")
{
  using namespace std::chrono_literals;

  GIVEN("A default configuration")
  {
    seat_transfer::Configuration config;

    THEN("Offers last two minutes and sweeps run every ten seconds")
    {
      CHECK(config.offer_window() == 120s);
      CHECK(config.sweep_interval() == 10s);
    }

    WHEN("The values are changed")
    {
      config.offer_window(30s).sweep_interval(500ms);

      THEN("The new values are kept")
      {
        CHECK(config.offer_window() == 30s);
        CHECK(config.sweep_interval() == 500ms);
      }

      THEN("Copies are independent")
      {
        auto copy = config;
        copy.offer_window(5min);
        CHECK(config.offer_window() == 30s);
        CHECK(copy.offer_window() == 5min);
      }
    }

    WHEN("A non-positive duration is given")
    {
      CHECK_THROWS_AS(config.offer_window(0s), std::invalid_argument);
      CHECK_THROWS_AS(config.sweep_interval(-1s), std::invalid_argument);

      THEN("The previous values are untouched")
      {
        CHECK(config.offer_window() == 120s);
        CHECK(config.sweep_interval() == 10s);
      }
    }
  }

  CHECK_THROWS_AS(
    seat_transfer::Configuration(0s, 10s), std::invalid_argument);
}

SCENARIO("Ride snapshots reject inconsistent seat counts")
{
  const auto ride = seat_transfer::Ride::make(7, 3, 4, 1);
  CHECK(ride.id() == 7);
  CHECK(ride.driver() == 3);
  CHECK(ride.total_seats() == 4);
  CHECK(ride.available_seats() == 1);
  CHECK(ride.occupied_seats() == 3);
  CHECK(ride.active());

  CHECK_THROWS_AS(seat_transfer::Ride::make(1, 1, 0, 0), std::invalid_argument);
  CHECK_THROWS_AS(seat_transfer::Ride::make(1, 1, 2, 3), std::invalid_argument);
}

SCENARIO("Result holds either a value or a failure")
{
  using seat_transfer::ErrorCode;

  GIVEN("A result holding a value")
  {
    const seat_transfer::Result<int> result = 5;
    CHECK(result);
    CHECK(result.value() == 5);
    CHECK(*result == 5);
    CHECK_THROWS_AS(result.failure(), std::runtime_error);
  }

  GIVEN("A result holding a failure")
  {
    seat_transfer::Failure failure{ErrorCode::TargetRideFull, "No room"};
    failure.step = seat_transfer::SagaStep::ReserveTargetSeats;
    const seat_transfer::Result<int> result = failure;

    CHECK_FALSE(result);
    CHECK(result.error() == ErrorCode::TargetRideFull);
    REQUIRE(result.failure().step.has_value());
    CHECK(*result.failure().step == seat_transfer::SagaStep::ReserveTargetSeats);
    CHECK_FALSE(result.failure().resolved_status.has_value());
    CHECK_THROWS_AS(result.value(), std::runtime_error);
  }

  CHECK(std::string(seat_transfer::to_string(ErrorCode::AlreadyResolved))
    == "AlreadyResolved");
}
