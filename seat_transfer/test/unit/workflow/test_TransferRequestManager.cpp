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

#include "../utils_Storage.hpp"

#include <seat_transfer/workflow/TransferRequestManager.hpp>

#include <rmf_utils/catch.hpp>

SCENARIO("Opening transfer requests")
{
  using namespace std::chrono_literals;
  using seat_transfer::ErrorCode;
  using seat_transfer::TransferStatus;

  Marketplace market;
  auto observer = std::make_shared<RecordingObserver>();
  market.manager->add_observer(observer);

  const auto original_ride = market.post(4);
  const auto target_ride = market.post(4);
  const auto booking = market.book(50, original_ride, 2, 36.0);
  const seat_transfer::Time now = std::chrono::steady_clock::now();

  GIVEN("A confirmed booking and a candidate ride")
  {
    const auto request = market.manager->open(
      booking, make_candidate(target_ride), now);

    REQUIRE(request);

    THEN("The request is pending with a deadline two minutes out")
    {
      CHECK(request->status() == TransferStatus::Pending);
      CHECK(request->original_booking() == booking);
      CHECK(request->original_ride() == original_ride);
      CHECK(request->target_ride() == target_ride);
      CHECK(request->passenger() == 50);
      CHECK(request->priority() == seat_transfer::TransferPriority::Primary);
      CHECK(request->reason() == "Driver has a verified safety record");
      REQUIRE(request->benefits().size() == 2);
      CHECK(request->benefits()[0] == "Verified driver");
      CHECK(request->created_at() == now);
      CHECK(request->deadline() == now + 120s);
      CHECK_FALSE(request->responded_at().has_value());
      CHECK_FALSE(request->target_booking().has_value());
      CHECK(request->time_remaining(now + 20s) == 100s);
      CHECK(request->time_remaining(now + 10min) == seat_transfer::Duration(0));
      CHECK_FALSE(request->overdue(now + 119s));
      CHECK(request->overdue(now + 120s));

      REQUIRE(observer->offered.size() == 1);
      CHECK(observer->offered.front() == request->id());
    }

    THEN("Opening nothing changes the seats")
    {
      CHECK(market.available(original_ride) == 2);
      CHECK(market.available(target_ride) == 4);
    }

    THEN("A second request for the same booking is a conflict")
    {
      const auto second = market.manager->open(
        booking, make_candidate(target_ride), now + 5s);
      REQUIRE_FALSE(second);
      CHECK(second.error() == ErrorCode::ConflictingRequest);
      CHECK(market.manager->requests_for_booking(booking).size() == 1);
    }

    THEN("A new request may be opened once the old one has run out")
    {
      const auto second = market.manager->open(
        booking, make_candidate(target_ride), now + 121s);
      REQUIRE(second);
      CHECK(second->id() != request->id());
      CHECK(market.manager->get(request->id())->status()
        == TransferStatus::Expired);
      CHECK(observer->expired == std::vector<seat_transfer::TransferRequestId>{
          request->id()});
      CHECK(market.manager->pending_for_booking(booking)->id() == second->id());
    }

    THEN("The request can be looked up by its passenger only")
    {
      const auto mine = market.manager->lookup(request->id(), 50, now + 1s);
      REQUIRE(mine);
      CHECK(mine->id() == request->id());

      const auto theirs = market.manager->lookup(request->id(), 51, now + 1s);
      REQUIRE_FALSE(theirs);
      CHECK(theirs.error() == ErrorCode::NotFound);

      CHECK(market.manager->lookup(9999, 50, now).error() == ErrorCode::NotFound);
    }

    THEN("Reading the request after its deadline expires it")
    {
      const auto late = market.manager->lookup(request->id(), 50, now + 130s);
      REQUIRE(late);
      CHECK(late->status() == TransferStatus::Expired);
      CHECK_FALSE(late->responded_at().has_value());
      CHECK_FALSE(market.manager->pending_for_booking(booking).has_value());

      const auto actionable =
        market.manager->lookup_actionable(request->id(), 50, now + 130s);
      REQUIRE_FALSE(actionable);
      CHECK(actionable.error() == ErrorCode::NotFound);
      CHECK(actionable.failure().resolved_status == TransferStatus::Expired);

      CHECK(observer->expired.size() == 1);
    }

    THEN("A pending request is actionable before its deadline")
    {
      CHECK(market.manager->lookup_actionable(request->id(), 50, now + 60s));
    }
  }

  GIVEN("Bookings and rides that cannot be transferred")
  {
    const auto pending = market.bookings.hold(51, original_ride, 1, 18.0);
    REQUIRE(pending);

    CHECK(market.manager->open(9999, make_candidate(target_ride), now).error()
      == ErrorCode::NotFound);
    CHECK(market.manager->open(
        pending->id(), make_candidate(target_ride), now).error()
      == ErrorCode::InvalidBooking);
    CHECK(market.manager->open(booking, make_candidate(9999), now).error()
      == ErrorCode::RideUnavailable);
    CHECK(market.manager->open(
        booking, make_candidate(original_ride), now).error()
      == ErrorCode::RideUnavailable);

    REQUIRE(market.ledger->retire(target_ride));
    CHECK(market.manager->open(booking, make_candidate(target_ride), now)
      .error() == ErrorCode::RideUnavailable);

    CHECK(market.manager->requests_for_booking(booking).empty());
    CHECK(observer->offered.empty());
  }
}

SCENARIO("Offering the best candidate a locator can find")
{
  using namespace std::chrono_literals;
  using seat_transfer::ErrorCode;

  Marketplace market(seat_transfer::Configuration().offer_window(30s));
  const auto original_ride = market.post(4);
  const auto full_ride = market.post(2);
  const auto retired_ride = market.post(4);
  const auto open_ride = market.post(4);
  const auto other_open_ride = market.post(4);

  market.book(60, full_ride, 1);
  REQUIRE(market.ledger->retire(retired_ride));
  const auto booking = market.book(61, original_ride, 2);
  const seat_transfer::Time now = std::chrono::steady_clock::now();

  GIVEN("A ranking that starts with rides that cannot take the booking")
  {
    StubLocator locator({
        make_candidate(original_ride),
        make_candidate(full_ride),
        make_candidate(retired_ride),
        make_candidate(9999),
        make_candidate(open_ride, seat_transfer::TransferPriority::Secondary),
        make_candidate(other_open_ride)
      });

    const auto request = market.manager->offer(booking, locator, now);

    THEN("The first candidate that fits is offered")
    {
      REQUIRE(request);
      CHECK(locator.calls == 1);
      CHECK(request->target_ride() == open_ride);
      CHECK(request->priority() == seat_transfer::TransferPriority::Secondary);
      CHECK(request->deadline() == now + 30s);
    }

    THEN("Offering again conflicts with the pending request")
    {
      const auto again = market.manager->offer(booking, locator, now + 1s);
      REQUIRE_FALSE(again);
      CHECK(again.error() == ErrorCode::ConflictingRequest);
    }
  }

  GIVEN("A locator with nothing useful")
  {
    StubLocator locator({make_candidate(full_ride)});
    const auto request = market.manager->offer(booking, locator, now);
    REQUIRE_FALSE(request);
    CHECK(request.error() == ErrorCode::NoCandidate);
    CHECK_FALSE(market.manager->pending_for_booking(booking).has_value());
  }

  GIVEN("A booking that is not confirmed")
  {
    StubLocator locator({make_candidate(open_ride)});
    REQUIRE(market.bookings.cancel(booking));
    const auto request = market.manager->offer(booking, locator, now);
    REQUIRE_FALSE(request);
    CHECK(request.error() == ErrorCode::InvalidBooking);
    CHECK(locator.calls == 0);
  }
}

SCENARIO("Claims serialize responses to the same request")
{
  using namespace std::chrono_literals;
  using seat_transfer::ErrorCode;
  using seat_transfer::TransferStatus;

  Marketplace market;
  const auto original_ride = market.post(4);
  const auto target_ride = market.post(4);
  const auto booking = market.book(70, original_ride, 1);
  const seat_transfer::Time now = std::chrono::steady_clock::now();

  const auto request = market.manager->open(
    booking, make_candidate(target_ride), now);
  REQUIRE(request);

  GIVEN("A claimed request")
  {
    const auto claimed = market.manager->claim(request->id(), 70, now + 1s);
    REQUIRE(claimed);

    THEN("The sweep leaves it alone even past its deadline")
    {
      CHECK(market.manager->expire_overdue(now + 10min).empty());
      CHECK(market.manager->get(request->id())->status()
        == TransferStatus::Pending);
    }

    THEN("Resolving needs a passenger decision")
    {
      CHECK_FALSE(market.manager->resolve(
          request->id(), TransferStatus::Expired, std::nullopt, now + 2s));
      CHECK_FALSE(market.manager->resolve(
          request->id(), TransferStatus::Pending, std::nullopt, now + 2s));
    }

    WHEN("It is released")
    {
      market.manager->release(request->id());

      THEN("It can be claimed again")
      {
        CHECK(market.manager->claim(request->id(), 70, now + 2s));
      }

      THEN("It can no longer be resolved without a new claim")
      {
        CHECK_FALSE(market.manager->resolve(
            request->id(), TransferStatus::Declined, std::nullopt, now + 2s));
      }
    }

    WHEN("It is resolved")
    {
      const auto resolved = market.manager->resolve(
        request->id(), TransferStatus::Declined, std::nullopt, now + 3s);
      REQUIRE(resolved);

      THEN("The response time is recorded and later claims see the result")
      {
        CHECK(resolved->status() == TransferStatus::Declined);
        CHECK(resolved->responded_at() == now + 3s);

        const auto late = market.manager->claim(request->id(), 70, now + 4s);
        REQUIRE_FALSE(late);
        CHECK(late.error() == ErrorCode::AlreadyResolved);
        CHECK(late.failure().resolved_status == TransferStatus::Declined);
      }
    }
  }

  GIVEN("A claim attempted after the deadline")
  {
    const auto late = market.manager->claim(request->id(), 70, now + 120s);

    THEN("The request is expired instead")
    {
      REQUIRE_FALSE(late);
      CHECK(late.error() == ErrorCode::AlreadyResolved);
      CHECK(late.failure().resolved_status == TransferStatus::Expired);
      CHECK(market.manager->get(request->id())->status()
        == TransferStatus::Expired);
    }
  }

  GIVEN("A claim from someone else")
  {
    CHECK(market.manager->claim(request->id(), 71, now).error()
      == ErrorCode::NotFound);
  }
}

SCENARIO("Observers that fail do not affect the workflow")
{
  Marketplace market;
  auto throwing = std::make_shared<ThrowingObserver>();
  auto recording = std::make_shared<RecordingObserver>();
  market.manager->add_observer(throwing);
  market.manager->add_observer(recording);

  const auto booking = market.book(80, market.post(3), 1);
  const auto target_ride = market.post(3);
  const seat_transfer::Time now = std::chrono::steady_clock::now();

  const auto request = market.manager->open(
    booking, make_candidate(target_ride), now);
  REQUIRE(request);
  CHECK(recording->offered.size() == 1);

  WHEN("An observer goes away")
  {
    recording.reset();

    THEN("It is no longer notified")
    {
      CHECK(market.manager->expire_overdue(
          now + std::chrono::minutes(5)).size() == 1);
    }
  }
}
