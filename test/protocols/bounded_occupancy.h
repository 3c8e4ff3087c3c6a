#include <catch2/catch.hpp>
#include <philo/protocols/bounded_occupancy.h>
#include <philo/table.h>
#include "../support/eventually.h"
#include "../support/ledger.h"

#include <chrono>
#include <future>

TEST_CASE("Gate counts the permits that are out", "[occupancy]") {
	using namespace philo;

	protocols::admission_gate gate;
	gate.reset(2);
	REQUIRE(gate.capacity() == 2);
	{
		protocols::admission_gate::permit first{ gate, concurrent::forever() };
		protocols::admission_gate::permit second{ gate, concurrent::forever() };
		protocols::admission_gate::permit third{ gate, concurrent::deadline_after(std::chrono::milliseconds(10)) };
		REQUIRE(first.owns());
		REQUIRE(second.owns());
		REQUIRE(third.status() == acquire_status::timed_out);
		REQUIRE(gate.issued() == 2);
	}
	REQUIRE(gate.issued() == 0);
	REQUIRE(gate.peak() == 2);
	REQUIRE_THROWS_AS(gate.leave(), state_corruption);
}

TEST_CASE("Only n-1 philosophers get to the table", "[occupancy]") {
	using namespace philo;

	testing::ledger ledger{ 5 };
	protocols::bounded_occupancy room;
	room.set_listener(&ledger);
	room.start(5);
	REQUIRE(room.gate().capacity() == 4);

	REQUIRE(room.acquire_pair(0));
	REQUIRE(room.acquire_pair(2));
	// both get in and then wait for a fork of an eating neighbour
	auto one = std::async(std::launch::async, [&room] { return room.acquire_pair_until(1, concurrent::forever()); });
	auto three = std::async(std::launch::async, [&room] { return room.acquire_pair_until(3, concurrent::forever()); });
	REQUIRE(testing::eventually([&room] { return room.gate().issued() == 4; }));

	// the fifth is not even let in
	REQUIRE(room.try_acquire_pair_for(4, std::chrono::milliseconds(20)) == acquire_status::timed_out);
	REQUIRE(ledger.requests_of(4).empty());
	REQUIRE(room.holder(4) == nobody);

	room.stop();
	REQUIRE(one.get() == acquire_status::cancelled);
	REQUIRE(three.get() == acquire_status::cancelled);
	REQUIRE(room.gate().issued() == 2);

	room.release_pair(0);
	room.release_pair(2);
	REQUIRE(room.gate().issued() == 0);
	REQUIRE(room.gate().peak() == 4);
	REQUIRE(ledger.violations() == 0);
}

TEST_CASE("Occupancy needs at least one permit", "[occupancy]") {
	using namespace philo;

	protocols::bounded_occupancy room;
	REQUIRE_THROWS_AS(room.start(1), configuration_error);
	REQUIRE_THROWS_AS(room.start(0), configuration_error);
	REQUIRE_NOTHROW(room.start(2));
	REQUIRE(room.gate().capacity() == 1);
}

TEST_CASE("Five philosophers dine with a bounded room", "[occupancy]") {
	using namespace philo;

	testing::ledger ledger{ 5 };
	protocols::bounded_occupancy room;
	room.set_listener(&ledger);

	table_config config;
	config.cycles = 100;
	config.hold = std::chrono::milliseconds(1);
	config.idle = std::chrono::milliseconds(0);

	table dinner{ room, config };
	dinner.start();
	REQUIRE(dinner.wait_for(std::chrono::seconds(30)));
	dinner.stop();
	REQUIRE_NOTHROW(dinner.join());

	INFO(ledger.first_violation());
	REQUIRE(ledger.violations() == 0);
	REQUIRE(room.gate().peak() <= 4);
	REQUIRE(room.gate().issued() == 0);
	REQUIRE(dinner.total_meals() == 500);
}
