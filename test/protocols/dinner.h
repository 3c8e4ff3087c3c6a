#include <catch2/catch.hpp>
#include <philo.h>
#include "../support/ledger.h"

#include <chrono>

TEMPLATE_TEST_CASE("Every philosopher eats and no fork is ever shared", "[hierarchy][arbitrator][occupancy][chandy-misra][table]",
	philo::protocols::resource_hierarchy, philo::protocols::arbitrator,
	philo::protocols::bounded_occupancy, philo::protocols::chandy_misra) {
	using namespace philo;

	size_t n = GENERATE(2, 3, 5, 8);

	testing::ledger ledger{ n };
	TestType rules;
	rules.set_listener(&ledger);

	table_config config;
	config.philosophers = n;
	config.cycles = 40;
	config.hold = std::chrono::milliseconds(1);
	config.idle = std::chrono::milliseconds(0);
	config.jitter = std::chrono::milliseconds(1);

	table dinner{ rules, config };
	dinner.start();
	INFO(rules.name() << " with " << n << " philosophers");
	REQUIRE(dinner.wait_for(std::chrono::seconds(60)));
	dinner.stop();
	REQUIRE_NOTHROW(dinner.join());

	INFO(ledger.first_violation());
	REQUIRE(ledger.violations() == 0);
	REQUIRE(ledger.acquisitions() == 2 * 40 * n);
	for (actor_id id = 0; id < n; id++)
		REQUIRE(dinner.meals(id) == 40);
}

TEMPLATE_TEST_CASE("Stopping an endless dinner wakes everybody up", "[hierarchy][arbitrator][occupancy][chandy-misra][table]",
	philo::protocols::resource_hierarchy, philo::protocols::arbitrator,
	philo::protocols::bounded_occupancy, philo::protocols::chandy_misra) {
	using namespace philo;

	TestType rules;
	table_config config;
	config.philosophers = 5;
	config.hold = std::chrono::milliseconds(2);
	config.idle = std::chrono::milliseconds(1);

	table dinner{ rules, config };
	dinner.start();
	REQUIRE_FALSE(dinner.wait_for(std::chrono::milliseconds(200)));
	dinner.stop();
	REQUIRE(dinner.wait_for(std::chrono::seconds(10)));
	REQUIRE_NOTHROW(dinner.join());

	REQUIRE(rules.stopped());
	REQUIRE(dinner.total_meals() > 0);
	for (actor_id id = 0; id < 5; id++)
		REQUIRE(dinner.at(id).current_phase() == phase::thinking);
}
