#include <catch2/catch.hpp>
#include <philo/philosopher.h>
#include <philo/protocols/resource_hierarchy.h>
#include "support/ledger.h"

#include <chrono>
#include <thread>
#include <vector>

TEST_CASE("Philosopher thinks, gets hungry and eats in turn", "[philosopher]") {
	using namespace philo;

	protocols::resource_hierarchy forks;
	forks.start(2);
	testing::phase_log log;
	concurrent::semaphore finished;

	table_config config;
	config.philosophers = 2;
	config.cycles = 3;
	config.hold = std::chrono::milliseconds(1);
	config.idle = std::chrono::milliseconds(1);

	philosopher plato{ 1, forks, config, &log, &finished };
	REQUIRE(plato.id() == 1);
	REQUIRE(plato.current_phase() == phase::thinking);
	plato.start();
	REQUIRE(finished.wait_for(std::chrono::seconds(5)) == acquire_status::acquired);
	plato.join();

	REQUIRE(plato.meals() == 3);
	REQUIRE(plato.failure() == nullptr);
	REQUIRE(plato.current_phase() == phase::thinking);
	REQUIRE(log.phases_of(1) == std::vector<phase>{
		phase::hungry, phase::eating, phase::thinking,
		phase::hungry, phase::eating, phase::thinking,
		phase::hungry, phase::eating, phase::thinking });
	REQUIRE(forks.holder(0) == nobody);
	REQUIRE(forks.holder(1) == nobody);
}

TEST_CASE("Philosopher leaves when the protocol stops", "[philosopher]") {
	using namespace philo;

	protocols::resource_hierarchy forks;
	forks.start(3);
	REQUIRE(forks.acquire_pair(0));

	concurrent::semaphore finished;
	table_config config;
	config.philosophers = 3;

	// philosopher 1 needs fork 1 which stays with philosopher 0
	philosopher aristotle{ 1, forks, config, nullptr, &finished };
	aristotle.start();
	REQUIRE(finished.wait_for(std::chrono::milliseconds(50)) == acquire_status::timed_out);
	REQUIRE(aristotle.current_phase() == phase::hungry);

	forks.stop();
	REQUIRE(finished.wait_for(std::chrono::seconds(5)) == acquire_status::acquired);
	REQUIRE(aristotle.meals() == 0);
	REQUIRE(aristotle.current_phase() == phase::thinking);
	REQUIRE(aristotle.failure() == nullptr);
	forks.release_pair(0);
}

TEST_CASE("Philosopher with a wait budget records the longest wait", "[philosopher]") {
	using namespace philo;

	protocols::resource_hierarchy forks;
	forks.start(2);
	REQUIRE(forks.acquire_pair(0));

	concurrent::semaphore finished;
	table_config config;
	config.philosophers = 2;
	config.cycles = 1;

	philosopher socrates{ 1, forks, config, nullptr, &finished };
	socrates.start();
	std::this_thread::sleep_for(std::chrono::milliseconds(30));
	forks.release_pair(0);

	REQUIRE(finished.wait_for(std::chrono::seconds(5)) == acquire_status::acquired);
	REQUIRE(socrates.meals() == 1);
	REQUIRE(socrates.longest_wait() >= std::chrono::milliseconds(30));
}

TEST_CASE("Table configuration is validated", "[philosopher]") {
	using namespace philo;

	table_config config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.philosophers == 5);
	REQUIRE(config.seed == PHILO_RANDOM_SEED);

	SECTION("a single philosopher") {
		config.philosophers = 1;
		REQUIRE_THROWS_AS(config.validate(), configuration_error);
	}
	SECTION("negative durations") {
		config.hold = std::chrono::milliseconds(-1);
		REQUIRE_THROWS_AS(config.validate(), configuration_error);
	}
	SECTION("negative jitter") {
		config.jitter = std::chrono::milliseconds(-5);
		REQUIRE_THROWS_AS(config.validate(), configuration_error);
	}
}
