#include <catch2/catch.hpp>
#include <philo/table.h>
#include <philo/protocols/resource_hierarchy.h>
#include "support/ledger.h"

#include <atomic>
#include <chrono>

namespace philo {
	namespace testing {
		// puts the forks down wrongly once philosopher 1 has eaten a few times
		class clumsy_hierarchy : public protocols::resource_hierarchy {
		public:
			void release_pair(actor_id id) override {
				if (id == 1 && ++meals_ == 3)
					throw state_corruption("philosopher #1 dropped the forks");
				resource_hierarchy::release_pair(id);
			}
		private:
			std::atomic<size_t> meals_{ 0 };
		};
	}
}

TEST_CASE("Table seats everybody and counts meals", "[table]") {
	using namespace philo;

	protocols::resource_hierarchy forks;
	testing::phase_log log;
	table_config config;
	config.philosophers = 4;
	config.cycles = 5;
	config.hold = std::chrono::milliseconds(1);
	config.idle = std::chrono::milliseconds(1);

	table dinner{ forks, config, &log };
	REQUIRE(dinner.size() == 0);
	dinner.start();
	REQUIRE(dinner.size() == 4);
	REQUIRE_THROWS_AS(dinner.start(), configuration_error);

	REQUIRE(dinner.wait_for(std::chrono::seconds(10)));
	dinner.stop();
	dinner.join();

	REQUIRE(dinner.total_meals() == 20);
	REQUIRE(log.entries().size() == 4 * 5 * 3);
	for (actor_id id = 0; id < 4; id++)
		REQUIRE(dinner.at(id).meals() == 5);
}

TEST_CASE("Table refuses a bad configuration", "[table]") {
	using namespace philo;

	protocols::resource_hierarchy forks;
	table_config config;
	config.philosophers = 1;
	REQUIRE_THROWS_AS(table(forks, config), configuration_error);

	config.philosophers = 3;
	config.idle = std::chrono::milliseconds(-1);
	REQUIRE_THROWS_AS(table(forks, config), configuration_error);
}

TEST_CASE("Failure of one philosopher ends the dinner and is rethrown", "[table]") {
	using namespace philo;

	testing::clumsy_hierarchy forks;
	table_config config;
	config.philosophers = 3;
	config.hold = std::chrono::milliseconds(1);
	config.idle = std::chrono::milliseconds(1);

	table dinner{ forks, config };
	dinner.start();
	REQUIRE(dinner.wait_for(std::chrono::seconds(10)));
	REQUIRE(forks.stopped());
	REQUIRE(dinner.at(1).meals() == 2);
	REQUIRE(dinner.at(1).failure() != nullptr);
	REQUIRE_THROWS_AS(dinner.join(), state_corruption);
}
