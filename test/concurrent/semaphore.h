#include <catch2/catch.hpp>
#include <philo/concurrent/semaphore.h>

#include <chrono>
#include <future>
#include <thread>

TEST_CASE("Semaphore hands out its permits", "[semaphore]") {
	using philo::concurrent::semaphore;
	using philo::acquire_status;

	semaphore sem{ 2 };
	REQUIRE(sem.try_wait());
	REQUIRE(sem.try_wait());
	REQUIRE_FALSE(sem.try_wait());
	REQUIRE(sem.value() == 0);

	sem.signal();
	REQUIRE(sem.wait_for(std::chrono::milliseconds(10)) == acquire_status::acquired);
	REQUIRE(sem.value() == 0);
}

TEST_CASE("Semaphore wait times out", "[semaphore]") {
	using philo::concurrent::semaphore;
	using philo::acquire_status;

	semaphore sem;
	auto before = std::chrono::steady_clock::now();
	REQUIRE(sem.wait_for(std::chrono::milliseconds(50)) == acquire_status::timed_out);
	REQUIRE(std::chrono::steady_clock::now() - before >= std::chrono::milliseconds(50));
	REQUIRE(sem.value() == 0);
}

TEST_CASE("Signal wakes a blocked waiter", "[semaphore]") {
	using philo::concurrent::semaphore;

	semaphore sem;
	auto waiter = std::async(std::launch::async, [&sem] { return sem.wait(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(20));
	REQUIRE(waiter.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout);

	sem.signal();
	REQUIRE(waiter.get());
	REQUIRE(sem.value() == 0);
}

TEST_CASE("Cancel releases every waiter until reset", "[semaphore]") {
	using philo::concurrent::semaphore;
	using philo::acquire_status;

	semaphore sem;
	auto first = std::async(std::launch::async, [&sem] { return sem.wait_until(philo::concurrent::forever()); });
	auto second = std::async(std::launch::async, [&sem] { return sem.wait_for(std::chrono::seconds(10)); });
	std::this_thread::sleep_for(std::chrono::milliseconds(20));

	sem.cancel();
	REQUIRE(first.get() == acquire_status::cancelled);
	REQUIRE(second.get() == acquire_status::cancelled);
	REQUIRE(sem.cancelled());

	SECTION("signal is still legal but does not let anybody through") {
		sem.signal();
		REQUIRE_FALSE(sem.try_wait());
		REQUIRE_FALSE(sem.wait());
	}

	SECTION("reset makes it usable again") {
		sem.reset(1);
		REQUIRE_FALSE(sem.cancelled());
		REQUIRE(sem.wait());
		REQUIRE_FALSE(sem.try_wait());
	}
}
