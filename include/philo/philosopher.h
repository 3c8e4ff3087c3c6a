/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_PHILOSOPHER_H_
#define PHILO_PHILOSOPHER_H_

#include "protocol.h"
#include "errors.h"
#include "concurrent/semaphore.h"
#include "concurrent/thread.h"
#include "utils/common.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <random>
#include <string>

namespace philo {
	enum class phase {
		thinking,
		hungry,
		eating
	};

	inline const char* to_string(phase p) {
		switch (p) {
		case phase::thinking: return "thinking";
		case phase::hungry: return "hungry";
		case phase::eating: return "eating";
		}
		return "unknown";
	}

	/**
	 * Everything a dinner needs to know besides the protocol itself.
	 */
	struct table_config {
		size_t philosophers = 5;
		// how long a meal lasts
		std::chrono::milliseconds hold{ 10 };
		// how long a philosopher thinks between two meals
		std::chrono::milliseconds idle{ 10 };
		// meals per philosopher, 0 means until the table is stopped
		size_t cycles = 0;
		// upper bound of a random extra thinking time
		std::chrono::milliseconds jitter{ 0 };
		unsigned int seed = PHILO_RANDOM_SEED;

		void validate() const {
			if (philosophers < 2)
				throw configuration_error("a table needs at least 2 philosophers, got " + std::to_string(philosophers));
			if (hold.count() < 0 || idle.count() < 0 || jitter.count() < 0)
				throw configuration_error("meal, thinking and jitter durations cannot be negative");
		}
	};

	/**
	 * Observer of philosophers' phase changes, called from the philosophers' own threads.
	 */
	class phase_listener {
	public:
		virtual ~phase_listener() {}
		virtual void on_phase(actor_id id, phase p, size_t cycle) = 0;
	};

	/**
	 * Active philosopher: eats through the protocol, puts the forks down and thinks,
	 * over and over until the meal budget runs out or a stop is requested.
	 * A fatal error stops the whole protocol and is kept for whoever joins the philosopher.
	 */
	class philosopher : public concurrent::thread {
	public:
		philosopher(actor_id id, protocol& table, const table_config& config,
			phase_listener* listener = nullptr, concurrent::semaphore* finished = nullptr)
			: thread("philosopher #" + std::to_string(id)), id_(id), table_(table), config_(config),
			listener_(listener), finished_(finished), random_(config.seed + static_cast<unsigned int>(id)) {}

		~philosopher() {
			request_stop();
			join();
		}

		void run() override {
			dine();
		}

		// interrupts thinking and eating, a blocked acquisition is interrupted by the protocol's stop()
		void request_stop() {
			std::unique_lock<std::mutex> lock{ mutex_ };
			stop_requested_ = true;
			cond_.notify_all();
		}

		actor_id id() const { return id_; }
		phase current_phase() const { return phase_; }
		size_t meals() const { return meals_; }
		std::chrono::microseconds longest_wait() const { return std::chrono::microseconds(longest_wait_); }
	protected:
		// a fatal error stops everybody else at the table too
		void on_exit(std::exception_ptr failure) override {
			if (failure)
				table_.stop();
			if (finished_)
				finished_->signal();
		}
	private:
		void dine() {
			for (size_t cycle = 0; config_.cycles == 0 || cycle < config_.cycles; cycle++) {
				if (stopping())
					return;

				announce(phase::hungry, cycle);
				auto hungry_since = concurrent::clock::now();
				scoped_pair forks{ table_, id_ };
				if (!forks.owns()) {
#ifdef DEBUG_PHILOSOPHER
					DEBUG_WRITE("philosopher #%zu", "left the table, %s", id_, to_string(forks.status()));
#endif
					announce(phase::thinking, cycle);
					return;
				}
				record_wait(concurrent::clock::now() - hungry_since);

				announce(phase::eating, cycle);
				rest(config_.hold);
				forks.release();
				meals_++;

				announce(phase::thinking, cycle);
				rest(config_.idle + extra_thinking());
			}
		}

		void announce(phase p, size_t cycle) {
			phase_ = p;
#ifdef DEBUG_PHILOSOPHER
			DEBUG_WRITE("philosopher #%zu", "%s (cycle %zu)", id_, to_string(p), cycle);
#endif
			if (listener_)
				listener_->on_phase(id_, p, cycle);
		}

		void record_wait(concurrent::clock::duration waited) {
			long long micros = std::chrono::duration_cast<std::chrono::microseconds>(waited).count();
			if (micros > longest_wait_)
				longest_wait_ = micros;
		}

		std::chrono::milliseconds extra_thinking() {
			if (config_.jitter.count() == 0)
				return std::chrono::milliseconds(0);
			std::uniform_int_distribution<long long> distribution(0, config_.jitter.count());
			return std::chrono::milliseconds(distribution(random_));
		}

		// sleeps unless a stop is requested meanwhile
		void rest(std::chrono::milliseconds duration) {
			if (duration.count() == 0)
				return;
			std::unique_lock<std::mutex> lock{ mutex_ };
			cond_.wait_for(lock, duration, [this] { return stop_requested_; });
		}

		bool stopping() const {
			std::unique_lock<std::mutex> lock{ mutex_ };
			return stop_requested_;
		}

		actor_id id_;
		protocol& table_;
		table_config config_;
		phase_listener* listener_;
		concurrent::semaphore* finished_;
		std::mt19937 random_;

		std::atomic<phase> phase_{ phase::thinking };
		std::atomic<size_t> meals_{ 0 };
		std::atomic<long long> longest_wait_{ 0 };

		mutable std::mutex mutex_;
		std::condition_variable cond_;
		bool stop_requested_ = false;
	};
}

#endif //PHILO_PHILOSOPHER_H_
