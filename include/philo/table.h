/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_TABLE_H_
#define PHILO_TABLE_H_

#include "philosopher.h"
#include "protocol.h"
#include "concurrent/semaphore.h"
#include "utils/common.h"

#include <chrono>
#include <exception>
#include <memory>
#include <vector>

namespace philo {
	/**
	 * Seats config.philosophers philosophers around one protocol and runs the dinner.
	 *
	 *	table dinner{ waiter, config };
	 *	dinner.start();
	 *	dinner.wait_for(std::chrono::seconds(5));
	 *	dinner.stop();
	 *	dinner.join();
	 */
	class table {
	public:
		table(protocol& rules, const table_config& config, phase_listener* listener = nullptr)
			: protocol_(rules), config_(config), listener_(listener), finished_(0) {
			config_.validate();
		}

		~table() {
			stop();
			philosophers_.clear();
		}

		table(const table&) = delete;
		table& operator=(const table&) = delete;

		void start() {
			if (!philosophers_.empty())
				throw configuration_error("the dinner at this table has already started");
			protocol_.start(config_.philosophers);
			for (actor_id id = 0; id < config_.philosophers; id++)
				philosophers_.push_back(std::make_unique<philosopher>(id, protocol_, config_, listener_, &finished_));
			for (auto& p : philosophers_)
				p->start();
#ifdef DEBUG_PHILOSOPHER
			DEBUG_WRITE("table", "%zu philosophers seated, %s", config_.philosophers, protocol_.name());
#endif
		}

		/**
		 * Waits until every philosopher is done with the meal budget (or failed).
		 * Returns false if that did not happen in time, e.g. because the protocol deadlocked.
		 */
		template <class Rep, class Period>
		bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
			auto deadline = concurrent::deadline_after(timeout);
			while (done_ < philosophers_.size()) {
				if (finished_.wait_until(deadline) != acquire_status::acquired)
					return false;
				done_++;
			}
			return true;
		}

		void stop() {
			for (auto& p : philosophers_)
				p->request_stop();
			protocol_.stop();
		}

		/**
		 * Joins every philosopher and rethrows the first failure of a philosopher or of the protocol.
		 */
		void join() {
			for (auto& p : philosophers_)
				p->join();
			for (auto& p : philosophers_) {
				if (p->failure())
					std::rethrow_exception(p->failure());
			}
			if (protocol_.failure())
				std::rethrow_exception(protocol_.failure());
		}

		size_t size() const { return philosophers_.size(); }
		const philosopher& at(actor_id id) const { return *philosophers_.at(id); }
		size_t meals(actor_id id) const { return at(id).meals(); }
		std::chrono::microseconds longest_wait(actor_id id) const { return at(id).longest_wait(); }

		size_t total_meals() const {
			size_t total = 0;
			for (auto& p : philosophers_)
				total += p->meals();
			return total;
		}
	private:
		protocol& protocol_;
		table_config config_;
		phase_listener* listener_;
		concurrent::semaphore finished_;
		size_t done_ = 0;
		std::vector<std::unique_ptr<philosopher>> philosophers_;
	};
}

#endif //PHILO_TABLE_H_
