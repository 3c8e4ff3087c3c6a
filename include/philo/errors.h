/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_ERRORS_H_
#define PHILO_ERRORS_H_

#include <stdexcept>
#include <string>

namespace philo {
	/**
	 * Thrown when a protocol or a table is set up with values it cannot run with,
	 * e.g. fewer than two philosophers.
	 */
	class configuration_error : public std::invalid_argument {
	public:
		explicit configuration_error(const std::string& what) : std::invalid_argument(what) {}
	};

	/**
	 * Thrown when a fork is observed in an impossible state: held by two philosophers,
	 * released by someone who does not hold it, requested from someone who does not have it.
	 * It is never recovered from, the run that produced it has to be torn down.
	 */
	class state_corruption : public std::logic_error {
	public:
		explicit state_corruption(const std::string& what) : std::logic_error(what) {}
	};

	/**
	 * Outcome of a blocking acquisition. Anything but acquired means nothing is held.
	 */
	enum class acquire_status {
		acquired,
		timed_out,
		cancelled
	};

	inline const char* to_string(acquire_status status) {
		switch (status) {
		case acquire_status::acquired: return "acquired";
		case acquire_status::timed_out: return "timed out";
		case acquire_status::cancelled: return "cancelled";
		}
		return "unknown";
	}
}

#endif //PHILO_ERRORS_H_
