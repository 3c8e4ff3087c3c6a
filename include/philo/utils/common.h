/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_UTILS_COMMON_H_
#define PHILO_UTILS_COMMON_H_

#ifndef DEBUG_STREAM
#define DEBUG_STREAM stdout
#endif

#ifndef PHILO_RANDOM_SEED
#define PHILO_RANDOM_SEED 836939
#endif

#include <memory>
#include <string>
#include <cstdio>
#include <mutex>

namespace philo {
	namespace utils {
		template<typename ... Args>
		std::unique_ptr<char[]> cstring_format(const char * format, Args ... args) {
			size_t size = snprintf(nullptr, 0, format, args ...) + 1; // Extra space for '\0'
			std::unique_ptr<char[]> buf(new char[size]);
			snprintf(buf.get(), size, format, args ...);
			return buf;
		}

		// every line written to DEBUG_STREAM goes out while holding this
		inline std::mutex& stream_mutex() {
			static std::mutex mutex;
			return mutex;
		}
	}
}

template <typename... Args>
inline void DEBUG_WRITE(const char* name, const char* message, Args... args) {
	auto preformat = philo::utils::cstring_format("-- %s: %s --\n", name, message);
	auto debug_string = philo::utils::cstring_format(preformat.get(), args...);
	std::lock_guard<std::mutex> lock{ philo::utils::stream_mutex() };
	fputs(debug_string.get(), DEBUG_STREAM);
}
inline void DEBUG_WRITE(const char* name, const char* message) {
	std::lock_guard<std::mutex> lock{ philo::utils::stream_mutex() };
	fprintf(DEBUG_STREAM, "-- %s: %s --\n", name, message);
}

#endif //PHILO_UTILS_COMMON_H_
