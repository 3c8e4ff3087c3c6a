/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_CONCURRENT_H_
#define PHILO_CONCURRENT_H_

#include "concurrent/semaphore.h"
#include "concurrent/channel.h"
#include "concurrent/thread.h"

#endif // !PHILO_CONCURRENT_H_
