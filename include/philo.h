/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_H_
#define PHILO_H_

#include "philo/utils.h"
#include "philo/concurrent.h"
#include "philo/protocols.h"
#include "philo/table.h"

#endif // PHILO_H_
