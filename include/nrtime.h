//Copyright (c) 2016, 2017, 2018 Hitachi Vantara Corporation
//All Rights Reserved.
//
//   Licensed under the Apache License, Version 2.0 (the "License"); you may
//   not use this file except in compliance with the License. You may obtain
//   a copy of the License at
//
//         http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
//   WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
//   License for the specific language governing permissions and limitations
//   under the License.
//
//Authors: Allart Ian Vogelesang <ian.vogelesang@hitachivantara.com>
//
//Support:  "noderange" is not officially supported by Hitachi Vantara.
//          Contact one of the authors by email and as time permits, we'll help on a best efforts basis.
#pragma once

// Wall clock time with nanoseconds, for timestamping log lines.

#include <stdint.h>
#include <time.h>
#include <string>

class nrtime {

public:

	struct timespec t;

	nrtime();
	nrtime(const struct timespec& ts);
	nrtime(uint64_t seconds, uint64_t nanoseconds);

	bool operator==(const nrtime& rhs) const;
	bool operator!=(const nrtime& rhs) const;
	const nrtime operator- (const nrtime &rhs) const;

	std::string format_as_duration_HMMSSns() const;
	std::string format_as_datetime_with_ns() const;

	void setToNow();  // throws std::runtime_error if clock_gettime() fails
	void normalize(); // fix what may be an invalid representation after subtraction.
};

extern const nrtime nrtime_zero;
