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
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string.h>
#include <errno.h>

#include "nrtime.h"

const nrtime nrtime_zero(0,0);

nrtime::nrtime() { t.tv_sec = 0; t.tv_nsec = 0; }

nrtime::nrtime(const struct timespec& ts) : t(ts) {}

nrtime::nrtime(uint64_t seconds, uint64_t nanoseconds)
{
	t.tv_sec  = seconds;
	t.tv_nsec = nanoseconds;
	normalize();
}

bool nrtime::operator==(const nrtime& rhs) const { return t.tv_sec == rhs.t.tv_sec && t.tv_nsec == rhs.t.tv_nsec; }

bool nrtime::operator!=(const nrtime& rhs) const { return !((*this) == rhs); }

void nrtime::normalize()
{
	while (t.tv_nsec >= 1000000000) { t.tv_sec += 1; t.tv_nsec -= 1000000000; }

	while (t.tv_nsec < 0)           { t.tv_sec -= 1; t.tv_nsec += 1000000000; }

	// seconds and nanoseconds must agree in sign
	if (t.tv_sec < 0 && t.tv_nsec > 0) { t.tv_sec += 1; t.tv_nsec -= 1000000000; }
}

const nrtime nrtime::operator- (const nrtime &rhs) const {

	nrtime result(*this);

	result.t.tv_sec -= rhs.t.tv_sec;
	result.t.tv_nsec -= rhs.t.tv_nsec;

    result.normalize();

    return result;
}

std::string nrtime::format_as_datetime_with_ns() const {
	// 2012-04-15 HH:MM:SS - 19 characters plus terminating null makes buffer size 20
	char timebuffer[20];
	struct tm broken_down;
	localtime_r(&t.tv_sec, &broken_down);
	strftime(timebuffer,20,"%Y-%m-%d %H:%M:%S",&broken_down);
	std::ostringstream os;
	os << timebuffer << '.' << std::setw(9) << std::setfill ('0') << t.tv_nsec;
	return os.str();
}

std::string nrtime::format_as_duration_HMMSSns() const
{
    std::ostringstream o;

    nrtime it;

    if (t.tv_sec < 0 || t.tv_nsec < 0)
    {
        o << "-";
        it.t.tv_sec = 0 - t.tv_sec;
        it.t.tv_nsec = 0 - t.tv_nsec;
    }
    else
    {
        it = (*this);
    }

	uint64_t hours, minutes, seconds;

	seconds = it.t.tv_sec;
	hours = seconds / 3600;
	seconds -= hours * 3600;
	minutes = seconds / 60;
	seconds -= minutes * 60;

	o << hours << ':' << std::setw(2) << std::setfill('0') << minutes
	  << ':' << std::setw(2) << std::setfill('0') << seconds
	  << '.' << std::setw(9) << std::setfill('0') << it.t.tv_nsec;

	return o.str();
}

void nrtime::setToNow()
{
	if (0 != clock_gettime(CLOCK_REALTIME,&t))
	{
	    std::ostringstream o;
	    o << "<Error> internal programming error - nrtime::setToNow() - clock_gettime(CLOCK_REALTIME,) failed errno " << errno << " - " << strerror(errno) << "." << std::endl;
	    throw std::runtime_error(o.str());
	}
}
