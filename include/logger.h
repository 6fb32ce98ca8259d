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

#include <mutex>
#include <string>

#include "nrtime.h"

struct logger
{
// variables
    std::mutex writing;
    std::string logfilename {"<none>"};  // "<none>" means standard output
    nrtime previous_line_time {};        // zero until the first line is logged
    unsigned long lines_logged {0};

// methods
    logger() {};
    logger(const std::string& s) : logfilename(s) {};

    bool to_standard_output() const {return logfilename == "<none>";}
};

std::string log_line(const nrtime& now, const nrtime& previous, const std::string& text);
    // "2018-04-15 13:45:06.123456789 +0:00:01.000000000 text" with one trailing newline.
    // The elapsed time is zero when previous is zero.

void log(logger&, const std::string&);
    // Appends one log_line() to the log file, or writes it to standard output.
    // Throws std::runtime_error if the log file can't be opened or written.
